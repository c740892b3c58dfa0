#pragma once

#include "criteria.hpp"
#include "endpoint_spec.hpp"
#include "openflow.hpp"
#include "transport.hpp"

#include <memory>
#include <string>
#include <vector>

#include <utility>

#include <boost/asio.hpp>

namespace oftee {

struct Endpoint {
    EndpointSpec spec;
    TransportPtr transport;
};

struct TeeResult {
    std::size_t selected = 0;
    std::size_t failed = 0;
};

// Ordered set of tee endpoints. Read-only once built, so it can be shared by
// every session; writes are serialized by the transports themselves.
class TeeMultiplexer {
public:
    explicit TeeMultiplexer(std::vector<Endpoint> endpoints);

    // Writes `message` to every endpoint whose rule matches `state`, in
    // registration order, waiting for each write before starting the next. A
    // failed endpoint is counted and skipped; it never stops the others.
    boost::asio::awaitable<TeeResult> conditional_write(SharedBytes message, Criteria state) const;

    const std::vector<Endpoint>& endpoints() const { return endpoints_; }
    std::size_t size() const { return endpoints_.size(); }

    void close();

private:
    std::vector<Endpoint> endpoints_;
};

using TeeMultiplexerPtr = std::shared_ptr<TeeMultiplexer>;

// Parse every non-empty specification and connect its transport. Throws
// ConfigError if a specification is invalid or a TCP endpoint is unreachable;
// endpoints already connected are closed in that case.
boost::asio::awaitable<TeeMultiplexerPtr> open_endpoints(std::vector<std::string> specs);

// Runs open_endpoints to completion on `io` before the server starts. `io` must
// have no other pending work.
TeeMultiplexerPtr open_endpoints_blocking(boost::asio::io_context& io, const std::vector<std::string>& specs);

} // namespace oftee
