#pragma once

#include "config.hpp"
#include "device_directory.hpp"
#include "metrics.hpp"
#include "tee.hpp"

#include <memory>

#include <utility>

#include <boost/asio.hpp>

namespace oftee {

// Accepts device connections and starts one Session per connection. With
// shared connections every session tees through `shared_tee`; otherwise each
// connection resolves its own endpoints and is dropped if that fails.
class Server {
public:
    Server(boost::asio::io_context& io,
           AppConfig config,
           TeeMultiplexerPtr shared_tee,
           std::shared_ptr<DeviceDirectory> directory,
           MetricsPtr metrics);
    void start();
    uint16_t bound_port() const;
    MetricsPtr metrics() const { return metrics_; }

private:
    using tcp = boost::asio::ip::tcp;

    void do_accept();
    boost::asio::awaitable<void> serve_dedicated(tcp::socket socket);

    tcp::acceptor acceptor_;
    AppConfig config_;
    TeeMultiplexerPtr shared_tee_;
    std::shared_ptr<DeviceDirectory> directory_;
    MetricsPtr metrics_;
};

} // namespace oftee
