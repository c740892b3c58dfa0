#include "tee.hpp"

#include "config.hpp"
#include "logging.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <exception>

namespace oftee {

TeeMultiplexer::TeeMultiplexer(std::vector<Endpoint> endpoints)
    : endpoints_(std::move(endpoints)) {}

boost::asio::awaitable<TeeResult> TeeMultiplexer::conditional_write(SharedBytes message, Criteria state) const {
    TeeResult result;
    for (const auto& ep : endpoints_) {
        if (!ep.spec.rule.match(state)) continue;
        ++result.selected;
        auto ec = co_await ep.transport->write(message);
        if (ec) ++result.failed;
    }
    co_return result;
}

void TeeMultiplexer::close() {
    for (auto& ep : endpoints_) {
        ep.transport->close();
    }
}

boost::asio::awaitable<TeeMultiplexerPtr> open_endpoints(std::vector<std::string> specs) {
    auto executor = co_await boost::asio::this_coro::executor;
    std::vector<Endpoint> endpoints;
    endpoints.reserve(specs.size());

    auto close_opened = [&endpoints]() {
        for (auto& ep : endpoints) ep.transport->close();
    };

    for (const auto& text : specs) {
        if (text.empty()) continue;

        Endpoint ep;
        try {
            ep.spec = parse_endpoint_spec(text);
        } catch (const ConfigError&) {
            close_opened();
            throw;
        }

        if (ep.spec.destination.scheme == Scheme::Http) {
            ep.transport = std::make_shared<HttpTransport>(boost::asio::make_strand(executor), ep.spec.destination);
        } else {
            std::string failure;
            try {
                ep.transport = co_await TcpTransport::connect(ep.spec.destination);
            } catch (const boost::system::system_error& ex) {
                failure = ex.code().message();
            }
            if (!failure.empty()) {
                log_error("endpoint") << "Unable to connect to outbound end point " << text << ": " << failure;
                close_opened();
                throw ConfigError("unable to connect to tee endpoint '" + text + "': " + failure);
            }
        }

        log_info("endpoint") << "Created outbound end point " << ep.transport->describe()
                             << " match=" << ep.spec.rule.describe();
        endpoints.push_back(std::move(ep));
    }

    co_return std::make_shared<TeeMultiplexer>(std::move(endpoints));
}

TeeMultiplexerPtr open_endpoints_blocking(boost::asio::io_context& io, const std::vector<std::string>& specs) {
    TeeMultiplexerPtr result;
    std::exception_ptr error;
    boost::asio::co_spawn(io, open_endpoints(specs),
        [&result, &error](std::exception_ptr ep, TeeMultiplexerPtr tee) {
            error = ep;
            result = std::move(tee);
        });
    io.run();
    io.restart();
    if (error) std::rethrow_exception(error);
    return result;
}

} // namespace oftee
