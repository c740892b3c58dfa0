#include "server.hpp"

#include "logging.hpp"
#include "session.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>

#include <exception>

namespace oftee {

Server::Server(boost::asio::io_context& io,
               AppConfig config,
               TeeMultiplexerPtr shared_tee,
               std::shared_ptr<DeviceDirectory> directory,
               MetricsPtr metrics)
    : acceptor_(io, tcp::endpoint(boost::asio::ip::make_address(config.listener.address), config.listener.port)),
      config_(std::move(config)),
      shared_tee_(std::move(shared_tee)),
      directory_(std::move(directory)),
      metrics_(metrics ? std::move(metrics) : make_metrics()) {
    if (config_.share_connections && !shared_tee_) {
        shared_tee_ = std::make_shared<TeeMultiplexer>(std::vector<Endpoint>{});
    }
    log_info("server") << "Listening for devices on " << config_.listener.address << ":" << bound_port();
    log_info("server") << "Proxying to controller " << config_.controller.host << ":" << config_.controller.port;
    for (const auto& spec : config_.tee) {
        log_info("server") << "Tee endpoint '" << spec << "'";
    }
    log_info("server") << "Tee connections are " << (config_.share_connections ? "shared" : "dedicated per device");
}

void Server::start() {
    do_accept();
}

uint16_t Server::bound_port() const {
    return acceptor_.local_endpoint().port();
}

void Server::do_accept() {
    acceptor_.async_accept([this](auto ec, auto socket) {
        if (ec) {
            log_error("server") << "Error while accepting connection: " << ec.message();
            do_accept();
            return;
        }

        boost::system::error_code ep_ec;
        auto remote = socket.remote_endpoint(ep_ec);
        if (!ep_ec) {
            log_debug("server") << "Received connection: " << remote.address().to_string() << ":" << remote.port();
        }

        if (config_.share_connections) {
            std::make_shared<Session>(std::move(socket), config_.controller, shared_tee_, false,
                                      metrics_, directory_)->start();
        } else {
            boost::asio::co_spawn(
                acceptor_.get_executor(),
                [this, s = std::move(socket)]() mutable { return serve_dedicated(std::move(s)); },
                boost::asio::detached);
        }
        do_accept();
    });
}

boost::asio::awaitable<void> Server::serve_dedicated(tcp::socket socket) {
    TeeMultiplexerPtr tee;
    std::string failure;
    try {
        tee = co_await open_endpoints(config_.tee);
    } catch (const std::exception& ex) {
        failure = ex.what();
    }

    if (!tee) {
        log_error("server") << "Unable to establish non-shared outbound endpoint connections: " << failure;
        boost::system::error_code ignored;
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
        co_return;
    }

    std::make_shared<Session>(std::move(socket), config_.controller, std::move(tee), true,
                              metrics_, directory_)->start();
}

} // namespace oftee
