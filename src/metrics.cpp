#include "metrics.hpp"

#include "logging.hpp"

#include <boost/asio/write.hpp>

#include <sstream>

namespace oftee {

MetricsPtr make_metrics() {
    return std::make_shared<MetricsRegistry>();
}

std::string render_metrics(const MetricsRegistry& metrics) {
    std::ostringstream os;
    os << "oftee_total_connections " << metrics.total_connections.load() << "\n";
    os << "oftee_active_sessions " << metrics.active_sessions.load() << "\n";
    os << "oftee_messages_upstream " << metrics.messages_upstream.load() << "\n";
    os << "oftee_packet_ins " << metrics.packet_ins.load() << "\n";
    os << "oftee_tee_writes " << metrics.tee_writes.load() << "\n";
    os << "oftee_tee_failures " << metrics.tee_failures.load() << "\n";
    os << "oftee_decode_failures " << metrics.decode_failures.load() << "\n";
    os << "oftee_bytes_upstream " << metrics.bytes_upstream.load() << "\n";
    os << "oftee_bytes_downstream " << metrics.bytes_downstream.load() << "\n";
    return os.str();
}

MetricsServer::MetricsServer(boost::asio::io_context& io, MetricsPtr metrics, uint16_t port)
    : acceptor_(io, tcp::endpoint(tcp::v4(), port)),
      metrics_(std::move(metrics)) {
    log_info("metrics") << "Exposing metrics on 0.0.0.0:" << bound_port();
}

void MetricsServer::start() {
    do_accept();
}

uint16_t MetricsServer::bound_port() const {
    return acceptor_.local_endpoint().port();
}

void MetricsServer::do_accept() {
    acceptor_.async_accept([this](auto ec, auto socket) {
        if (!ec) {
            serve_connection(std::move(socket));
        } else {
            log_warn("metrics") << "Accept error: " << ec.message();
        }
        do_accept();
    });
}

void MetricsServer::serve_connection(tcp::socket socket) {
    // The socket must outlive the async write.
    auto socket_ptr = std::make_shared<tcp::socket>(std::move(socket));

    const auto body = render_metrics(*metrics_);
    std::ostringstream oss;
    oss << "HTTP/1.1 200 OK\r\n"
        << "Content-Type: text/plain; version=0.0.4\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << body;
    auto buffer = std::make_shared<std::string>(oss.str());
    boost::asio::async_write(
        *socket_ptr,
        boost::asio::buffer(*buffer),
        [buffer, socket_ptr](auto, auto) mutable {
            boost::system::error_code ignored;
            socket_ptr->shutdown(tcp::socket::shutdown_both, ignored);
            socket_ptr->close(ignored);
        });
}

} // namespace oftee
