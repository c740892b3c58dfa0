#include "transport.hpp"

#include "logging.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <istream>
#include <sstream>

namespace oftee {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;

QueuedTransport::QueuedTransport(Strand strand)
    : strand_(std::move(strand)) {}

awaitable<boost::system::error_code> QueuedTransport::write(SharedBytes message) {
    auto self = shared_from_this();
    co_return co_await boost::asio::co_spawn(
        strand_, [self, message = std::move(message)]() { return self->write_in_turn(message); }, use_awaitable);
}

awaitable<boost::system::error_code> QueuedTransport::write_in_turn(SharedBytes message) {
    if (busy_) {
        // The writer ahead of us cancels the timer when it hands over.
        auto turn = std::make_shared<boost::asio::steady_timer>(strand_, boost::asio::steady_timer::time_point::max());
        waiting_.push_back(turn);
        boost::system::error_code ignored;
        co_await turn->async_wait(redirect_error(use_awaitable, ignored));
    }
    busy_ = true;

    auto ec = co_await deliver(*message);
    if (ec) {
        on_failure(ec);
    }

    if (waiting_.empty()) {
        busy_ = false;
    } else {
        auto next = std::move(waiting_.front());
        waiting_.pop_front();
        next->cancel();
    }
    co_return ec;
}

void QueuedTransport::on_failure(const boost::system::error_code& ec) {
    log_error("transport") << "Write to " << describe() << " failed: " << ec.message();
}

TcpTransport::TcpTransport(std::shared_ptr<tcp::socket> socket, Strand strand, std::string label)
    : QueuedTransport(std::move(strand)),
      socket_(std::move(socket)),
      label_(std::move(label)) {}

awaitable<std::shared_ptr<TcpTransport>> TcpTransport::connect(Destination destination) {
    auto executor = co_await boost::asio::this_coro::executor;
    tcp::resolver resolver(executor);
    auto endpoints = co_await resolver.async_resolve(destination.host, std::to_string(destination.port), use_awaitable);
    auto socket = std::make_shared<tcp::socket>(executor);
    co_await boost::asio::async_connect(*socket, endpoints, use_awaitable);
    co_return std::make_shared<TcpTransport>(std::move(socket), boost::asio::make_strand(executor),
                                             oftee::describe(destination));
}

void TcpTransport::close() {
    auto self = std::static_pointer_cast<TcpTransport>(shared_from_this());
    boost::asio::post(strand_, [self]() {
        boost::system::error_code ignored;
        if (self->socket_->is_open()) {
            self->socket_->shutdown(tcp::socket::shutdown_both, ignored);
            self->socket_->close(ignored);
        }
    });
}

awaitable<boost::system::error_code> TcpTransport::deliver(const Bytes& message) {
    boost::system::error_code ec;
    co_await boost::asio::async_write(*socket_, boost::asio::buffer(message), redirect_error(use_awaitable, ec));
    co_return ec;
}

HttpTransport::HttpTransport(Strand strand, Destination destination)
    : QueuedTransport(std::move(strand)),
      destination_(std::move(destination)) {}

std::string HttpTransport::request_head(std::size_t body_size) const {
    std::ostringstream oss;
    oss << "POST " << destination_.target << " HTTP/1.1\r\n"
        << "Host: " << destination_.host;
    if (destination_.port != 80) oss << ":" << destination_.port;
    oss << "\r\n"
        << "Content-Type: application/octet-stream\r\n"
        << "Content-Length: " << body_size << "\r\n"
        << "Connection: close\r\n\r\n";
    return oss.str();
}

awaitable<boost::system::error_code> HttpTransport::deliver(const Bytes& message) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::system::error_code ec;

    tcp::resolver resolver(executor);
    auto endpoints = co_await resolver.async_resolve(destination_.host, std::to_string(destination_.port),
                                                     redirect_error(use_awaitable, ec));
    if (ec) co_return ec;

    tcp::socket socket(executor);
    co_await boost::asio::async_connect(socket, endpoints, redirect_error(use_awaitable, ec));
    if (ec) co_return ec;

    const auto head = request_head(message.size());
    std::array<boost::asio::const_buffer, 2> buffers = {
        boost::asio::buffer(head),
        boost::asio::buffer(message)
    };
    co_await boost::asio::async_write(socket, buffers, redirect_error(use_awaitable, ec));
    if (ec) co_return ec;

    boost::asio::streambuf response;
    co_await boost::asio::async_read_until(socket, response, "\r\n", redirect_error(use_awaitable, ec));
    if (ec) co_return ec;

    std::istream status_line(&response);
    std::string http_version;
    unsigned int status = 0;
    status_line >> http_version >> status;

    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);

    if (status < 200 || status >= 300) {
        log_warn("tee") << "POST to " << describe() << " answered with status " << status;
        co_return make_error_code(boost::system::errc::protocol_error);
    }
    log_debug("tee") << "POST to " << describe() << " delivered " << message.size() << " bytes";
    co_return boost::system::error_code{};
}

} // namespace oftee
