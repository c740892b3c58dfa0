#include "session.hpp"

#include "logging.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <memory>

namespace oftee {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;

Session::Session(boost::asio::ip::tcp::socket device_socket,
                 Backend controller,
                 TeeMultiplexerPtr tee,
                 bool owns_tee,
                 MetricsPtr metrics,
                 std::shared_ptr<DeviceDirectory> directory)
    : controller_(std::move(controller)),
      tee_(std::move(tee)),
      owns_tee_(owns_tee),
      metrics_(std::move(metrics)),
      directory_(std::move(directory)),
      strand_(boost::asio::make_strand(device_socket.get_executor())),
      device_socket_(std::make_shared<tcp::socket>(std::move(device_socket))),
      controller_socket_(device_socket_->get_executor()) {
    error_code ec;
    auto remote = device_socket_->remote_endpoint(ec);
    if (!ec) {
        remote_label_ = remote.address().to_string() + ":" + std::to_string(remote.port());
    } else {
        remote_label_ = "unknown-device";
    }
    device_writer_ = std::make_shared<TcpTransport>(device_socket_, strand_, remote_label_);

    if (metrics_) {
        metrics_->total_connections.fetch_add(1, std::memory_order_relaxed);
        metrics_->active_sessions.fetch_add(1, std::memory_order_relaxed);
    }
}

void Session::start() {
    auto self = shared_from_this();
    boost::asio::co_spawn(strand_, [self]() { return self->run(); }, boost::asio::detached);
}

void Session::inject(SharedBytes message) {
    log_debug("session") << "Injecting " << message->size() << " bytes to device " << remote_label_;
    auto self = shared_from_this();
    boost::asio::co_spawn(strand_, [self, message = std::move(message)]() -> awaitable<void> {
        auto ec = co_await self->device_writer_->write(message);
        if (ec) self->close_sockets(ec);
    }, boost::asio::detached);
}

awaitable<void> Session::run() {
    auto executor = co_await boost::asio::this_coro::executor;
    error_code ec;

    tcp::resolver resolver(executor);
    auto endpoints = co_await resolver.async_resolve(controller_.host, std::to_string(controller_.port),
                                                     redirect_error(use_awaitable, ec));
    if (!ec) {
        co_await boost::asio::async_connect(controller_socket_, endpoints, redirect_error(use_awaitable, ec));
    }
    if (ec) {
        log_error("session") << "Unable to connect to controller " << controller_.host << ":" << controller_.port
                             << " for " << remote_label_ << ": " << ec.message();
        close_sockets(ec);
        co_return;
    }

    log_info("session") << "New connection " << remote_label_ << " -> controller "
                        << controller_.host << ":" << controller_.port
                        << " tee endpoints=" << (tee_ ? tee_->size() : 0)
                        << (owns_tee_ ? " (dedicated)" : " (shared)");

    auto self = shared_from_this();
    boost::asio::co_spawn(strand_, [self]() { return self->relay_controller_to_device(); }, boost::asio::detached);
    co_await relay_device_to_controller();
}

awaitable<void> Session::relay_device_to_controller() {
    error_code ec;
    for (;;) {
        co_await boost::asio::async_read(*device_socket_, boost::asio::buffer(header_bytes_),
                                         redirect_error(use_awaitable, ec));
        if (ec) {
            log_debug("session") << "Failed to read OpenFlow message header from " << remote_label_
                                 << ": " << ec.message();
            break;
        }

        const auto header = OfHeader::decode(header_bytes_.data());
        if (header.length < kOfHeaderSize) {
            log_warn("session") << "Framing error from " << remote_label_ << ": declared length "
                                << header.length << " is shorter than the header";
            ec = make_error_code(boost::system::errc::bad_message);
            break;
        }

        if (header.is(OfType::PacketIn)) {
            ec = co_await forward_packet_in(header);
        } else {
            ec = co_await forward_stream(header);
        }
        if (ec) break;

        if (metrics_) {
            metrics_->messages_upstream.fetch_add(1, std::memory_order_relaxed);
            metrics_->bytes_upstream.fetch_add(header.length, std::memory_order_relaxed);
        }
    }
    close_sockets(ec);
}

awaitable<Session::error_code> Session::forward_stream(const OfHeader& header) {
    log_debug("session") << "SENDING " << type_name(header.type) << " to controller: version="
                         << static_cast<int>(header.version) << " xid=" << header.xid
                         << " length=" << header.length;
    error_code ec;
    co_await boost::asio::async_write(controller_socket_, boost::asio::buffer(header_bytes_),
                                      redirect_error(use_awaitable, ec));
    if (ec) co_return ec;

    std::size_t left = header.length - kOfHeaderSize;

    if (header.is(OfType::FeaturesReply) && left >= kDatapathIdSize) {
        co_await boost::asio::async_read(*device_socket_, boost::asio::buffer(scratch_.data(), kDatapathIdSize),
                                         redirect_error(use_awaitable, ec));
        if (ec) co_return ec;
        note_datapath(read_u64(scratch_.data()));
        co_await boost::asio::async_write(controller_socket_, boost::asio::buffer(scratch_.data(), kDatapathIdSize),
                                          redirect_error(use_awaitable, ec));
        if (ec) co_return ec;
        left -= kDatapathIdSize;
    }

    while (left > 0) {
        auto count = co_await device_socket_->async_read_some(
            boost::asio::buffer(scratch_.data(), std::min(left, scratch_.size())),
            redirect_error(use_awaitable, ec));
        if (ec) co_return ec;
        co_await boost::asio::async_write(controller_socket_, boost::asio::buffer(scratch_.data(), count),
                                          redirect_error(use_awaitable, ec));
        if (ec) co_return ec;
        left -= count;
    }
    co_return ec;
}

awaitable<Session::error_code> Session::forward_packet_in(const OfHeader& header) {
    log_debug("session") << "SENDING " << type_name(header.type) << " to controller and tee endpoints: version="
                         << static_cast<int>(header.version) << " xid=" << header.xid
                         << " length=" << header.length;

    const auto fixed = packet_in_fixed_size(header.version);
    if (header.length < kOfHeaderSize + fixed) {
        log_warn("session") << "Framing error from " << remote_label_ << ": Packet-In length "
                            << header.length << " cannot hold its " << fixed << " byte header";
        co_return make_error_code(boost::system::errc::bad_message);
    }

    auto message = std::make_shared<Bytes>(header.length);
    std::copy(header_bytes_.begin(), header_bytes_.end(), message->begin());

    error_code ec;
    co_await boost::asio::async_read(*device_socket_,
                                     boost::asio::buffer(message->data() + kOfHeaderSize, fixed),
                                     redirect_error(use_awaitable, ec));
    if (ec) {
        log_debug("session") << "Failed to read OpenFlow Packet-In header from " << remote_label_
                             << ": " << ec.message();
        co_return ec;
    }

    ec = co_await read_chunked(message->data() + kOfHeaderSize + fixed, header.length - kOfHeaderSize - fixed);
    if (ec) co_return ec;

    if (metrics_) metrics_->packet_ins.fetch_add(1, std::memory_order_relaxed);

    Criteria state;
    if (auto dl_type = extract_dl_type(*message)) {
        state = Criteria::with_dl_type(*dl_type);
    } else {
        log_debug("session") << "Unable to decode Ethernet frame in Packet-In xid=" << header.xid
                             << " from " << remote_label_ << ", only wildcard endpoints will receive it";
        if (metrics_) metrics_->decode_failures.fetch_add(1, std::memory_order_relaxed);
    }

    co_await boost::asio::async_write(controller_socket_, boost::asio::buffer(*message),
                                      redirect_error(use_awaitable, ec));
    if (ec) co_return ec;

    if (tee_) {
        // The next message is not read until every selected endpoint has taken
        // this one, so a slow endpoint slows the device down.
        const auto result = co_await tee_->conditional_write(message, state);
        if (metrics_) {
            metrics_->tee_writes.fetch_add(result.selected, std::memory_order_relaxed);
            metrics_->tee_failures.fetch_add(result.failed, std::memory_order_relaxed);
        }
    }
    co_return ec;
}

awaitable<Session::error_code> Session::read_chunked(std::uint8_t* out, std::size_t length) {
    error_code ec;
    while (length > 0) {
        auto count = co_await device_socket_->async_read_some(
            boost::asio::buffer(out, std::min(length, kReadChunkSize)),
            redirect_error(use_awaitable, ec));
        if (ec) co_return ec;
        out += count;
        length -= count;
    }
    co_return ec;
}

awaitable<void> Session::relay_controller_to_device() {
    error_code ec;
    for (;;) {
        auto count = co_await controller_socket_.async_read_some(boost::asio::buffer(downstream_buffer_),
                                                                 redirect_error(use_awaitable, ec));
        if (ec) break;
        ec = co_await device_writer_->write(std::make_shared<Bytes>(downstream_buffer_.begin(),
                                                                    downstream_buffer_.begin() + count));
        if (ec) break;
        if (metrics_) metrics_->bytes_downstream.fetch_add(count, std::memory_order_relaxed);
    }
    close_sockets(ec);
}

void Session::note_datapath(std::uint64_t dpid) {
    if (dpid_ && *dpid_ == dpid) return;
    log_info("session") << "Device " << remote_label_ << " is " << format_dpid(dpid);
    if (directory_) {
        if (dpid_) {
            directory_->publish(DeviceMapping{MappingAction::Delete, *dpid_, shared_from_this()});
        }
        directory_->publish(DeviceMapping{MappingAction::Add, dpid, shared_from_this()});
    }
    dpid_ = dpid;
}

void Session::close_sockets(const error_code& ec) {
    auto self = shared_from_this();
    boost::asio::post(strand_, [self, ec]() {
        if (self->closed_.exchange(true)) return;
        if (ec && ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
            log_info("session") << "Closing session " << self->remote_label_ << ": " << ec.message();
        } else {
            log_debug("session") << "Closing session " << self->remote_label_;
        }

        error_code ignored;
        if (self->device_socket_->is_open()) {
            self->device_socket_->shutdown(tcp::socket::shutdown_both, ignored);
            self->device_socket_->close(ignored);
        }
        if (self->controller_socket_.is_open()) {
            self->controller_socket_.shutdown(tcp::socket::shutdown_both, ignored);
            self->controller_socket_.close(ignored);
        }

        if (self->dpid_ && self->directory_) {
            self->directory_->publish(DeviceMapping{MappingAction::Delete, *self->dpid_, self});
        }
        if (self->owns_tee_ && self->tee_) {
            self->tee_->close();
        }

        if (self->metrics_) {
            self->metrics_->active_sessions.fetch_sub(1, std::memory_order_relaxed);
        }
    });
}

} // namespace oftee
