#pragma once

#include "config.hpp"
#include "device_directory.hpp"
#include "metrics.hpp"
#include "openflow.hpp"
#include "tee.hpp"
#include "transport.hpp"

#include <array>
#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include <utility>

#include <boost/asio.hpp>

namespace oftee {

// One device connection. Messages from the device are re-framed and forwarded
// to the controller in arrival order; Packet-In messages are additionally teed
// to the endpoints whose rule matches the EtherType of the carried frame.
// Controller traffic is copied back to the device unmodified.
class Session : public Injector, public std::enable_shared_from_this<Session> {
public:
    static constexpr std::size_t kReadChunkSize = 2048;

    Session(boost::asio::ip::tcp::socket device_socket,
            Backend controller,
            TeeMultiplexerPtr tee,
            bool owns_tee,
            MetricsPtr metrics,
            std::shared_ptr<DeviceDirectory> directory);

    void start();

    void inject(SharedBytes message) override;

private:
    using tcp = boost::asio::ip::tcp;
    using Strand = boost::asio::strand<boost::asio::any_io_executor>;
    using error_code = boost::system::error_code;

    boost::asio::awaitable<void> run();
    boost::asio::awaitable<void> relay_device_to_controller();
    boost::asio::awaitable<void> relay_controller_to_device();
    boost::asio::awaitable<error_code> forward_stream(const OfHeader& header);
    boost::asio::awaitable<error_code> forward_packet_in(const OfHeader& header);
    boost::asio::awaitable<error_code> read_chunked(std::uint8_t* out, std::size_t length);

    void note_datapath(std::uint64_t dpid);
    void close_sockets(const error_code& ec);

    Backend controller_;
    TeeMultiplexerPtr tee_;
    bool owns_tee_;
    MetricsPtr metrics_;
    std::shared_ptr<DeviceDirectory> directory_;

    Strand strand_;
    std::shared_ptr<tcp::socket> device_socket_;
    tcp::socket controller_socket_;
    std::shared_ptr<TcpTransport> device_writer_;

    std::array<std::uint8_t, kOfHeaderSize> header_bytes_{};
    std::array<std::uint8_t, kReadChunkSize> scratch_{};
    std::array<std::uint8_t, 4096> downstream_buffer_{};
    std::string remote_label_;
    std::optional<std::uint64_t> dpid_;
    std::atomic<bool> closed_{false};
};

} // namespace oftee
