#pragma once

#include "endpoint_spec.hpp"
#include "openflow.hpp"

#include <deque>
#include <memory>
#include <string>

#include <utility>

#include <boost/asio.hpp>

namespace oftee {

// A destination bytes can be written to. write() completes once the whole
// message has been handed to the destination or has failed; failures are
// logged and never retried.
class Transport {
public:
    virtual ~Transport() = default;
    virtual boost::asio::awaitable<boost::system::error_code> write(SharedBytes message) = 0;
    virtual void close() = 0;
    virtual std::string describe() const = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

// Serializes deliveries on a strand: a message is delivered in full before the
// next one is started, whichever coroutine called write(). Writers that find a
// delivery in progress wait in FIFO order, so the backlog never exceeds the
// number of suspended writers.
class QueuedTransport : public Transport, public std::enable_shared_from_this<QueuedTransport> {
public:
    using Strand = boost::asio::strand<boost::asio::any_io_executor>;

    boost::asio::awaitable<boost::system::error_code> write(SharedBytes message) override;

protected:
    explicit QueuedTransport(Strand strand);

    virtual boost::asio::awaitable<boost::system::error_code> deliver(const Bytes& message) = 0;
    virtual void on_failure(const boost::system::error_code& ec);

    Strand strand_;

private:
    using Turn = std::shared_ptr<boost::asio::steady_timer>;

    // Runs on strand_.
    boost::asio::awaitable<boost::system::error_code> write_in_turn(SharedBytes message);

    std::deque<Turn> waiting_;
    bool busy_ = false;
};

// Writes messages to a connected TCP socket.
class TcpTransport : public QueuedTransport {
public:
    using tcp = boost::asio::ip::tcp;

    TcpTransport(std::shared_ptr<tcp::socket> socket, Strand strand, std::string label);

    // Resolves and connects to `destination`. Throws boost::system::system_error.
    static boost::asio::awaitable<std::shared_ptr<TcpTransport>> connect(Destination destination);

    void close() override;
    std::string describe() const override { return label_; }

protected:
    boost::asio::awaitable<boost::system::error_code> deliver(const Bytes& message) override;

private:
    std::shared_ptr<tcp::socket> socket_;
    std::string label_;
};

// Delivers every message as the body of its own HTTP/1.1 POST request.
class HttpTransport : public QueuedTransport {
public:
    HttpTransport(Strand strand, Destination destination);

    void close() override {}
    std::string describe() const override { return oftee::describe(destination_); }

protected:
    boost::asio::awaitable<boost::system::error_code> deliver(const Bytes& message) override;

private:
    std::string request_head(std::size_t body_size) const;

    Destination destination_;
};

} // namespace oftee
