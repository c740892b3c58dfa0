#pragma once

#include "config.hpp"
#include "device_directory.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <utility>

#include <boost/asio.hpp>

namespace oftee {

struct ApiRequest {
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers; // names lower-cased
    std::string body;

    std::string header(const std::string& name) const;
};

struct ApiResponse {
    unsigned int status = 200;
    std::string content_type = "text/plain";
    std::string body;
};

// Parses the request line and header fields of an HTTP/1.x request head.
std::optional<ApiRequest> parse_request_head(std::string_view head);

// HTTP API over the device directory:
//   GET  /oftee         list known devices
//   POST /oftee/{dpid}  inject the request body into that device
class ApiServer {
public:
    static constexpr std::size_t kMaxHeadSize = 8192;
    static constexpr std::size_t kMaxBodySize = 65535;

    ApiServer(boost::asio::io_context& io, std::shared_ptr<DeviceDirectory> directory, const Listener& listener);
    void start();
    uint16_t bound_port() const;

    ApiResponse handle(const ApiRequest& request) const;

private:
    using tcp = boost::asio::ip::tcp;

    void do_accept();
    boost::asio::awaitable<void> serve_connection(tcp::socket socket);

    ApiResponse list_devices() const;
    ApiResponse packet_out(const ApiRequest& request, std::string_view dpid_text) const;

    tcp::acceptor acceptor_;
    std::shared_ptr<DeviceDirectory> directory_;
};

} // namespace oftee
