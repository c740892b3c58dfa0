#include "api_server.hpp"

#include "logging.hpp"

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace oftee {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;

namespace {

constexpr std::string_view kDevicesPath = "/oftee";
constexpr std::string_view kDevicePrefix = "/oftee/";
constexpr std::string_view kOctetStream = "application/octet-stream";

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

const char* reason_phrase(unsigned int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        default: return "Internal Server Error";
    }
}

ApiResponse error_response(unsigned int status, std::string message) {
    return ApiResponse{status, "text/plain; charset=utf-8", std::move(message) + "\n"};
}

std::optional<std::size_t> parse_size(std::string_view text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    errno = 0;
    const std::string value(text);
    const auto parsed = std::strtoull(value.c_str(), nullptr, 10);
    if (errno != 0) return std::nullopt;
    return static_cast<std::size_t>(parsed);
}

std::optional<std::uint64_t> parse_dpid(std::string_view text) {
    const std::string value(text);
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const auto parsed = std::strtoull(value.c_str(), &end, 0);
    if (errno != 0 || end != value.c_str() + value.size()) return std::nullopt;
    return static_cast<std::uint64_t>(parsed);
}

std::string serialize(const ApiResponse& response) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << " " << reason_phrase(response.status) << "\r\n"
        << "Content-Type: " << response.content_type << "\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << response.body;
    return oss.str();
}

} // namespace

std::string ApiRequest::header(const std::string& name) const {
    auto it = headers.find(lowercase(name));
    return it == headers.end() ? std::string{} : it->second;
}

std::optional<ApiRequest> parse_request_head(std::string_view head) {
    ApiRequest request;
    std::size_t pos = 0;
    bool first = true;
    while (pos < head.size()) {
        auto eol = head.find("\r\n", pos);
        auto line = head.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = eol == std::string_view::npos ? head.size() : eol + 2;
        if (line.empty()) break;

        if (first) {
            first = false;
            auto sp1 = line.find(' ');
            auto sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
            if (sp2 == std::string_view::npos) return std::nullopt;
            request.method = std::string(line.substr(0, sp1));
            request.target = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));
            auto version = line.substr(sp2 + 1);
            if (request.method.empty() || request.target.empty() || version.substr(0, 5) != "HTTP/") {
                return std::nullopt;
            }
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) return std::nullopt;
        request.headers[lowercase(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
    }
    if (first) return std::nullopt;
    return request;
}

ApiServer::ApiServer(boost::asio::io_context& io, std::shared_ptr<DeviceDirectory> directory, const Listener& listener)
    : acceptor_(io, tcp::endpoint(boost::asio::ip::make_address(listener.address), listener.port)),
      directory_(std::move(directory)) {
    log_info("api") << "Listening for REST API requests on " << listener.address << ":" << bound_port();
}

void ApiServer::start() {
    do_accept();
}

uint16_t ApiServer::bound_port() const {
    return acceptor_.local_endpoint().port();
}

void ApiServer::do_accept() {
    acceptor_.async_accept([this](auto ec, auto socket) {
        if (!ec) {
            boost::asio::co_spawn(
                acceptor_.get_executor(),
                [this, s = std::move(socket)]() mutable { return serve_connection(std::move(s)); },
                boost::asio::detached);
        } else {
            log_warn("api") << "Accept error: " << ec.message();
        }
        do_accept();
    });
}

awaitable<void> ApiServer::serve_connection(tcp::socket socket) {
    boost::system::error_code ec;
    boost::asio::streambuf buffer(kMaxHeadSize + kMaxBodySize);
    ApiResponse response;

    auto head_size = co_await boost::asio::async_read_until(socket, buffer, "\r\n\r\n",
                                                            redirect_error(use_awaitable, ec));
    if (ec == boost::asio::error::not_found) {
        response = error_response(400, "request head too large");
    } else if (ec) {
        log_debug("api") << "Failed to read request: " << ec.message();
        co_return;
    } else {
        std::string head(boost::asio::buffers_begin(buffer.data()),
                         boost::asio::buffers_begin(buffer.data()) + head_size);
        buffer.consume(head_size);

        auto request = parse_request_head(head);
        const auto length_text = request ? request->header("content-length") : std::string{};
        const auto content_length = length_text.empty() ? std::optional<std::size_t>(0) : parse_size(length_text);
        if (!request || !content_length) {
            response = error_response(400, "malformed request");
        } else if (*content_length > kMaxBodySize) {
            response = error_response(413, "request body too large");
        } else {
            if (buffer.size() < *content_length) {
                co_await boost::asio::async_read(socket, buffer,
                                                 boost::asio::transfer_exactly(*content_length - buffer.size()),
                                                 redirect_error(use_awaitable, ec));
                if (ec) {
                    log_debug("api") << "Failed to read request body: " << ec.message();
                    co_return;
                }
            }
            request->body.assign(boost::asio::buffers_begin(buffer.data()),
                                 boost::asio::buffers_begin(buffer.data()) + *content_length);
            response = handle(*request);
        }
    }

    const auto wire = serialize(response);
    co_await boost::asio::async_write(socket, boost::asio::buffer(wire), redirect_error(use_awaitable, ec));
    if (ec) {
        log_debug("api") << "Failed to write response: " << ec.message();
    }
    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
}

ApiResponse ApiServer::handle(const ApiRequest& request) const {
    std::string_view path = request.target;
    path = path.substr(0, path.find('?'));

    if (path == kDevicesPath) {
        if (request.method != "GET") return error_response(405, "method not allowed");
        return list_devices();
    }
    if (path.size() > kDevicePrefix.size() && path.substr(0, kDevicePrefix.size()) == kDevicePrefix) {
        auto dpid_text = path.substr(kDevicePrefix.size());
        if (dpid_text.find('/') != std::string_view::npos) return error_response(404, "not found");
        if (request.method != "POST") return error_response(405, "method not allowed");
        if (lowercase(request.header("content-type")) != kOctetStream) return error_response(404, "not found");
        return packet_out(request, dpid_text);
    }
    return error_response(404, "not found");
}

ApiResponse ApiServer::list_devices() const {
    std::ostringstream os;
    os << "{\"devices\":[";
    bool first = true;
    for (auto dpid : directory_->devices()) {
        if (!first) os << ",";
        first = false;
        os << "\"" << format_dpid(dpid) << "\"";
    }
    os << "]}";
    return ApiResponse{200, "application/json", os.str()};
}

ApiResponse ApiServer::packet_out(const ApiRequest& request, std::string_view dpid_text) const {
    log_debug("api") << "Packet out request received for " << dpid_text;
    auto dpid = parse_dpid(dpid_text);
    if (!dpid) {
        log_warn("api") << "Unable to parse given DPID '" << dpid_text << "'";
        return error_response(404, "DPID doesn't reference a device, '" + std::string(dpid_text) + "'");
    }

    auto injector = directory_->find(*dpid);
    if (!injector) {
        log_warn("api") << "Unable to find packet injector for " << format_dpid(*dpid) << ", unknown device";
        return error_response(404, "DPID not found, '" + std::string(dpid_text) + "'");
    }

    injector->inject(std::make_shared<Bytes>(request.body.begin(), request.body.end()));
    return ApiResponse{200, "text/plain", {}};
}

} // namespace oftee
