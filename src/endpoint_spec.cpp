#include "endpoint_spec.hpp"

#include "config.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <vector>

namespace oftee {

namespace {

constexpr std::string_view kSchemeTcp = "tcp";
constexpr std::string_view kSchemeHttp = "http";

constexpr std::string_view kTermAction = "action";
constexpr std::string_view kTermDlType = "dl_type";

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string_view> split(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    for (;;) {
        auto pos = text.find(sep, start);
        parts.push_back(text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return parts;
}

} // namespace

uint16_t parse_uint16(std::string_view text) {
    const std::string value(text);
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
        throw ConfigError("unable to convert '" + value + "' to uint16");
    }
    errno = 0;
    char* end = nullptr;
    const auto parsed = std::strtoul(value.c_str(), &end, 0);
    if (errno != 0 || end != value.c_str() + value.size() || parsed > 0xFFFF) {
        throw ConfigError("unable to convert '" + value + "' to uint16");
    }
    return static_cast<uint16_t>(parsed);
}

Destination parse_destination(std::string_view address) {
    if (address.empty()) {
        throw ConfigError("missing tee endpoint destination");
    }

    Destination dest;
    dest.url = std::string(address);

    std::string scheme;
    std::string_view rest = address;
    if (auto pos = address.find("://"); pos != std::string_view::npos) {
        scheme = lowercase(address.substr(0, pos));
        rest = address.substr(pos + 3);
    }

    auto path_pos = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, path_pos);
    if (path_pos != std::string_view::npos) {
        dest.target = std::string(rest.substr(path_pos));
        if (dest.target.front() == '?') dest.target.insert(dest.target.begin(), '/');
    }

    if (scheme == kSchemeHttp) {
        dest.scheme = Scheme::Http;
        if (authority.empty()) {
            throw ConfigError("missing host in '" + dest.url + "'");
        }
        const bool bracketed = authority.front() == '[';
        const bool has_port = bracketed ? authority.back() != ']'
                                        : authority.find(':') != std::string_view::npos;
        if (has_port) {
            auto [host, port] = parse_host_port(authority, "127.0.0.1");
            dest.host = host;
            dest.port = port;
        } else {
            dest.host = bracketed ? std::string(authority.substr(1, authority.size() - 2))
                                  : std::string(authority);
            dest.port = 80;
        }
        return dest;
    }

    if (!scheme.empty() && scheme != kSchemeTcp) {
        log_warn("endpoint") << "Unsupported scheme '" << scheme << "' in '" << dest.url
                             << "', treating it as a plain host:port";
    }
    dest.scheme = Scheme::Tcp;
    dest.target = "/";
    auto [host, port] = parse_host_port(authority, "127.0.0.1");
    dest.host = host;
    dest.port = port;
    return dest;
}

EndpointSpec parse_endpoint_spec(std::string_view text) {
    EndpointSpec spec;
    spec.text = std::string(text);

    auto parts = split(text, ';');
    // A lone "key=value" is a term without an action, not an address.
    const bool lone_term = text.find('=') != std::string_view::npos && text.find("://") == std::string_view::npos;
    if (parts.size() == 1 && !lone_term) {
        spec.destination = parse_destination(text);
        return spec;
    }

    std::string address;
    for (auto part : parts) {
        if (part.empty()) continue;
        auto eq = part.find('=');
        if (eq == std::string_view::npos) {
            log_error("endpoint") << "Malformed end point term '" << part << "'";
            throw ConfigError("malformed end point term '" + std::string(part) + "'");
        }
        const auto key = lowercase(part.substr(0, eq));
        const auto value = part.substr(eq + 1);
        if (key == kTermAction) {
            address = std::string(value);
        } else if (key == kTermDlType) {
            uint16_t dl_type = 0;
            try {
                dl_type = parse_uint16(value);
            } catch (const ConfigError&) {
                log_error("endpoint") << "Unable to convert term '" << key << "' value '" << value << "' to uint16";
                throw;
            }
            spec.rule.set |= kBitDlType;
            spec.rule.dl_type = dl_type;
            log_debug("endpoint") << "Found condition " << key << "=" << value;
        } else {
            log_error("endpoint") << "Unknown end point term '" << key << "'";
            throw ConfigError("unknown end point term '" + key + "'");
        }
    }

    if (address.empty()) {
        throw ConfigError("no action given in end point specification '" + spec.text + "'");
    }
    spec.destination = parse_destination(address);
    return spec;
}

std::string describe(const Destination& destination) {
    if (destination.scheme == Scheme::Http) {
        return "http://" + destination.host + ":" + std::to_string(destination.port) + destination.target;
    }
    return "tcp://" + destination.host + ":" + std::to_string(destination.port);
}

} // namespace oftee
