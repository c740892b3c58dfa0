#pragma once

#include "logging.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace oftee {

// Raised for invalid configuration: bad config file, bad environment value or
// an endpoint specification that cannot be resolved.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Listener {
    std::string address = "0.0.0.0";
    uint16_t port = 8000;
};

struct Backend {
    std::string host = "127.0.0.1";
    uint16_t port = 8001;
};

struct AppConfig {
    Listener listener;
    Backend controller;
    // Ordered tee endpoint specifications, e.g. "dl_type=0x0806;action=tcp://host:9".
    std::vector<std::string> tee;
    bool share_connections = true;
    LogLevel log_level = LogLevel::Info;
    struct Api {
        bool enable = false;
        Listener listener{"0.0.0.0", 8002};
    } api;
    struct Metrics {
        bool enable = false;
        uint16_t port = 0; // 0 means disabled
    } metrics;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Built-in defaults used when no config file is given.
AppConfig make_default_config();

// Load configuration from a JSON file. A missing or unreadable file yields the
// defaults; malformed JSON throws ConfigError.
AppConfig load_config(const std::string& config_path, std::ostream& log);

// Apply LISTEN_ON, PROXY_TO, TEE_TO, LOG_LEVEL, SHARE_CONNECTIONS, API_ON and
// METRICS_PORT on top of `config`. Throws ConfigError on invalid values.
void apply_environment(AppConfig& config, std::ostream& log, const EnvLookup& lookup);

// True when HELP is set to a true value in the environment.
bool help_requested(const EnvLookup& lookup);

// Parse "host:port", "[v6]:port" or ":port". An empty host becomes `default_host`.
std::pair<std::string, uint16_t> parse_host_port(std::string_view text, const std::string& default_host);

// Accepts 1/t/true and 0/f/false, case-insensitive.
std::optional<bool> parse_bool(std::string_view text);

std::string usage(const std::string& program);

} // namespace oftee
