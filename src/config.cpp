#include "config.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pt = boost::property_tree;

namespace oftee {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(" \t");
    return std::string(text.substr(begin, end - begin + 1));
}

uint16_t parse_port(std::string_view text, std::string_view context) {
    const std::string value(text);
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ConfigError("invalid port '" + value + "' in '" + std::string(context) + "'");
    }
    errno = 0;
    const auto port = std::strtoul(value.c_str(), nullptr, 10);
    if (errno != 0 || port > 65535) {
        throw ConfigError("port out of range in '" + std::string(context) + "'");
    }
    return static_cast<uint16_t>(port);
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

LogLevel resolve_log_level(const std::string& text, std::ostream& log) {
    if (auto level = parse_log_level(text)) return *level;
    log << "[config] Unable to parse log level '" << text << "', defaulting to 'warn'\n";
    return LogLevel::Warn;
}

} // namespace

AppConfig make_default_config() {
    return AppConfig{};
}

std::pair<std::string, uint16_t> parse_host_port(std::string_view text, const std::string& default_host) {
    std::string host;
    std::string_view port_text;
    if (!text.empty() && text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string_view::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            throw ConfigError("invalid address '" + std::string(text) + "'");
        }
        host = std::string(text.substr(1, close - 1));
        port_text = text.substr(close + 2);
    } else {
        auto colon = text.rfind(':');
        if (colon == std::string_view::npos) {
            throw ConfigError("missing port in address '" + std::string(text) + "'");
        }
        host = std::string(text.substr(0, colon));
        port_text = text.substr(colon + 1);
    }
    if (host.empty()) host = default_host;
    return {host, parse_port(port_text, text)};
}

std::optional<bool> parse_bool(std::string_view text) {
    const auto value = lowercase(trim(text));
    if (value == "1" || value == "t" || value == "true") return true;
    if (value == "0" || value == "f" || value == "false") return false;
    return std::nullopt;
}

AppConfig load_config(const std::string& config_path, std::ostream& log) {
    if (config_path.empty()) {
        log << "[config] No config path provided. Using defaults.\n";
        return make_default_config();
    }

    std::ifstream in(config_path);
    if (!in) {
        log << "[config] Cannot open config file at " << config_path << ". Using defaults.\n";
        return make_default_config();
    }

    pt::ptree tree;
    try {
        pt::read_json(in, tree);
    } catch (const pt::json_parser_error& ex) {
        throw ConfigError(std::string("failed to parse JSON config: ") + ex.what());
    }

    AppConfig config = make_default_config();
    try {
        config.listener.address = tree.get<std::string>("listen.address", config.listener.address);
        config.listener.port = tree.get<uint16_t>("listen.port", config.listener.port);
        config.controller.host = tree.get<std::string>("controller.host", config.controller.host);
        config.controller.port = tree.get<uint16_t>("controller.port", config.controller.port);
        config.share_connections = tree.get<bool>("share_connections", config.share_connections);

        config.api.enable = tree.get<bool>("api.enable", config.api.enable);
        config.api.listener.address = tree.get<std::string>("api.address", config.api.listener.address);
        config.api.listener.port = tree.get<uint16_t>("api.port", config.api.listener.port);

        config.metrics.enable = tree.get<bool>("metrics.enable", config.metrics.enable);
        config.metrics.port = tree.get<uint16_t>("metrics.port", config.metrics.port);
    } catch (const pt::ptree_error& ex) {
        throw ConfigError(std::string("invalid config value: ") + ex.what());
    }

    if (auto level = tree.get_optional<std::string>("log_level")) {
        config.log_level = resolve_log_level(*level, log);
    }

    if (auto tee_child = tree.get_child_optional("tee")) {
        for (const auto& entry : *tee_child) {
            auto spec = entry.second.get_value<std::string>();
            if (spec.empty()) {
                log << "[config] Skip empty tee endpoint specification.\n";
                continue;
            }
            config.tee.push_back(std::move(spec));
        }
    }

    return config;
}

void apply_environment(AppConfig& config, std::ostream& log, const EnvLookup& lookup) {
    if (auto value = lookup("LISTEN_ON")) {
        auto [host, port] = parse_host_port(*value, "0.0.0.0");
        config.listener = Listener{host, port};
    }
    if (auto value = lookup("PROXY_TO")) {
        auto [host, port] = parse_host_port(*value, "127.0.0.1");
        config.controller = Backend{host, port};
    }
    if (auto value = lookup("TEE_TO")) {
        config.tee = split_list(*value);
    }
    if (auto value = lookup("LOG_LEVEL")) {
        config.log_level = resolve_log_level(*value, log);
    }
    if (auto value = lookup("SHARE_CONNECTIONS")) {
        auto flag = parse_bool(*value);
        if (!flag) throw ConfigError("invalid SHARE_CONNECTIONS value '" + *value + "'");
        config.share_connections = *flag;
    }
    if (auto value = lookup("API_ON")) {
        auto [host, port] = parse_host_port(*value, "0.0.0.0");
        config.api.enable = true;
        config.api.listener = Listener{host, port};
    }
    if (auto value = lookup("METRICS_PORT")) {
        config.metrics.port = parse_port(*value, "METRICS_PORT");
        config.metrics.enable = config.metrics.port != 0;
    }
}

bool help_requested(const EnvLookup& lookup) {
    auto value = lookup("HELP");
    if (!value) return false;
    return parse_bool(*value).value_or(false);
}

std::string usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " [-c|--config path] [-h|--help]\n"
       << "\n"
       << "Environment (overrides the config file):\n"
       << "  LISTEN_ON          address on which to listen for OpenFlow devices (default :8000)\n"
       << "  PROXY_TO           address of the SDN controller (default :8001)\n"
       << "  TEE_TO             comma separated tee endpoint specifications (default none)\n"
       << "                     e.g. dl_type=0x0806;action=tcp://host:9\n"
       << "  LOG_LEVEL          debug, info, warn or error (default info)\n"
       << "  SHARE_CONNECTIONS  share tee connections between devices (default true)\n"
       << "  API_ON             address for the HTTP API, enables it\n"
       << "  METRICS_PORT       port for the metrics endpoint, enables it\n"
       << "  HELP               show this message\n"
       << "\n"
       << "The defaults intentionally differ from the upstream oftee tool, which logs\n"
       << "at debug and tees to :8002 unless told otherwise.\n";
    return os.str();
}

} // namespace oftee
