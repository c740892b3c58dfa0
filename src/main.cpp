#include "api_server.hpp"
#include "config.hpp"
#include "device_directory.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "server.hpp"
#include "tee.hpp"

#include <utility>

#include <boost/asio.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace oftee;

int main(int argc, char* argv[]) {
    try {
        std::string config_path;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                std::cout << usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option '" << arg << "'\n" << usage(argv[0]);
                return 1;
            }
        }

        const EnvLookup env = [](const std::string& name) -> std::optional<std::string> {
            if (const char* value = std::getenv(name.c_str())) return std::string(value);
            return std::nullopt;
        };
        if (help_requested(env)) {
            std::cout << usage(argv[0]);
            return 0;
        }

        auto config = load_config(config_path, std::cerr);
        apply_environment(config, std::cerr, env);
        set_log_level(config.log_level);

        boost::asio::io_context io;

        TeeMultiplexerPtr shared_tee;
        if (config.share_connections) {
            shared_tee = open_endpoints_blocking(io, config.tee);
        }

        auto metrics = make_metrics();
        auto directory = std::make_shared<DeviceDirectory>(io.get_executor());

        Server server(io, config, shared_tee, directory, metrics);
        server.start();

        std::unique_ptr<ApiServer> api;
        if (config.api.enable) {
            api = std::make_unique<ApiServer>(io, directory, config.api.listener);
            api->start();
        }

        std::unique_ptr<MetricsServer> metrics_server;
        if (config.metrics.enable && config.metrics.port != 0) {
            metrics_server = std::make_unique<MetricsServer>(io, metrics, config.metrics.port);
            metrics_server->start();
        }

        const auto workers = std::max(2u, std::thread::hardware_concurrency());
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (unsigned int i = 0; i < workers; ++i) {
            threads.emplace_back([&io]() { io.run(); });
        }

        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    } catch (const std::exception& ex) {
        log_error("fatal") << ex.what();
        return 1;
    }

    return 0;
}
