/**
 * @file main.cpp
 * @brief Main entry point for the Typhon code-evaluation gateway
 *
 * The gateway accepts evaluation requests over HTTP, normalizes them and
 * runs one supervised evaluator process per request.
 */

#include "atom/log/spdlog_logger.hpp"
#include "config/exception.hpp"
#include "config/gateway_config.hpp"
#include "main_server.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    typhon::config::GatewayConfig config;
    try {
        config = typhon::config::ConfigLoader::load(args);
    } catch (const typhon::config::BadConfigException& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        std::cerr << typhon::config::ConfigLoader::usage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        std::cout << typhon::config::ConfigLoader::usage(argv[0]);
        return 0;
    }

    try {
        auto server = std::make_unique<typhon::server::MainServer>(config);

        LOG_INFO("==============================================");
        LOG_INFO("  Typhon Gateway                              ");
        LOG_INFO("  Version: 1.0.0                              ");
        LOG_INFO("==============================================");
        LOG_INFO("API available at http://{}:{}/api/run", config.host,
                 config.port);
        LOG_INFO("Press Ctrl+C to stop the server");

        // Blocks until Crow handles SIGINT/SIGTERM
        server->start();
        server->stop();
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }

    LOG_INFO("Server shutdown complete");
    return 0;
}
