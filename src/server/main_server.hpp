#ifndef TYPHON_SERVER_MAIN_SERVER_HPP
#define TYPHON_SERVER_MAIN_SERVER_HPP

#include <memory>
#include <string>
#include <vector>
#include "app.hpp"

#include "atom/log/spdlog_logger.hpp"
#include "config/gateway_config.hpp"
#include "evaluator/client.hpp"
#include "logging/spdlog_config.hpp"

// Base Controller
#include "controller/controller.hpp"

// API Controllers
#include "controller/run.hpp"

namespace typhon::server {

/**
 * @brief Main server application class
 *
 * Wires the evaluator client into the HTTP controllers and runs the Crow
 * application with the request logging middleware.
 */
class MainServer {
public:
    /**
     * @brief Construct main server with configuration
     */
    explicit MainServer(const config::GatewayConfig& config)
        : config_(config),
          app_(),
          client_(std::make_shared<const evaluator::EvaluatorClient>(
              config.evaluator)) {
        initializeLogging();
        LOG_INFO("Initializing Typhon Gateway v1.0.0");
        initializeControllers();
    }

    /**
     * @brief Start the server (blocks until stopped)
     */
    void start() {
        LOG_INFO("Starting server on {}:{} with {} threads", config_.host,
                 config_.port, config_.threadCount);
        app_.bindaddr(config_.host)
            .port(static_cast<std::uint16_t>(config_.port))
            .concurrency(static_cast<std::uint16_t>(config_.threadCount))
            .run();
    }

    /**
     * @brief Stop the server
     */
    void stop() {
        LOG_INFO("Stopping server...");
        app_.stop();
        logging::LogConfig::flushAll();
        LOG_INFO("Server stopped");
    }

private:
    void initializeLogging() {
        logging::LoggerConfig logConfig;
        logConfig.level =
            config_.debug ? spdlog::level::debug : spdlog::level::info;
        logConfig.console_output = config_.logToConsole;
        logConfig.file_output = config_.logToFile;
        logConfig.log_file_path = config_.logFile.string();
        logging::LogConfig::initialize(logConfig);

        app_.loglevel(config_.debug ? crow::LogLevel::Info
                                    : crow::LogLevel::Warning);
        LOG_INFO("Logging system initialized (file: {})",
                 config_.logToFile ? logConfig.log_file_path : "disabled");
    }

    void initializeControllers() {
        LOG_INFO("Initializing controllers...");

        controllers_.push_back(
            std::make_unique<controller::RunController>(client_));

        for (auto& ctrl : controllers_) {
            ctrl->registerRoutes(app_);
            LOG_DEBUG("Registered routes for controller '{}'", ctrl->name());
        }

        LOG_INFO("Initialized {} controllers", controllers_.size());

        const auto& evaluatorConfig = client_->getConfig();
        std::string command;
        for (const auto& part : evaluatorConfig.command) {
            command += command.empty() ? part : " " + part;
        }
        LOG_INFO("Evaluator: {}", command);
        LOG_INFO("Project root: {}",
                 evaluatorConfig.workingDirectory.empty()
                     ? std::string("(current directory)")
                     : evaluatorConfig.workingDirectory.string());
    }

    config::GatewayConfig config_;
    ServerApp app_;
    std::shared_ptr<const evaluator::EvaluatorClient> client_;
    std::vector<std::unique_ptr<controller::Controller>> controllers_;
};

}  // namespace typhon::server

#endif  // TYPHON_SERVER_MAIN_SERVER_HPP
