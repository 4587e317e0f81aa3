/*
 * spdlog_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration implementation

**************************************************/

#include "spdlog_config.hpp"

#include <cstdio>
#include <filesystem>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace typhon::logging {

void LogConfig::initialize(const LoggerConfig& config) {
    if (initialized_.exchange(true, std::memory_order_acq_rel)) {
        return;  // Already initialized
    }

    try {
        auto logger = createLogger(config);
        spdlog::set_default_logger(logger);
        setGlobalLevel(config.level);
        spdlog::flush_every(config.flush_interval);

        spdlog::set_error_handler([](const std::string& msg) {
            std::fprintf(stderr, "spdlog error: %s\n", msg.c_str());
        });

        spdlog::debug("Logging initialized (console: {}, file: {})",
                      config.console_output,
                      config.file_output ? config.log_file_path : "off");
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        initialized_.store(false, std::memory_order_release);
        throw;
    }
}

auto LogConfig::createLogger(const LoggerConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_output) {
        auto console_sink =
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(config.pattern);
        sinks.push_back(console_sink);
    }

    if (config.file_output) {
        auto parent = std::filesystem::path(config.log_file_path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file_path, config.max_file_size, config.max_files);
        file_sink->set_level(spdlog::level::trace);  // Log everything to file
        file_sink->set_pattern(
            "[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] [%n] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(),
                                                   sinks.end());
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::err);
    return logger;
}

void LogConfig::setGlobalLevel(spdlog::level::level_enum level) noexcept {
    spdlog::set_level(level);
}

void LogConfig::flushAll() noexcept {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->flush();
    });
}

}  // namespace typhon::logging
