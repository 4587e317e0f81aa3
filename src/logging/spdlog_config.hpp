/*
 * spdlog_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration for the gateway

**************************************************/

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace typhon::logging {

struct LoggerConfig {
    std::string name{"typhon"};
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
    bool console_output = true;
    bool file_output = true;
    std::string log_file_path = "logs/typhon-gateway.log";
    std::size_t max_file_size = 1048576 * 10;  // 10MB
    std::size_t max_files = 5;
    std::chrono::seconds flush_interval{3};
};

/**
 * @brief Process-wide spdlog setup
 */
class LogConfig {
public:
    /**
     * @brief Install the default logger with console and rotating file sinks
     * @param config Logger configuration
     *
     * Only the first call has an effect.
     */
    static void initialize(const LoggerConfig& config = LoggerConfig{});

    /**
     * @brief Build a logger from @p config without registering it
     */
    [[nodiscard]] static auto createLogger(const LoggerConfig& config)
        -> std::shared_ptr<spdlog::logger>;

    static void setGlobalLevel(spdlog::level::level_enum level) noexcept;

    static void flushAll() noexcept;

    [[nodiscard]] static bool isInitialized() noexcept {
        return initialized_.load(std::memory_order_acquire);
    }

private:
    static inline std::atomic<bool> initialized_{false};
};

}  // namespace typhon::logging
