/*
 * gateway_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file gateway_config.hpp
 * @brief Layered gateway configuration
 * @date 2024
 * @version 1.0.0
 */

#ifndef TYPHON_CONFIG_GATEWAY_CONFIG_HPP
#define TYPHON_CONFIG_GATEWAY_CONFIG_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "atom/type/json.hpp"
#include "evaluator/types.hpp"

namespace typhon::config {

/**
 * @brief Everything the gateway executable needs to start
 */
struct GatewayConfig {
    static constexpr int MAX_THREAD_COUNT = 1024;

    std::string host{"127.0.0.1"};
    int port{5000};
    int threadCount{4};
    bool debug{false};

    evaluator::EvaluatorConfig evaluator;

    // Logging
    std::filesystem::path logFile{"logs/typhon-gateway.log"};
    bool logToConsole{true};
    bool logToFile{true};

    bool showHelp{false};  ///< --help was given; nothing else is started
};

/**
 * @brief Builds a GatewayConfig from its sources
 *
 * Sources are applied in order, each overriding the previous one:
 * built-in defaults, JSON file (--config), environment
 * (TYPHON_WEBUI_HOST, TYPHON_WEBUI_PORT, TYPHON_WEBUI_DEBUG), command line.
 */
class ConfigLoader {
public:
    using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

    /**
     * @brief Load the full configuration
     * @throws BadConfigException on unreadable or invalid values
     */
    [[nodiscard]] static auto load(const std::vector<std::string>& args,
                                   const EnvLookup& env = systemEnvironment)
        -> GatewayConfig;

    /**
     * @brief Overlay fields present in a JSON document
     */
    static void applyJson(GatewayConfig& config, const nlohmann::json& json);

    /**
     * @brief Read and overlay a JSON configuration file
     */
    static void applyFile(GatewayConfig& config,
                          const std::filesystem::path& path);

    static void applyEnvironment(GatewayConfig& config, const EnvLookup& env);

    /**
     * @brief Overlay command line options (argv without the program name)
     */
    static void applyArguments(GatewayConfig& config,
                               const std::vector<std::string>& args);

    /**
     * @brief Reject configurations the server cannot start with
     */
    static void validate(const GatewayConfig& config);

    [[nodiscard]] static auto systemEnvironment(std::string_view name)
        -> std::optional<std::string>;

    [[nodiscard]] static auto usage(std::string_view program) -> std::string;
};

}  // namespace typhon::config

#endif  // TYPHON_CONFIG_GATEWAY_CONFIG_HPP
