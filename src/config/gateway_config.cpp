/*
 * gateway_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "gateway_config.hpp"
#include "exception.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace typhon::config {

namespace {

auto parseNumber(std::string_view name, std::string_view text) -> int {
    int value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        THROW_INVALID_CONFIG_EXCEPTION("Invalid " + std::string(name) + ": '" +
                                       std::string(text) + "'");
    }
    return value;
}

auto splitCommand(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> parts;
    std::istringstream stream{std::string(text)};
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

auto requireValue(const std::vector<std::string>& args, std::size_t& index)
    -> const std::string& {
    if (index + 1 >= args.size()) {
        THROW_INVALID_CONFIG_EXCEPTION("Option " + args[index] +
                                       " requires a value");
    }
    return args[++index];
}

}  // namespace

auto ConfigLoader::load(const std::vector<std::string>& args,
                        const EnvLookup& env) -> GatewayConfig {
    GatewayConfig config;

    // The file is the lowest-priority explicit source, so find it first.
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            applyFile(config, requireValue(args, i));
        }
    }

    applyEnvironment(config, env);
    applyArguments(config, args);
    if (!config.showHelp) {
        validate(config);
    }
    return config;
}

void ConfigLoader::applyJson(GatewayConfig& config, const nlohmann::json& json) {
    if (!json.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION("Configuration root must be an object");
    }

    try {
        if (json.contains("host")) {
            config.host = json["host"].get<std::string>();
        }
        if (json.contains("port")) {
            config.port = json["port"].get<int>();
        }
        if (json.contains("threads")) {
            config.threadCount = json["threads"].get<int>();
        }
        if (json.contains("debug")) {
            config.debug = json["debug"].get<bool>();
        }

        if (json.contains("evaluator")) {
            const auto& evaluator = json["evaluator"];
            if (evaluator.contains("command")) {
                const auto& command = evaluator["command"];
                config.evaluator.command =
                    command.is_string()
                        ? splitCommand(command.get<std::string>())
                        : command.get<std::vector<std::string>>();
            }
            if (evaluator.contains("working_directory")) {
                config.evaluator.workingDirectory =
                    evaluator["working_directory"].get<std::string>();
            }
        }

        if (json.contains("logging")) {
            const auto& logging = json["logging"];
            if (logging.contains("file")) {
                config.logFile = logging["file"].get<std::string>();
            }
            if (logging.contains("console")) {
                config.logToConsole = logging["console"].get<bool>();
            }
            if (logging.contains("file_output")) {
                config.logToFile = logging["file_output"].get<bool>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        THROW_INVALID_CONFIG_EXCEPTION(std::string("Invalid configuration: ") +
                                       e.what());
    }
}

void ConfigLoader::applyFile(GatewayConfig& config,
                             const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        THROW_CONFIG_IO_EXCEPTION("Cannot open configuration file: " +
                                  path.string());
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        THROW_CONFIG_IO_EXCEPTION("Malformed configuration file " +
                                  path.string() + ": " + e.what());
    }
    applyJson(config, json);
}

void ConfigLoader::applyEnvironment(GatewayConfig& config,
                                    const EnvLookup& env) {
    if (auto host = env("TYPHON_WEBUI_HOST")) {
        config.host = *host;
    }
    if (auto port = env("TYPHON_WEBUI_PORT")) {
        config.port = parseNumber("TYPHON_WEBUI_PORT", *port);
    }
    if (auto debug = env("TYPHON_WEBUI_DEBUG")) {
        config.debug = *debug == "1";
    }
}

void ConfigLoader::applyArguments(GatewayConfig& config,
                                  const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else if (arg == "--host") {
            config.host = requireValue(args, i);
        } else if (arg == "--port") {
            config.port = parseNumber("port", requireValue(args, i));
        } else if (arg == "--threads") {
            config.threadCount = parseNumber("threads", requireValue(args, i));
        } else if (arg == "--project-root") {
            config.evaluator.workingDirectory = requireValue(args, i);
        } else if (arg == "--evaluator") {
            config.evaluator.command = splitCommand(requireValue(args, i));
        } else if (arg == "--config") {
            ++i;  // already applied by load()
        } else if (arg == "--debug") {
            config.debug = true;
        } else {
            THROW_INVALID_CONFIG_EXCEPTION("Unknown option: " + arg);
        }
    }
}

void ConfigLoader::validate(const GatewayConfig& config) {
    if (config.port < 1 || config.port > 65535) {
        THROW_INVALID_CONFIG_EXCEPTION("Port out of range: " +
                                       std::to_string(config.port));
    }
    if (config.threadCount < 1) {
        THROW_INVALID_CONFIG_EXCEPTION("Thread count must be positive");
    }
    if (config.threadCount > GatewayConfig::MAX_THREAD_COUNT) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "Thread count must be at most " +
            std::to_string(GatewayConfig::MAX_THREAD_COUNT));
    }
    if (config.host.empty()) {
        THROW_INVALID_CONFIG_EXCEPTION("Host must not be empty");
    }
    if (config.evaluator.command.empty()) {
        THROW_INVALID_CONFIG_EXCEPTION("Evaluator command must not be empty");
    }
}

auto ConfigLoader::systemEnvironment(std::string_view name)
    -> std::optional<std::string> {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

auto ConfigLoader::usage(std::string_view program) -> std::string {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  --host <address>       Listen address (default: 127.0.0.1)\n"
        << "  --port <number>        Listen port (default: 5000)\n"
        << "  --threads <number>     Worker threads, 1-1024 (default: 4)\n"
        << "  --project-root <dir>   Evaluator working directory\n"
        << "  --evaluator <command>  Evaluator command line "
           "(default: python3 webui/runner.py)\n"
        << "  --config <file>        JSON configuration file\n"
        << "  --debug                Enable debug logging\n"
        << "  --help, -h             Show this help message\n"
        << "Environment: TYPHON_WEBUI_HOST, TYPHON_WEBUI_PORT, "
           "TYPHON_WEBUI_DEBUG\n";
    return out.str();
}

}  // namespace typhon::config
