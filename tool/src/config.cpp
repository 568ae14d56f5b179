#include "config.hpp"
#include <string>
#include <fstream>
#include <filesystem>
#include <system_error>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using nlohmann::json;

bool parseLogLevel(const std::string &name, spdlog::level::level_enum &level) {
    auto parsed = spdlog::level::from_str(name);
    // from_str() maps anything it does not know to off
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    level = parsed;
    return true;
}

bool loadConfig(const fs::path &path, ToolConfig &config) {
    spdlog::info("loading settings from {}", path.string());
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::error("settings file does not exist: {}{}", path.string(),
            ec ? " (" + ec.message() + ")" : std::string());
        return false;
    }
    json settings;
    try {
        std::ifstream in(path);
        settings = json::parse(in);
    } catch (const json::parse_error &e) {
        spdlog::error("json parse failed: {}", e.what());
        return false;
    } catch (const std::exception &e) {
        spdlog::error("loadConfig: {}", e.what());
        return false;
    }
    if (!settings.is_object()) {
        spdlog::error("invalid settings file structure");
        return false;
    }

    ToolConfig result = config;
    try {
        if (settings.contains("log_level")) {
            const std::string &name = settings["log_level"].get_ref<const std::string&>();
            if (!parseLogLevel(name, result.logLevel)) {
                spdlog::error("unknown log level: '{}'", name);
                return false;
            }
        }
        if (settings.contains("tolerance")) {
            result.tolerance = settings["tolerance"].get<double>();
            if (!(result.tolerance >= 0.0)) {
                spdlog::error("tolerance must not be negative: {}", result.tolerance);
                return false;
            }
        }
        if (settings.contains("stop_on_failure")) {
            result.stopOnFailure = settings["stop_on_failure"].get<bool>();
        }
        if (settings.contains("pretty")) {
            result.pretty = settings["pretty"].get<bool>();
        }
    } catch (const json::type_error &e) {
        spdlog::error("type_error: {}", e.what());
        return false;
    }

    config = result;
    spdlog::info("settings loaded");
    return true;
}
