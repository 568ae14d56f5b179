#pragma once
#include <string>
#include <filesystem>
#include <spdlog/spdlog.h>

struct ToolConfig {
    spdlog::level::level_enum logLevel = spdlog::level::warn;
    double tolerance = 0.0;     // used by comparisons that do not pass one
    bool stopOnFailure = false;
    bool pretty = false;
};

// Reads the JSON settings file into config; keys that are absent keep their
// current value. Logs and returns false on any error.
bool loadConfig(const std::filesystem::path &path, ToolConfig &config);

bool parseLogLevel(const std::string &name, spdlog::level::level_enum &level);
