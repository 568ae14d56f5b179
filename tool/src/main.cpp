#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <optional>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "checkkit/version.hpp"
#include "config.hpp"
#include "runner.hpp"

namespace {

void printUsage(const char *prog) {
    std::cerr << "usage: " << prog << " [--request <file|->] [--config <file>] [--log-level <level>]\n"
              << "       [--tolerance <value>] [--stop-on-failure] [--pretty] [--version]\n";
}

bool readRequest(const std::string &source, std::string &text) {
    std::ostringstream buffer;
    if (source == "-") {
        buffer << std::cin.rdbuf();
    } else {
        std::ifstream in(source);
        if (!in) {
            spdlog::error("could not open request file: {}", source);
            return false;
        }
        buffer << in.rdbuf();
    }
    text = buffer.str();
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("checkkit"));
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S %t] [%^%L%$] %v");

    // parse arguments
    std::string requestSource = "-";
    std::string configPath;
    std::optional<std::string> logLevel;
    std::optional<double> tolerance;
    bool stopOnFailure = false, pretty = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--request" && i + 1 < argc) {
            requestSource = argv[++i];
        }
        else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            logLevel = argv[++i];
        }
        else if (arg == "--tolerance" && i + 1 < argc) {
            try {
                tolerance = std::stod(argv[++i]);
            } catch (const std::exception &e) {
                spdlog::error("invalid tolerance: {}", e.what());
                return 2;
            }
        }
        else if (arg == "--stop-on-failure") {
            stopOnFailure = true;
        }
        else if (arg == "--pretty") {
            pretty = true;
        }
        else if (arg == "--version") {
            std::cout << checkkit::version() << std::endl;
            return 0;
        }
        else {
            spdlog::error("unknown argument: {}", arg);
            printUsage(argv[0]);
            return 2;
        }
    }

    // the settings file first, flags override it
    ToolConfig config;
    spdlog::level::level_enum flagLevel = config.logLevel;
    if (logLevel) {
        if (!parseLogLevel(*logLevel, flagLevel)) {
            spdlog::error("unknown log level: '{}'", *logLevel);
            return 2;
        }
        spdlog::set_level(flagLevel);
    }
    if (!configPath.empty() && !loadConfig(configPath, config)) {
        return 2;
    }
    if (logLevel) config.logLevel = flagLevel;
    if (tolerance) {
        if (!(*tolerance >= 0.0)) {
            spdlog::error("tolerance must not be negative: {}", *tolerance);
            return 2;
        }
        config.tolerance = *tolerance;
    }
    config.stopOnFailure = config.stopOnFailure || stopOnFailure;
    config.pretty = config.pretty || pretty;
    spdlog::set_level(config.logLevel);

    spdlog::info("checkkit {} reading checks from {}", checkkit::version(),
        requestSource == "-" ? std::string("stdin") : requestSource);

    std::string text;
    if (!readRequest(requestSource, text)) {
        return 2;
    }

    CheckRunner runner(config);
    nlohmann::json replies = runner.processRequest(text);
    std::cout << replies.dump(config.pretty ? 2 : -1) << std::endl;

    bool ok = CheckRunner::allOk(replies);
    spdlog::info("{} checks, {}", replies.size(), ok ? "all passed" : "some failed");
    return ok ? 0 : 1;
}
