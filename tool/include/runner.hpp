#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "config.hpp"

// Executes check commands ({"cmd": ..., "args": {...}}) against the checkkit
// library and answers each with an OK or FAIL reply.
class CheckRunner {
public:
    explicit CheckRunner(const ToolConfig &config);

    // request text is {"checks": [...]} or a bare array of commands;
    // returns the array of replies
    nlohmann::json processRequest(const std::string &text);
    nlohmann::json processChecks(const nlohmann::json &checks);
    nlohmann::json processCommand(const nlohmann::json &data);

    nlohmann::json handleEXISTING_DIR(const std::string &cmd, const nlohmann::json &args);
    nlohmann::json handleNON_EXISTING_DIR(const std::string &cmd, const nlohmann::json &args);
    nlohmann::json handleEXTENSION(const std::string &cmd, const nlohmann::json &args);
    nlohmann::json handleEXISTING_FILE(const std::string &cmd, const nlohmann::json &args);
    nlohmann::json handleNON_EXISTING_FILE(const std::string &cmd, const nlohmann::json &args);
    nlohmann::json handleTYPE_RANGE(const std::string &cmd, const nlohmann::json &args);
    nlohmann::json handleARE_EQUAL(const std::string &cmd, const nlohmann::json &args);
    nlohmann::json handleORDERING(const std::string &cmd, const nlohmann::json &args);

    nlohmann::json makeOkReply(const std::string &msg, const nlohmann::json &data = nlohmann::json::object());
    nlohmann::json makeFailReply(uint32_t code, const std::string &msg);

    static bool isOk(const nlohmann::json &reply);
    static bool allOk(const nlohmann::json &replies);

private:
    ToolConfig _config;
};
