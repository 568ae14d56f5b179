#include "runner.hpp"
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "checkkit/error_codes.hpp"

using nlohmann::json;

CheckRunner::CheckRunner(const ToolConfig &config)
    : _config(config) {}

json CheckRunner::processRequest(const std::string &text) {
    json request;
    try {
        request = json::parse(text);
    } catch (const json::parse_error &e) {
        spdlog::error("json parse failed: {}", e.what());
        return json::array({ makeFailReply(checkkit::error::JSON_PARSE_ERROR.code(), e.what()) });
    }

    if (request.is_array()) {
        return processChecks(request);
    }
    if (!request.is_object() || !request.contains("checks")) {
        spdlog::error("request did not contain 'checks'");
        return json::array({ makeFailReply(checkkit::error::MISSING_ARGUMENT.code(), "checks") });
    }
    if (!request["checks"].is_array()) {
        return json::array({ makeFailReply(checkkit::error::JSON_TYPE_ERROR.code(), "checks must be array") });
    }
    return processChecks(request["checks"]);
}

json CheckRunner::processChecks(const json &checks) {
    json replies = json::array();
    for (const auto &check : checks) {
        replies.push_back(processCommand(check));
        if (_config.stopOnFailure && !isOk(replies.back())) {
            spdlog::info("stopping after first failed check");
            break;
        }
    }
    return replies;
}

json CheckRunner::processCommand(const json &data) {
    spdlog::debug("check: '{}'", data.dump());

    if (!data.is_object() || !data.contains("cmd")) {
        spdlog::error("check did not contain 'cmd'");
        return makeFailReply(checkkit::error::MISSING_ARGUMENT.code(), "cmd");
    }
    if (!data["cmd"].is_string()) {
        return makeFailReply(checkkit::error::JSON_TYPE_ERROR.code(), "cmd must be string");
    }
    const std::string &cmd = data["cmd"].get_ref<const std::string&>();
    const json args = data.contains("args") ? data["args"] : json::object();
    if (!args.is_object()) {
        return makeFailReply(checkkit::error::JSON_TYPE_ERROR.code(), "args must be object");
    }

    json reply;
    try {
        spdlog::info("command: {}", cmd);
        if (cmd == "EXISTING_DIR") reply = handleEXISTING_DIR(cmd, args);
        else if (cmd == "NON_EXISTING_DIR") reply = handleNON_EXISTING_DIR(cmd, args);
        else if (cmd == "EXTENSION") reply = handleEXTENSION(cmd, args);
        else if (cmd == "EXISTING_FILE") reply = handleEXISTING_FILE(cmd, args);
        else if (cmd == "NON_EXISTING_FILE") reply = handleNON_EXISTING_FILE(cmd, args);
        else if (cmd == "TYPE_MAX" || cmd == "TYPE_MIN") reply = handleTYPE_RANGE(cmd, args);
        else if (cmd == "ARE_EQUAL") reply = handleARE_EQUAL(cmd, args);
        else if (cmd == "SMALLER_OR_EQUAL" || cmd == "GREATER_OR_EQUAL") reply = handleORDERING(cmd, args);
        else {
            spdlog::error("unknown command: {}", cmd);
            reply = makeFailReply(checkkit::error::UNKNOWN_COMMAND.code(), cmd);
        }
    } catch (const checkkit::validation_error &e) {
        reply = makeFailReply(e.code().code(), e.what());
    } catch (const json::type_error &e) {
        spdlog::error("type_error: {}", e.what());
        reply = makeFailReply(checkkit::error::JSON_TYPE_ERROR.code(), e.what());
    }
    reply["cmd"] = cmd;
    return reply;
}


json CheckRunner::makeOkReply(const std::string &msg, const json &data) {
    json reply = { {"status", "OK"}, {"code", checkkit::error::SUCCESS.code()}, {"message", msg}, {"data", data} };
    return reply;
}

json CheckRunner::makeFailReply(uint32_t code, const std::string &msg) {
    json reply = { {"status", "FAIL"}, {"code", code}, {"message", msg} };
    return reply;
}

bool CheckRunner::isOk(const json &reply) {
    return reply.is_object() && reply.value("status", "") == "OK";
}

bool CheckRunner::allOk(const json &replies) {
    for (const auto &reply : replies) {
        if (!isOk(reply)) return false;
    }
    return true;
}
