#include "runner.hpp"
#include <string>
#include <vector>
#include <optional>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "checkkit/error_codes.hpp"
#include "checkkit/fs_validator.hpp"
#include "checkkit/numeric.hpp"

using nlohmann::json;

namespace {

// JSON null is the null path
checkkit::nullable_string toNullableString(const json &value) {
    if (value.is_null()) return std::nullopt;
    return value.get<std::string>();
}

// absent means no restriction, null means a null list
checkkit::extension_list toExtensionList(const json &args) {
    if (!args.contains("extensions")) {
        return checkkit::extension_list(std::in_place);
    }
    const json &value = args["extensions"];
    if (value.is_null()) {
        return std::nullopt;
    }
    std::vector<checkkit::nullable_string> result;
    for (const auto &entry : value.get_ref<const json::array_t&>()) {
        result.push_back(toNullableString(entry));
    }
    return result;
}

} // namespace

json CheckRunner::handleEXISTING_DIR(const std::string &cmd, const json &args) {
    if (!args.contains("path")) {
        spdlog::warn("request does not contain 'path'");
        return makeFailReply(checkkit::error::MISSING_ARGUMENT.code(), "path");
    }
    auto path = toNullableString(args["path"]);
    checkkit::validateExistingDirectory(path);
    return makeOkReply("directory exists: " + *path);
}

json CheckRunner::handleNON_EXISTING_DIR(const std::string &cmd, const json &args) {
    if (!args.contains("path")) {
        spdlog::warn("request does not contain 'path'");
        return makeFailReply(checkkit::error::MISSING_ARGUMENT.code(), "path");
    }
    auto path = toNullableString(args["path"]);
    checkkit::validateNonExistingDirectory(path);
    return makeOkReply("directory does not exist: " + *path);
}

json CheckRunner::handleEXTENSION(const std::string &cmd, const json &args) {
    if (!args.contains("path")) {
        spdlog::warn("request does not contain 'path'");
        return makeFailReply(checkkit::error::MISSING_ARGUMENT.code(), "path");
    }
    auto path = toNullableString(args["path"]);
    checkkit::validateExtension(path, toExtensionList(args));
    return makeOkReply("extension accepted: " + *path, { {"extension", checkkit::fileExtension(*path)} });
}

json CheckRunner::handleEXISTING_FILE(const std::string &cmd, const json &args) {
    if (!args.contains("path")) {
        spdlog::warn("request does not contain 'path'");
        return makeFailReply(checkkit::error::MISSING_ARGUMENT.code(), "path");
    }
    auto path = toNullableString(args["path"]);
    checkkit::validateExistingFile(path, toExtensionList(args));
    return makeOkReply("file exists: " + *path);
}

json CheckRunner::handleNON_EXISTING_FILE(const std::string &cmd, const json &args) {
    if (!args.contains("path")) {
        spdlog::warn("request does not contain 'path'");
        return makeFailReply(checkkit::error::MISSING_ARGUMENT.code(), "path");
    }
    auto path = toNullableString(args["path"]);
    checkkit::validateNonExistingFile(path, toExtensionList(args));
    return makeOkReply("file does not exist: " + *path);
}

json CheckRunner::handleTYPE_RANGE(const std::string &cmd, const json &args) {
    if (!args.contains("type")) {
        spdlog::warn("request does not contain 'type'");
        return makeFailReply(checkkit::error::MISSING_ARGUMENT.code(), "type");
    }
    std::optional<checkkit::type_code> type;
    if (!args["type"].is_null()) {
        type = checkkit::typeCodeFromName(args["type"].get<std::string>());
    }
    double value = (cmd == "TYPE_MAX") ? checkkit::typeMaxValue(type) : checkkit::typeMinValue(type);
    return makeOkReply(checkkit::typeCodeName(*type), { {"value", value} });
}

json CheckRunner::handleARE_EQUAL(const std::string &cmd, const json &args) {
    for (const char *name : {"a", "b"}) {
        if (!args.contains(name)) {
            spdlog::warn("request does not contain '{}'", name);
            return makeFailReply(checkkit::error::MISSING_ARGUMENT.code(), name);
        }
    }
    double a = args["a"].get<double>();
    double b = args["b"].get<double>();
    double tolerance = args.contains("tolerance") ? args["tolerance"].get<double>() : _config.tolerance;

    bool result = checkkit::areEqual(a, b, tolerance);
    spdlog::debug("areEqual({}, {}, {}) = {}", a, b, tolerance, result);
    return makeOkReply(result ? "equal" : "not equal", { {"result", result} });
}

json CheckRunner::handleORDERING(const std::string &cmd, const json &args) {
    for (const char *name : {"value", "reference"}) {
        if (!args.contains(name)) {
            spdlog::warn("request does not contain '{}'", name);
            return makeFailReply(checkkit::error::MISSING_ARGUMENT.code(), name);
        }
    }
    double value = args["value"].get<double>();
    double reference = args["reference"].get<double>();
    double tolerance = args.contains("tolerance") ? args["tolerance"].get<double>() : _config.tolerance;

    bool result = (cmd == "SMALLER_OR_EQUAL")
        ? checkkit::smallerOrEqual(value, reference, tolerance)
        : checkkit::greaterOrEqual(value, reference, tolerance);
    spdlog::debug("{}({}, {}, {}) = {}", cmd, value, reference, tolerance, result);
    return makeOkReply(result ? "holds" : "does not hold", { {"result", result} });
}
