#include "checkkit/fs_validator.hpp"
#include <string>
#include <vector>
#include <algorithm>
#include <system_error>
#include <filesystem>
#include <spdlog/spdlog.h>

#include "checkkit/error_codes.hpp"

namespace fs = std::filesystem;

namespace checkkit {

namespace {

[[noreturn]] void fail(const error_code &code, const std::string &detail) {
    spdlog::warn("{}: {}", code.what(), detail);
    throw validation_error(code, detail);
}

void requirePath(const nullable_string &path) {
    if (!path) {
        fail(error::NULL_INPUT, "Entry path is a null reference");
    }
    if (path->empty()) {
        fail(error::INVALID_INPUT, "Entry path is an empty string");
    }
}

// A path status() cannot answer for (name too long, permission denied)
// counts as absent; reason then holds the OS message.
fs::file_type entryType(const std::string &path, std::string &reason) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec && status.type() != fs::file_type::not_found) {
        reason = ec.message();
        return fs::file_type::not_found;
    }
    return status.type();
}

std::string withReason(const std::string &detail, const std::string &reason) {
    if (reason.empty()) return detail;
    return detail + " (" + reason + ")";
}

std::string joinExtensions(const std::vector<nullable_string> &extensions) {
    std::string result;
    for (const auto &ext : extensions) {
        if (!result.empty()) result += ", ";
        result += *ext;
    }
    return result;
}

} // namespace

extension_list extensions(std::initializer_list<nullable_string> items) {
    return std::vector<nullable_string>(items);
}

std::string fileExtension(const fs::path &path) {
    std::string name = path.filename().string();
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 == name.size()) {
        return "";
    }
    return name.substr(dot);
}

void validateExistingDirectory(const nullable_string &path) {
    requirePath(path);

    std::string reason;
    auto type = entryType(*path, reason);
    if (type != fs::file_type::directory) {
        if (type == fs::file_type::regular) {
            fail(error::NOT_FOUND, "Given file system entry is a file: " + *path);
        }
        fail(error::NOT_FOUND, withReason("Directory does not exist: " + *path, reason));
    }
    spdlog::debug("existing directory: {}", *path);
}

void validateNonExistingDirectory(const nullable_string &path) {
    requirePath(path);

    std::string reason;
    if (entryType(*path, reason) == fs::file_type::directory) {
        fail(error::ALREADY_EXISTS, "Directory already exists: " + *path);
    }
    spdlog::debug("non-existing directory: {}", *path);
}

void validateExtension(const nullable_string &path, const extension_list &extensions) {
    requirePath(path);

    if (!extensions) {
        fail(error::NULL_INPUT, "Extensions array is a null reference");
    }
    for (const auto &ext : *extensions) {
        if (!ext) {
            fail(error::NULL_INPUT, "One of given extensions is a null reference");
        }
        if (ext->empty()) {
            fail(error::INVALID_INPUT, "One of given extensions is an empty string");
        }
    }

    if (extensions->empty()) {
        return;
    }
    std::string extension = fileExtension(*path);
    bool allowed = std::any_of(extensions->begin(), extensions->end(),
        [&extension](const nullable_string &ext) { return *ext == extension; });
    if (!allowed) {
        fail(error::INVALID_EXTENSION, "Invalid extension: is '" + extension +
            "', but shall be one of '" + joinExtensions(*extensions) + "'");
    }
    spdlog::debug("extension '{}' accepted: {}", extension, *path);
}

void validateExistingFile(const nullable_string &path, const extension_list &extensions) {
    requirePath(path);

    std::string reason;
    auto type = entryType(*path, reason);
    if (type != fs::file_type::regular) {
        if (type == fs::file_type::directory) {
            fail(error::NOT_FOUND, "Given file system entry is a directory: " + *path);
        }
        fail(error::NOT_FOUND, withReason("File does not exist: " + *path, reason));
    }

    validateExtension(path, extensions);
}

void validateNonExistingFile(const nullable_string &path, const extension_list &extensions) {
    requirePath(path);

    std::string reason;
    if (entryType(*path, reason) == fs::file_type::regular) {
        fail(error::ALREADY_EXISTS, "Given file already exists: " + *path);
    }

    validateExtension(path, extensions);
}

} // namespace checkkit
