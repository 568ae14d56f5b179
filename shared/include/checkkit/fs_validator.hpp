#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <initializer_list>

namespace checkkit {

using nullable_string = std::optional<std::string>;
using extension_list = std::optional<std::vector<nullable_string>>;

// builds an allowed-extensions argument: extensions({".txt", ".csv"})
extension_list extensions(std::initializer_list<nullable_string> items);

// Path validation. Every function throws checkkit::validation_error on
// violation and returns normally otherwise.
//
//  NULL_INPUT        path (or the extension list, or one of its entries) is null
//  INVALID_INPUT     path or one of the extensions is an empty string
//  NOT_FOUND         entry is missing, of the wrong kind, or cannot be queried
//  ALREADY_EXISTS    entry that must not exist is present
//  INVALID_EXTENSION extension is not among the allowed ones
//
// An empty (but non-null) extension list places no restriction on the
// extension.

void validateExistingDirectory(const nullable_string &path);
void validateNonExistingDirectory(const nullable_string &path);

void validateExtension(const nullable_string &path, const extension_list &extensions = extension_list(std::in_place));
void validateExistingFile(const nullable_string &path, const extension_list &extensions = extension_list(std::in_place));
void validateNonExistingFile(const nullable_string &path, const extension_list &extensions = extension_list(std::in_place));

// final ".suffix" of the file name, empty if there is none
std::string fileExtension(const std::filesystem::path &path);

} // namespace checkkit
