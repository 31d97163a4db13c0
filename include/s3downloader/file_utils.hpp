#pragma once

#include <filesystem>
#include <string_view>
#include <system_error>

namespace s3downloader::fileutils {

// Maps a "/" delimited object key below root. Empty and "." segments are
// dropped; keys with ".." segments, or with nothing left, are rejected with
// std::invalid_argument.
[[nodiscard]] std::filesystem::path resolveLocalPath(const std::filesystem::path& root, std::string_view key);

// Creates path and its missing parents. Safe to call concurrently for the same
// or overlapping paths; an existing directory is not an error.
[[nodiscard]] std::error_code ensureDirectoryExists(const std::filesystem::path& path);

[[nodiscard]] bool fileExists(const std::filesystem::path& path);

} // namespace s3downloader::fileutils
