#pragma once

#include <string>

namespace s3downloader::cli {

// Upper bounds of the numeric command line options.
inline constexpr long kMaxWorkers = 4096;
inline constexpr long kMaxPartSizeMiB = 5 * 1024;  // largest S3 part
inline constexpr long kMaxPartConcurrency = 1000;
inline constexpr long kMaxTimeoutSeconds = 7 * 24 * 3600;

// Parses value as an integer in [1, max_value]. Throws std::invalid_argument
// naming option otherwise.
[[nodiscard]] long parseBoundedOption(const std::string& option, const std::string& value, long max_value);

} // namespace s3downloader::cli
