#include "s3downloader/cli_options.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace s3downloader::cli {

long parseBoundedOption(const std::string& option, const std::string& value, long max_value) {
    long parsed = 0;
    try {
        std::size_t consumed = 0;
        parsed = std::stol(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::logic_error&) {
        // std::stol reports garbage and overflow alike.
        throw std::invalid_argument(fmt::format("Invalid value for {}: {}", option, value));
    }
    if (parsed <= 0 || parsed > max_value) {
        throw std::invalid_argument(
            fmt::format("Value for {} must be between 1 and {}: {}", option, max_value, value));
    }
    return parsed;
}

} // namespace s3downloader::cli
