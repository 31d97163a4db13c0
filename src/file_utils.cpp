#include "s3downloader/file_utils.hpp"

#include <stdexcept>
#include <string>

namespace s3downloader::fileutils {

std::filesystem::path resolveLocalPath(const std::filesystem::path& root, std::string_view key) {
    std::filesystem::path relative;
    std::size_t begin = 0;
    while (begin <= key.size()) {
        std::size_t end = key.find('/', begin);
        if (end == std::string_view::npos) {
            end = key.size();
        }

        const std::string_view segment = key.substr(begin, end - begin);
        if (segment == "..") {
            throw std::invalid_argument("object key '" + std::string{key} + "' escapes the download directory");
        }
        if (!segment.empty() && segment != ".") {
            relative /= std::string{segment};
        }
        begin = end + 1;
    }

    if (relative.empty()) {
        throw std::invalid_argument("object key '" + std::string{key} + "' does not name a file");
    }
    return root / relative;
}

std::error_code ensureDirectoryExists(const std::filesystem::path& path) {
    if (path.empty()) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        // Another worker may have created it between our check and mkdir.
        std::error_code status_ec;
        if (std::filesystem::is_directory(path, status_ec)) {
            return {};
        }
    }
    return ec;
}

bool fileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

} // namespace s3downloader::fileutils
