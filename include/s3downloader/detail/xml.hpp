#pragma once

#include "s3downloader/object_store.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace s3downloader::detail {

// Minimal readers for the flat, well-known documents S3 returns. Not a
// general XML parser: no attributes on the tags looked up, no CDATA.
namespace xml {

// Raw text between the first <tag> and its </tag> at or after start, or empty.
[[nodiscard]] std::string_view elementText(std::string_view document, std::string_view tag,
                                           std::size_t start = 0);

// Raw text of every <tag>...</tag> in document order.
[[nodiscard]] std::vector<std::string_view> elements(std::string_view document, std::string_view tag);

// Decodes the predefined entities and numeric character references.
[[nodiscard]] std::string decodeEntities(std::string_view text);

} // namespace xml

// ListObjectsV2 response body. Throws S3Error when a Size is malformed.
[[nodiscard]] ListPage parseListObjectsV2(std::string_view body);

struct S3ErrorBody {
    std::string code;
    std::string message;
};

// <Error><Code/><Message/></Error>; empty fields when absent.
[[nodiscard]] S3ErrorBody parseErrorBody(std::string_view body);

} // namespace s3downloader::detail
