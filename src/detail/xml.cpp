#include "s3downloader/detail/xml.hpp"

#include <charconv>
#include <cstdint>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace s3downloader::detail {

namespace xml {

std::string_view elementText(std::string_view document, std::string_view tag, std::size_t start) {
    const std::string open_tag = fmt::format("<{}>", tag);
    const std::string close_tag = fmt::format("</{}>", tag);

    std::size_t begin = document.find(open_tag, start);
    if (begin == std::string_view::npos) {
        return {};
    }
    begin += open_tag.size();

    const std::size_t end = document.find(close_tag, begin);
    if (end == std::string_view::npos) {
        return {};
    }
    return document.substr(begin, end - begin);
}

std::vector<std::string_view> elements(std::string_view document, std::string_view tag) {
    const std::string open_tag = fmt::format("<{}>", tag);
    const std::string close_tag = fmt::format("</{}>", tag);

    std::vector<std::string_view> found;
    std::size_t pos = 0;
    while (pos < document.size()) {
        const std::size_t begin = document.find(open_tag, pos);
        if (begin == std::string_view::npos) {
            break;
        }
        const std::size_t content = begin + open_tag.size();
        const std::size_t end = document.find(close_tag, content);
        if (end == std::string_view::npos) {
            break;
        }
        found.push_back(document.substr(content, end - content));
        pos = end + close_tag.size();
    }
    return found;
}

namespace {

void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Decodes the entity at text[0] == '&'. Returns the consumed length, or 0 when
// it is not an entity we know.
std::size_t decodeEntity(std::string_view text, std::string& out) {
    const std::size_t semicolon = text.find(';');
    if (semicolon == std::string_view::npos || semicolon > 10) {
        return 0;
    }
    const std::string_view name = text.substr(1, semicolon - 1);

    if (name == "lt") {
        out.push_back('<');
    } else if (name == "gt") {
        out.push_back('>');
    } else if (name == "amp") {
        out.push_back('&');
    } else if (name == "quot") {
        out.push_back('"');
    } else if (name == "apos") {
        out.push_back('\'');
    } else if (name.size() > 1 && name[0] == '#') {
        const bool hex = name[1] == 'x' || name[1] == 'X';
        const std::string_view digits = name.substr(hex ? 2 : 1);
        std::uint32_t cp = 0;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), cp, hex ? 16 : 10);
        if (ec != std::errc{} || ptr != digits.data() + digits.size() || digits.empty() || cp > 0x10FFFF) {
            return 0;
        }
        appendUtf8(out, cp);
    } else {
        return 0;
    }
    return semicolon + 1;
}

} // namespace

std::string decodeEntities(std::string_view text) {
    std::string decoded;
    decoded.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            if (const std::size_t consumed = decodeEntity(text.substr(i), decoded)) {
                i += consumed;
                continue;
            }
        }
        decoded.push_back(text[i++]);
    }
    return decoded;
}

} // namespace xml

ListPage parseListObjectsV2(std::string_view body) {
    ListPage page;

    for (const std::string_view contents : xml::elements(body, "Contents")) {
        ObjectDescriptor object;
        object.key = xml::decodeEntities(xml::elementText(contents, "Key"));

        const std::string_view size = xml::elementText(contents, "Size");
        const auto [ptr, ec] = std::from_chars(size.data(), size.data() + size.size(), object.size);
        if (ec != std::errc{} || ptr != size.data() + size.size() || object.size < 0) {
            throw S3Error(fmt::format("malformed Size '{}' for key '{}' in listing", size, object.key));
        }
        page.objects.push_back(std::move(object));
    }

    for (const std::string_view common : xml::elements(body, "CommonPrefixes")) {
        page.common_prefixes.push_back(xml::decodeEntities(xml::elementText(common, "Prefix")));
    }

    page.truncated = xml::elementText(body, "IsTruncated") == "true";
    page.next_continuation_token = xml::decodeEntities(xml::elementText(body, "NextContinuationToken"));
    return page;
}

S3ErrorBody parseErrorBody(std::string_view body) {
    S3ErrorBody error;
    error.code = xml::decodeEntities(xml::elementText(body, "Code"));
    error.message = xml::decodeEntities(xml::elementText(body, "Message"));
    return error;
}

} // namespace s3downloader::detail
