#include "s3downloader/detail/sigv4.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace s3downloader::detail {

namespace {

constexpr std::string_view kAlgorithm = "AWS4-HMAC-SHA256";

bool isUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
           c == '.' || c == '~';
}

std::tm toUtc(std::time_t time) {
    std::tm utc{};
    if (!gmtime_r(&time, &utc)) {
        throw std::runtime_error("gmtime_r failed");
    }
    return utc;
}

} // namespace

std::string toHex(std::string_view bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (const char c : bytes) {
        const auto byte = static_cast<unsigned char>(c);
        hex.push_back(kDigits[byte >> 4]);
        hex.push_back(kDigits[byte & 0x0f]);
    }
    return hex;
}

std::string sha256Hex(std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return toHex(std::string_view{reinterpret_cast<const char*>(digest), length});
}

std::string hmacSha256(std::string_view key, std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &length)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return std::string{reinterpret_cast<const char*>(digest), length};
}

std::string uriEncode(std::string_view value, bool encode_slash) {
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (const char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (isUnreserved(c) || (c == '/' && !encode_slash)) {
            encoded.push_back(ch);
        } else {
            encoded += fmt::format("%{:02X}", c);
        }
    }
    return encoded;
}

std::string canonicalQueryString(const std::map<std::string, std::string>& params) {
    // Sorting on encoded names is what AWS specifies; for the parameter names
    // used here encoding does not change their order.
    std::string query;
    for (const auto& [name, value] : params) {
        if (!query.empty()) {
            query.push_back('&');
        }
        query += uriEncode(name, true);
        query.push_back('=');
        query += uriEncode(value, true);
    }
    return query;
}

std::string formatAmzDate(std::time_t time) {
    const std::tm utc = toUtc(time);
    return fmt::format("{:04}{:02}{:02}T{:02}{:02}{:02}Z", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec);
}

SigV4Signer::SigV4Signer(std::string access_key_id, std::string secret_access_key, std::string region,
                         std::string service)
    : access_key_id_(std::move(access_key_id)),
      secret_access_key_(std::move(secret_access_key)),
      region_(std::move(region)),
      service_(std::move(service)) {}

std::string SigV4Signer::signedHeaders(const SigningRequest& request) {
    std::string names;
    for (const auto& [name, value] : request.headers) {
        if (!names.empty()) {
            names.push_back(';');
        }
        names += name;
    }
    return names;
}

std::string SigV4Signer::canonicalRequest(const SigningRequest& request) {
    std::string canonical_headers;
    for (const auto& [name, value] : request.headers) {
        canonical_headers += fmt::format("{}:{}\n", name, value);
    }

    return fmt::format("{}\n{}\n{}\n{}\n{}\n{}", request.method, request.canonical_uri, request.canonical_query,
                       canonical_headers, signedHeaders(request), request.payload_hash);
}

std::string SigV4Signer::credentialScope(const std::string& date_stamp) const {
    return fmt::format("{}/{}/{}/aws4_request", date_stamp, region_, service_);
}

std::string SigV4Signer::stringToSign(const SigningRequest& request) const {
    const std::string date_stamp = request.amz_date.substr(0, 8);
    return fmt::format("{}\n{}\n{}\n{}", kAlgorithm, request.amz_date, credentialScope(date_stamp),
                       sha256Hex(canonicalRequest(request)));
}

std::string SigV4Signer::signature(const SigningRequest& request) const {
    const std::string date_stamp = request.amz_date.substr(0, 8);
    const std::string k_date = hmacSha256("AWS4" + secret_access_key_, date_stamp);
    const std::string k_region = hmacSha256(k_date, region_);
    const std::string k_service = hmacSha256(k_region, service_);
    const std::string k_signing = hmacSha256(k_service, "aws4_request");
    return toHex(hmacSha256(k_signing, stringToSign(request)));
}

std::string SigV4Signer::authorization(const SigningRequest& request) const {
    const std::string date_stamp = request.amz_date.substr(0, 8);
    return fmt::format("{} Credential={}/{}, SignedHeaders={}, Signature={}", kAlgorithm, access_key_id_,
                       credentialScope(date_stamp), signedHeaders(request), signature(request));
}

} // namespace s3downloader::detail
