#pragma once

#include <ctime>
#include <map>
#include <string>
#include <string_view>

namespace s3downloader::detail {

inline constexpr std::string_view kUnsignedPayload = "UNSIGNED-PAYLOAD";

[[nodiscard]] std::string sha256Hex(std::string_view data);
[[nodiscard]] std::string hmacSha256(std::string_view key, std::string_view data);
[[nodiscard]] std::string toHex(std::string_view bytes);

// RFC 3986 percent-encoding as SigV4 wants it: unreserved characters are kept,
// everything else becomes %XX. '/' is kept unless encode_slash is set.
[[nodiscard]] std::string uriEncode(std::string_view value, bool encode_slash);

// Encoded "k=v&k=v" sorted by key; empty values keep their '='.
[[nodiscard]] std::string canonicalQueryString(const std::map<std::string, std::string>& params);

// 20150830T123600Z, in UTC.
[[nodiscard]] std::string formatAmzDate(std::time_t time);

struct SigningRequest {
    std::string method;
    std::string canonical_uri;    // already encoded
    std::string canonical_query;  // already encoded and sorted
    std::map<std::string, std::string> headers;  // lower-case names, every one is signed
    std::string payload_hash;
    std::string amz_date;
};

// AWS Signature Version 4 with HMAC-SHA256.
class SigV4Signer {
public:
    SigV4Signer(std::string access_key_id, std::string secret_access_key, std::string region,
                std::string service = "s3");

    [[nodiscard]] static std::string canonicalRequest(const SigningRequest& request);
    [[nodiscard]] static std::string signedHeaders(const SigningRequest& request);

    [[nodiscard]] std::string credentialScope(const std::string& date_stamp) const;
    [[nodiscard]] std::string stringToSign(const SigningRequest& request) const;
    [[nodiscard]] std::string signature(const SigningRequest& request) const;

    // Value of the Authorization header.
    [[nodiscard]] std::string authorization(const SigningRequest& request) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

} // namespace s3downloader::detail
