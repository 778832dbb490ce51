#pragma once

#include <map>
#include <string>
#include <string_view>

namespace rangepart::storage {

struct SigV4Credentials
{
    std::string access_key;
    std::string secret_key;

    bool
    empty() const
    {
        return access_key.empty() || secret_key.empty();
    }
};

/**
 * The parts of an HTTP request covered by an AWS Signature Version 4.
 *
 * Header names must be lowercase; every header in `headers` is signed.
 */
struct SigV4Request
{
    std::string method;
    std::string canonical_uri;
    std::string canonical_query;
    std::map<std::string, std::string> headers;
    std::string payload_hash;
};

// hex(SHA-256("")), the payload hash of every bodiless request
inline constexpr std::string_view EMPTY_PAYLOAD_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

/**
 * Percent-encode per the SigV4 rules (unreserved characters pass through).
 * When `encode_slash` is false, '/' is kept so paths stay readable.
 */
std::string
uri_encode(std::string_view input, bool encode_slash);

// Current UTC time as `YYYYMMDDTHHMMSSZ`
std::string
amz_date_now();

std::string
canonical_request(const SigV4Request& request);

/**
 * Build the `Authorization` header value.
 *
 * @param amz_date Timestamp in `YYYYMMDDTHHMMSSZ` form, matching the
 *                 x-amz-date header
 */
std::string
sigv4_authorization(
    const SigV4Request& request,
    const SigV4Credentials& credentials,
    const std::string& region,
    const std::string& service,
    const std::string& amz_date);

}  // namespace rangepart::storage
