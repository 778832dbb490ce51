#include "rangepart/storage/sigv4.h"
#include "rangepart/crypto/sha256-hasher.h"

#include <chrono>
#include <ctime>
#include <sstream>

namespace rangepart::storage {

namespace {

std::string
digest_string(const crypto::Sha256Digest& digest)
{
    return std::string(
        reinterpret_cast<const char*>(digest.data()), digest.size());
}

std::string
trim(const std::string& value)
{
    auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos)
    {
        return {};
    }
    auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

std::string
signed_headers(const SigV4Request& request)
{
    std::string out;
    for (auto const& [name, _] : request.headers)
    {
        if (!out.empty())
        {
            out += ';';
        }
        out += name;
    }
    return out;
}

}  // namespace

std::string
uri_encode(std::string_view input, bool encode_slash)
{
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input)
    {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
            c == '~';
        if (unreserved || (c == '/' && !encode_slash))
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0F]);
        }
    }
    return out;
}

std::string
amz_date_now()
{
    auto now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    std::tm tm_utc;
    gmtime_r(&now, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm_utc);
    return buf;
}

std::string
canonical_request(const SigV4Request& request)
{
    std::ostringstream oss;
    oss << request.method << '\n'
        << request.canonical_uri << '\n'
        << request.canonical_query << '\n';
    for (auto const& [name, value] : request.headers)
    {
        oss << name << ':' << trim(value) << '\n';
    }
    oss << '\n' << signed_headers(request) << '\n' << request.payload_hash;
    return oss.str();
}

std::string
sigv4_authorization(
    const SigV4Request& request,
    const SigV4Credentials& credentials,
    const std::string& region,
    const std::string& service,
    const std::string& amz_date)
{
    const std::string date = amz_date.substr(0, 8);
    const std::string scope =
        date + "/" + region + "/" + service + "/aws4_request";

    const std::string string_to_sign = "AWS4-HMAC-SHA256\n" + amz_date +
        "\n" + scope + "\n" +
        crypto::to_hex(crypto::sha256(canonical_request(request)));

    auto k_date =
        digest_string(crypto::hmac_sha256("AWS4" + credentials.secret_key, date));
    auto k_region = digest_string(crypto::hmac_sha256(k_date, region));
    auto k_service = digest_string(crypto::hmac_sha256(k_region, service));
    auto k_signing =
        digest_string(crypto::hmac_sha256(k_service, "aws4_request"));

    auto signature =
        crypto::to_hex(crypto::hmac_sha256(k_signing, string_to_sign));

    return "AWS4-HMAC-SHA256 Credential=" + credentials.access_key + "/" +
        scope + ",SignedHeaders=" + signed_headers(request) +
        ",Signature=" + signature;
}

}  // namespace rangepart::storage
