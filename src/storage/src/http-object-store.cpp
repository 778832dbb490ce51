#include "rangepart/storage/http-object-store.h"
#include "rangepart/core/errors.h"

#include <boost/system/system_error.hpp>

#include <string_view>

namespace rangepart::storage {

namespace beast_http = http::beast_http;

namespace {

std::string
describe(const std::string& source_id, const std::string& object_key)
{
    return "s3://" + source_id + "/" + object_key;
}

[[noreturn]] void
throw_for_status(unsigned status, const std::string& what)
{
    if (status == 404)
    {
        throw StorageError(ErrorKind::NotFound, "Object not found: " + what);
    }
    if (status == 401 || status == 403)
    {
        throw StorageError(
            ErrorKind::AccessDenied,
            "Access denied (HTTP " + std::to_string(status) + "): " + what);
    }
    throw StorageError(
        ErrorKind::TransientIO,
        "Unexpected HTTP " + std::to_string(status) + " for " + what);
}

}  // namespace

LogPartition&
HttpObjectStore::get_log_partition()
{
    static LogPartition partition("storage");
    return partition;
}

HttpObjectStore::HttpObjectStore(HttpStoreConfig config)
    : config_(std::move(config)), endpoint_(http::parse_endpoint(config_.endpoint))
{
    if (config_.credentials.empty())
    {
        OLOGI("No credentials configured, requests to ", config_.endpoint,
              " will be unsigned");
    }
}

http::Response
HttpObjectStore::send(
    beast_http::verb method,
    const std::string& source_id,
    const std::string& object_key,
    const std::string& range)
{
    if (source_id.empty() || object_key.empty())
    {
        throw InvalidInputError("Source id and object key must not be empty");
    }

    const std::string path = endpoint_.base_path + "/" +
        uri_encode(source_id, true) + "/" + uri_encode(object_key, false);

    beast_http::request<beast_http::string_body> request{method, path, 11};
    request.set(beast_http::field::user_agent, "rangepart");
    if (!range.empty())
    {
        request.set(beast_http::field::range, range);
    }

    if (!config_.credentials.empty())
    {
        const std::string amz_date = amz_date_now();
        SigV4Request sig;
        sig.method = std::string(beast_http::to_string(method));
        sig.canonical_uri = path;
        sig.payload_hash = std::string(EMPTY_PAYLOAD_SHA256);
        sig.headers["host"] = endpoint_.host_header();
        sig.headers["x-amz-content-sha256"] = sig.payload_hash;
        sig.headers["x-amz-date"] = amz_date;
        if (!range.empty())
        {
            sig.headers["range"] = range;
        }

        request.set("x-amz-content-sha256", sig.payload_hash);
        request.set("x-amz-date", amz_date);
        request.set(
            beast_http::field::authorization,
            sigv4_authorization(
                sig, config_.credentials, config_.region, "s3", amz_date));
    }

    try
    {
        return http::perform(endpoint_, std::move(request), config_.timeout);
    }
    catch (const boost::system::system_error& e)
    {
        throw StorageError(
            ErrorKind::TransientIO,
            "Request to " + endpoint_.host_header() + " failed for " +
                describe(source_id, object_key) + ": " + e.what());
    }
}

ObjectMetadata
HttpObjectStore::head(
    const std::string& source_id,
    const std::string& object_key)
{
    auto response = send(beast_http::verb::head, source_id, object_key, {});
    auto what = describe(source_id, object_key);
    if (response.status != 200)
    {
        throw_for_status(response.status, what);
    }
    if (!response.content_length)
    {
        throw StorageError(
            ErrorKind::TransientIO, "HEAD response without size for " + what);
    }

    OLOGD("head ", what, " -> ", *response.content_length, " bytes");
    return ObjectMetadata{*response.content_length};
}

std::vector<std::uint8_t>
HttpObjectStore::read_range(
    const std::string& source_id,
    const std::string& object_key,
    std::uint64_t first,
    std::uint64_t last)
{
    auto what = describe(source_id, object_key);
    if (last < first)
    {
        throw InvalidInputError(
            "Invalid range " + std::to_string(first) + "-" +
            std::to_string(last) + " for " + what);
    }

    const std::string range =
        "bytes=" + std::to_string(first) + "-" + std::to_string(last);
    auto response = send(beast_http::verb::get, source_id, object_key, range);

    std::string_view body = response.body;
    if (response.status == 200)
    {
        // Server ignored the Range header and sent the whole object
        if (first >= body.size())
        {
            throw InvalidInputError(
                "Range start " + std::to_string(first) + " beyond end of " +
                what);
        }
        body = body.substr(first, last - first + 1);
    }
    else if (response.status == 416)
    {
        throw InvalidInputError("Range not satisfiable for " + what);
    }
    else if (response.status != 206)
    {
        throw_for_status(response.status, what);
    }

    OLOGD("read ", what, " ", range, " (", body.size(), " bytes)");
    return std::vector<std::uint8_t>(body.begin(), body.end());
}

}  // namespace rangepart::storage
