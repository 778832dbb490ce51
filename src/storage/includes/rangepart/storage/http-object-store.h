#pragma once

#include "rangepart/core/http-client.h"
#include "rangepart/core/logger.h"
#include "rangepart/storage/object-store.h"
#include "rangepart/storage/sigv4.h"

#include <chrono>
#include <string>

namespace rangepart::storage {

struct HttpStoreConfig
{
    /** S3-compatible endpoint, e.g. http://localhost:9000 (path-style) */
    std::string endpoint;

    /** Region used in the signature scope */
    std::string region = "us-east-1";

    /** Requests are unsigned when either key is empty */
    SigV4Credentials credentials;

    std::chrono::milliseconds timeout{30000};
};

/**
 * Object store speaking the S3 REST protocol over plain HTTP.
 *
 * Uses HEAD for metadata and ranged GET for reads; each call opens its own
 * connection so the store can be shared between runs without locking.
 */
class HttpObjectStore : public ObjectStore
{
public:
    explicit HttpObjectStore(HttpStoreConfig config);

    ObjectMetadata
    head(const std::string& source_id, const std::string& object_key)
        override;

    std::vector<std::uint8_t>
    read_range(
        const std::string& source_id,
        const std::string& object_key,
        std::uint64_t first,
        std::uint64_t last) override;

    static LogPartition&
    get_log_partition();

private:
    http::Response
    send(
        http::beast_http::verb method,
        const std::string& source_id,
        const std::string& object_key,
        const std::string& range);

    HttpStoreConfig config_;
    http::Endpoint endpoint_;
};

}  // namespace rangepart::storage
