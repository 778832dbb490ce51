#pragma once

#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rangepart::http {

namespace beast_http = boost::beast::http;

/**
 * Parsed `http://host[:port][/base]` endpoint.
 *
 * Only plain HTTP is supported; TLS termination is expected in front of the
 * service (sidecar or local proxy).
 */
struct Endpoint
{
    std::string host;
    std::string port = "80";
    std::string base_path;  // without trailing slash, may be empty

    // Value for the Host header ("host" or "host:port")
    std::string
    host_header() const;
};

/**
 * Parse an endpoint URL.
 * @throws ConfigError for anything that is not an http:// URL with a host
 */
Endpoint
parse_endpoint(const std::string& url);

struct Response
{
    unsigned status = 0;
    std::optional<std::uint64_t> content_length;
    std::string body;
};

/**
 * Perform one request on a fresh connection.
 *
 * Every phase (resolve, connect, write, read) is bounded by `timeout`.
 * For HEAD requests the body is skipped and only the headers are returned.
 *
 * @throws boost::system::system_error on network failures and timeouts
 */
Response
perform(
    const Endpoint& endpoint,
    beast_http::request<beast_http::string_body> request,
    std::chrono::milliseconds timeout,
    std::uint64_t body_limit = 64ull * 1024 * 1024);

}  // namespace rangepart::http
