#include "rangepart/core/http-client.h"
#include "rangepart/core/errors.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/system/system_error.hpp>

#include <string_view>

namespace rangepart::http {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

std::string
Endpoint::host_header() const
{
    return port == "80" ? host : host + ":" + port;
}

Endpoint
parse_endpoint(const std::string& url)
{
    constexpr std::string_view scheme = "http://";
    if (url.rfind(scheme, 0) != 0)
    {
        throw ConfigError("Endpoint must start with http://: " + url);
    }

    std::string rest = url.substr(scheme.size());
    Endpoint endpoint;

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos)
    {
        endpoint.base_path = rest.substr(slash);
        while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/')
        {
            endpoint.base_path.pop_back();
        }
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos)
    {
        endpoint.port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (endpoint.port.empty() ||
            endpoint.port.find_first_not_of("0123456789") != std::string::npos)
        {
            throw ConfigError("Invalid port in endpoint: " + url);
        }
    }

    if (authority.empty())
    {
        throw ConfigError("Endpoint has no host: " + url);
    }
    endpoint.host = authority;
    return endpoint;
}

namespace {

// Runs the io_context until the pending operation completes, then rethrows
// its error
void
run_step(asio::io_context& ioc, beast::error_code const& ec, const char* what)
{
    ioc.run();
    ioc.restart();
    if (ec)
    {
        throw boost::system::system_error(ec, what);
    }
}

}  // namespace

Response
perform(
    const Endpoint& endpoint,
    beast_http::request<beast_http::string_body> request,
    std::chrono::milliseconds timeout,
    std::uint64_t body_limit)
{
    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    tcp::resolver::results_type results;
    resolver.async_resolve(
        endpoint.host,
        endpoint.port,
        [&](beast::error_code e, tcp::resolver::results_type r) {
            ec = e;
            results = std::move(r);
        });
    run_step(ioc, ec, "resolve");

    stream.expires_after(timeout);
    stream.async_connect(
        results, [&](beast::error_code e, tcp::endpoint const&) { ec = e; });
    run_step(ioc, ec, "connect");

    request.set(beast_http::field::host, endpoint.host_header());
    request.prepare_payload();

    stream.expires_after(timeout);
    beast_http::async_write(
        stream, request, [&](beast::error_code e, std::size_t) { ec = e; });
    run_step(ioc, ec, "write");

    beast::flat_buffer buffer;
    beast_http::response_parser<beast_http::string_body> parser;
    parser.body_limit(body_limit);
    if (request.method() == beast_http::verb::head)
    {
        parser.skip(true);
    }

    stream.expires_after(timeout);
    beast_http::async_read(
        stream, buffer, parser, [&](beast::error_code e, std::size_t) {
            ec = e;
        });
    run_step(ioc, ec, "read");

    auto& message = parser.get();
    Response response;
    response.status = message.result_int();
    if (auto it = message.find(beast_http::field::content_length);
        it != message.end())
    {
        try
        {
            response.content_length = std::stoull(std::string(it->value()));
        }
        catch (const std::exception&)
        {
            response.content_length.reset();
        }
    }
    response.body = std::move(message.body());

    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    return response;
}

}  // namespace rangepart::http
