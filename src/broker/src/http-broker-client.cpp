#include "rangepart/broker/http-broker-client.h"
#include "rangepart/core/errors.h"

#include <boost/asio/post.hpp>
#include <boost/json.hpp>
#include <boost/system/system_error.hpp>

#include <thread>

namespace rangepart::broker {

namespace beast_http = http::beast_http;
namespace json = boost::json;

namespace {

bool
retryable_status(unsigned status)
{
    return status == 408 || status == 429 || status >= 500;
}

}  // namespace

LogPartition&
HttpBrokerClient::get_log_partition()
{
    static LogPartition partition("broker");
    return partition;
}

HttpBrokerClient::HttpBrokerClient(HttpBrokerConfig config)
    : config_(std::move(config))
    , endpoint_(http::parse_endpoint(config_.url))
    , pool_(config_.threads == 0 ? 1 : config_.threads)
{
    OLOGI("Publishing to REST proxy at ", config_.url, " (", config_.threads,
          " threads, max in flight ", config_.max_in_flight, ")");
}

HttpBrokerClient::~HttpBrokerClient()
{
    close();
}

void
HttpBrokerClient::close()
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_)
            return;
        closed_ = true;
    }
    pool_.join();
}

std::string
HttpBrokerClient::produce_body(
    const std::string& key,
    const std::string& payload)
{
    return R"({"records":[{"key":)" + json::serialize(json::string(key)) +
        R"(,"value":)" + payload + "}]}";
}

void
HttpBrokerClient::send(
    const std::string& topic,
    const std::string& key,
    const std::string& payload,
    DeliveryCallback on_delivery)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (closed_)
    {
        throw BrokerError("Broker client is closed");
    }
    if (in_flight_.fetch_add(1) >= config_.max_in_flight)
    {
        --in_flight_;
        throw BrokerError(
            "Producer queue full (" + std::to_string(config_.max_in_flight) +
            " in flight), rejecting " + key);
    }

    boost::asio::post(
        pool_, [this, topic, key, payload, cb = std::move(on_delivery)]() {
            DeliveryReport report;
            try
            {
                report = deliver(topic, key, payload);
            }
            catch (const std::exception& e)
            {
                report.ok = false;
                report.error = e.what();
            }
            --in_flight_;
            try
            {
                cb(report);
            }
            catch (const std::exception& e)
            {
                OLOGE("Delivery callback for ", key, " threw: ", e.what());
            }
        });
}

DeliveryReport
HttpBrokerClient::deliver(
    const std::string& topic,
    const std::string& key,
    const std::string& payload)
{
    const std::string target = endpoint_.base_path + "/topics/" + topic;
    DeliveryReport report;

    for (unsigned attempt = 0; attempt <= config_.retries; ++attempt)
    {
        if (attempt > 0)
        {
            std::this_thread::sleep_for(config_.retry_backoff * attempt);
        }

        beast_http::request<beast_http::string_body> request{
            beast_http::verb::post, target, 11};
        request.set(
            beast_http::field::content_type,
            "application/vnd.kafka.json.v2+json");
        request.set(
            beast_http::field::accept, "application/vnd.kafka.v2+json");
        request.body() = produce_body(key, payload);

        try
        {
            auto response =
                http::perform(endpoint_, std::move(request), config_.timeout);
            if (response.status >= 200 && response.status < 300)
            {
                OLOGD("Delivered ", key, " to ", topic);
                report.ok = true;
                report.error.clear();
                return report;
            }
            report.error = "HTTP " + std::to_string(response.status) + ": " +
                response.body;
            if (!retryable_status(response.status))
            {
                break;
            }
        }
        catch (const boost::system::system_error& e)
        {
            report.error = e.what();
        }

        OLOGW("Attempt ", attempt + 1, " to deliver ", key, " failed: ",
              report.error);
    }

    OLOGE("Giving up on ", key, " for topic ", topic, ": ", report.error);
    return report;
}

}  // namespace rangepart::broker
