#pragma once

#include "rangepart/broker/broker-client.h"
#include "rangepart/core/http-client.h"
#include "rangepart/core/logger.h"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

namespace rangepart::broker {

struct HttpBrokerConfig
{
    /** REST proxy base URL, e.g. http://localhost:8082 */
    std::string url;

    /** Extra attempts after a retryable failure */
    unsigned retries = 3;

    /** Messages accepted but not yet settled; beyond this send() rejects */
    std::size_t max_in_flight = 1024;

    std::size_t threads = 4;

    std::chrono::milliseconds timeout{30000};

    std::chrono::milliseconds retry_backoff{200};
};

/**
 * Producer for a Kafka REST proxy (v2 JSON API).
 *
 * Each message is POSTed to `/topics/<topic>` as a single-record batch on a
 * worker thread. 2xx is an acknowledgement; connection errors, timeouts,
 * 408, 429 and 5xx are retried with linear backoff; any other status fails
 * the message immediately.
 */
class HttpBrokerClient : public BrokerClient
{
public:
    explicit HttpBrokerClient(HttpBrokerConfig config);
    ~HttpBrokerClient() override;

    HttpBrokerClient(const HttpBrokerClient&) = delete;
    HttpBrokerClient&
    operator=(const HttpBrokerClient&) = delete;

    void
    send(
        const std::string& topic,
        const std::string& key,
        const std::string& payload,
        DeliveryCallback on_delivery) override;

    // Wait for in-flight messages; later sends are rejected
    void
    close();

    std::size_t
    in_flight() const
    {
        return in_flight_.load();
    }

    static LogPartition&
    get_log_partition();

    // Body of the produce request for one record; payload is spliced in
    // verbatim so the message bytes match the wire format exactly
    static std::string
    produce_body(const std::string& key, const std::string& payload);

private:
    DeliveryReport
    deliver(
        const std::string& topic,
        const std::string& key,
        const std::string& payload);

    HttpBrokerConfig config_;
    http::Endpoint endpoint_;
    std::atomic<std::size_t> in_flight_{0};
    // Guards closed_ and every post to pool_
    std::mutex state_mutex_;
    bool closed_ = false;
    boost::asio::thread_pool pool_;
};

}  // namespace rangepart::broker
