#pragma once

#include <functional>
#include <string>

namespace rangepart::broker {

struct DeliveryReport
{
    bool ok = false;
    std::string error;
};

using DeliveryCallback = std::function<void(DeliveryReport const&)>;

/**
 * Asynchronous message producer shared by all runs.
 *
 * `send` must not block on broker acknowledgement. If it throws (a
 * BrokerError for a full queue, a closed client and the like) the message
 * was not accepted and `on_delivery` is never called. Otherwise
 * `on_delivery` is called exactly once, from any thread, when the message
 * is acknowledged or has definitively failed.
 */
class BrokerClient
{
public:
    virtual ~BrokerClient() = default;

    virtual void
    send(
        const std::string& topic,
        const std::string& key,
        const std::string& payload,
        DeliveryCallback on_delivery) = 0;
};

}  // namespace rangepart::broker
