#pragma once

#include "rangepart/broker/broker-client.h"
#include "rangepart/core/logger.h"
#include "rangepart/partition/types.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace rangepart::partition {

struct PublishFailure
{
    std::uint64_t sequence_number = 0;
    std::string error;
};

/**
 * Publishes the descriptors of one run and tracks their acknowledgements.
 *
 * `publish` returns as soon as the broker client has accepted the message;
 * `await_and_count_failures` is the settle point that waits for every
 * acknowledgement. A message counts as failed when the client rejects it
 * synchronously, when its delivery report is negative, or when it is still
 * unacknowledged at the settle timeout.
 */
class PublishSink
{
public:
    PublishSink(
        broker::BrokerClient& client,
        std::string topic,
        std::chrono::milliseconds settle_timeout);

    PublishSink(const PublishSink&) = delete;
    PublishSink&
    operator=(const PublishSink&) = delete;

    void
    publish(const PartitionDescriptor& descriptor);

    /**
     * Block until all submitted publishes have settled (or the settle
     * timeout expires) and return the number that failed.
     */
    std::uint32_t
    await_and_count_failures();

    std::uint64_t
    submitted() const
    {
        return submitted_;
    }

    // Failures recorded so far, ordered by sequence number
    std::vector<PublishFailure>
    failures() const;

    static LogPartition&
    get_log_partition();

private:
    // Shared with delivery callbacks, which may outlive the sink after a
    // settle timeout
    struct State
    {
        std::mutex mutex;
        std::condition_variable settled;
        std::set<std::uint64_t> pending;
        bool abandoned = false;
        std::vector<PublishFailure> failures;

        void
        complete(
            std::uint64_t sequence_number,
            broker::DeliveryReport const& report);
    };

    broker::BrokerClient& client_;
    std::string topic_;
    std::chrono::milliseconds settle_timeout_;
    std::shared_ptr<State> state_;
    std::uint64_t submitted_ = 0;
};

}  // namespace rangepart::partition
