#pragma once

#include "rangepart/broker/broker-client.h"
#include "rangepart/core/logger.h"
#include "rangepart/partition/types.h"
#include "rangepart/storage/object-store.h"

#include <functional>

namespace rangepart::partition {

/**
 * Splits one object into record-aligned byte ranges and publishes them.
 *
 * The boundary walk is sequential, but each descriptor is handed to the
 * broker without waiting for its acknowledgement, so probing the next
 * boundary overlaps with delivery of the previous partition. The run is
 * Completed only if every publish is acknowledged; a single failure aborts
 * the whole run.
 *
 * Stateless between runs; one instance may serve concurrent runs provided
 * the store and broker client are thread-safe.
 */
class RangePartitioner
{
public:
    // Observer invoked for every descriptor as it is emitted
    using PartitionObserver = std::function<void(PartitionDescriptor const&)>;

    /**
     * @throws ConfigError if the options are invalid
     */
    RangePartitioner(
        storage::ObjectStore& store,
        broker::BrokerClient& broker,
        PartitionerOptions options);

    /**
     * Partition and publish one object.
     *
     * @param cancel Optional stop flag, checked before every partition
     * @return Completed, or Aborted on publish failure or cancellation
     * @throws InvalidInputError for a malformed request or an empty object
     * @throws StorageError if the object size cannot be determined
     */
    RunOutcome
    run(const RunRequest& request,
        const CancellationToken* cancel = nullptr) const;

    void
    set_observer(PartitionObserver observer)
    {
        observer_ = std::move(observer);
    }

    const PartitionerOptions&
    options() const
    {
        return options_;
    }

    static LogPartition&
    get_log_partition();

private:
    storage::ObjectStore& store_;
    broker::BrokerClient& broker_;
    PartitionerOptions options_;
    PartitionObserver observer_;
};

// @throws InvalidInputError when a field is empty or blank
void
validate_request(const RunRequest& request);

}  // namespace rangepart::partition
