#pragma once

#include "rangepart/core/logger.h"
#include "rangepart/partition/types.h"
#include "rangepart/storage/object-store.h"

#include <cstdint>
#include <string>
#include <vector>

namespace rangepart::partition {

struct BoundaryResolution
{
    std::uint64_t end = 0;
    BoundaryCondition condition = BoundaryCondition::Aligned;
    std::string detail;

    bool
    degraded() const
    {
        return condition == BoundaryCondition::NotFound ||
            condition == BoundaryCondition::ProbeFailed;
    }
};

/**
 * Moves a proposed partition end forward onto the next record terminator.
 *
 * Only a window of `boundary_probe_window_bytes` starting at the proposed
 * end is read. Failure to find or read a boundary never throws: the result
 * carries a degraded condition and a best-effort end instead.
 *
 * Results always satisfy proposed_end <= end <= object_size - 1.
 */
class BoundaryResolver
{
public:
    BoundaryResolver(
        storage::ObjectStore& store,
        std::string source_id,
        std::string object_key,
        const PartitionerOptions& options);

    /**
     * @param proposed_end Nominal last byte of the partition
     * @param object_size Size established by the run's size probe
     */
    BoundaryResolution
    resolve(std::uint64_t proposed_end, std::uint64_t object_size) const;

    static LogPartition&
    get_log_partition();

private:
    std::vector<std::uint8_t>
    read_window(std::uint64_t first, std::uint64_t last) const;

    storage::ObjectStore& store_;
    std::string source_id_;
    std::string object_key_;
    std::uint64_t window_;
    std::uint8_t terminator_;
    unsigned probe_retries_;
};

}  // namespace rangepart::partition
