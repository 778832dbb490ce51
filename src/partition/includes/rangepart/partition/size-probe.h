#pragma once

#include "rangepart/core/logger.h"
#include "rangepart/storage/object-store.h"

#include <cstdint>
#include <string>

namespace rangepart::partition {

// Object size lookup; called once at the start of every run
class SizeProbe
{
public:
    explicit SizeProbe(storage::ObjectStore& store) : store_(store)
    {
    }

    /**
     * @throws StorageError (NotFound, AccessDenied, TransientIO)
     */
    std::uint64_t
    size(const std::string& source_id, const std::string& object_key) const;

    static LogPartition&
    get_log_partition();

private:
    storage::ObjectStore& store_;
};

}  // namespace rangepart::partition
