#include "rangepart/partition/size-probe.h"

namespace rangepart::partition {

LogPartition&
SizeProbe::get_log_partition()
{
    static LogPartition partition("partitioner");
    return partition;
}

std::uint64_t
SizeProbe::size(const std::string& source_id, const std::string& object_key)
    const
{
    auto metadata = store_.head(source_id, object_key);
    OLOGI(
        "Object size: ",
        metadata.size,
        " bytes for ",
        source_id,
        "/",
        object_key);
    return metadata.size;
}

}  // namespace rangepart::partition
