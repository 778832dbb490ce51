#include "rangepart/partition/boundary-resolver.h"
#include "rangepart/core/errors.h"

#include <algorithm>

namespace rangepart::partition {

LogPartition&
BoundaryResolver::get_log_partition()
{
    static LogPartition partition("boundary");
    return partition;
}

BoundaryResolver::BoundaryResolver(
    storage::ObjectStore& store,
    std::string source_id,
    std::string object_key,
    const PartitionerOptions& options)
    : store_(store)
    , source_id_(std::move(source_id))
    , object_key_(std::move(object_key))
    , window_(options.boundary_probe_window_bytes)
    , terminator_(options.record_terminator)
    , probe_retries_(options.probe_retries)
{
    if (window_ == 0)
    {
        throw ConfigError("Boundary probe window must be greater than zero");
    }
}

std::vector<std::uint8_t>
BoundaryResolver::read_window(std::uint64_t first, std::uint64_t last) const
{
    for (unsigned attempt = 0;; ++attempt)
    {
        try
        {
            return store_.read_range(source_id_, object_key_, first, last);
        }
        catch (const StorageError& e)
        {
            if (!e.retryable() || attempt >= probe_retries_)
                throw;
            OLOGW(
                "Probe read ",
                first,
                "-",
                last,
                " failed (attempt ",
                attempt + 1,
                "), retrying: ",
                e.what());
        }
    }
}

BoundaryResolution
BoundaryResolver::resolve(std::uint64_t proposed_end, std::uint64_t object_size)
    const
{
    if (object_size == 0)
    {
        throw InvalidInputError("Cannot resolve a boundary in an empty object");
    }

    const std::uint64_t last_byte = object_size - 1;
    if (proposed_end >= last_byte)
    {
        return {last_byte, BoundaryCondition::EndOfObject, {}};
    }

    // Inclusive window [proposed_end, window_last], clamped to the object
    const std::uint64_t window_last = (last_byte - proposed_end < window_)
        ? last_byte
        : proposed_end + window_ - 1;

    std::vector<std::uint8_t> window;
    try
    {
        window = read_window(proposed_end, window_last);
    }
    catch (const std::exception& e)
    {
        std::string detail = "probe read " + std::to_string(proposed_end) +
            "-" + std::to_string(window_last) + " failed: " + e.what();
        OLOGW(
            "Boundary probe failed at ",
            proposed_end,
            ", keeping unaligned cut: ",
            e.what());
        return {proposed_end, BoundaryCondition::ProbeFailed, detail};
    }

    auto it = std::find(window.begin(), window.end(), terminator_);
    if (it != window.end())
    {
        auto end = proposed_end +
            static_cast<std::uint64_t>(std::distance(window.begin(), it));
        OLOGD("Adjusted partition boundary from ", proposed_end, " to ", end);
        return {end, BoundaryCondition::Aligned, {}};
    }

    if (window_last == last_byte)
    {
        // Final record has no terminator; the partition absorbs the rest of
        // the object
        OLOGD(
            "No terminator between ",
            proposed_end,
            " and end of object, extending to ",
            last_byte);
        return {last_byte, BoundaryCondition::EndOfObject, {}};
    }

    std::string detail = "no terminator within " + std::to_string(window_) +
        " bytes after " + std::to_string(proposed_end);
    OLOGW(
        "No terminator found within ",
        window_,
        " bytes after position ",
        proposed_end,
        ", using window end ",
        window_last);
    return {window_last, BoundaryCondition::NotFound, detail};
}

}  // namespace rangepart::partition
