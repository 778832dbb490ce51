#pragma once

#include "rangepart/core/errors.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rangepart::partition {

inline constexpr std::uint64_t DEFAULT_PARTITION_TARGET_SIZE =
    50ull * 1024 * 1024;
inline constexpr std::uint64_t DEFAULT_PROBE_WINDOW = 1024 * 1024;
inline constexpr std::uint8_t DEFAULT_RECORD_TERMINATOR = '\n';

/**
 * One unit of downstream work: the inclusive byte range
 * [start_byte, end_byte] of an object, labelled with its position in the run.
 */
struct PartitionDescriptor
{
    std::string source_id;
    std::string object_key;
    std::uint64_t start_byte = 0;
    std::uint64_t end_byte = 0;
    std::uint64_t sequence_number = 0;
    std::string run_id;

    std::uint64_t
    size() const
    {
        return end_byte - start_byte + 1;
    }

    bool
    operator==(const PartitionDescriptor&) const = default;
};

// Input to a run; run_id is unique per logical attempt
struct RunRequest
{
    std::string source_id;
    std::string object_key;
    std::string run_id;
};

enum class RunStatus { Completed, Aborted, Skipped };

enum class SkipReason { None, AlreadyRunning, AlreadyCompleted };

enum class BoundaryCondition {
    Aligned,      // cut placed on a terminator
    EndOfObject,  // partition runs to the last byte of the object
    NotFound,     // no terminator inside the probe window
    ProbeFailed   // the window could not be read
};

std::string_view
to_string(RunStatus status);

std::string_view
to_string(SkipReason reason);

std::string_view
to_string(BoundaryCondition condition);

// A partition end that is not known to fall on a record boundary
struct BoundaryWarning
{
    std::uint64_t sequence_number = 0;
    std::uint64_t proposed_end = 0;
    std::uint64_t resolved_end = 0;
    BoundaryCondition condition = BoundaryCondition::NotFound;
    std::string detail;
};

/**
 * Terminal result of a run, produced once per submitted request.
 */
struct RunOutcome
{
    RunStatus status = RunStatus::Aborted;
    SkipReason skip_reason = SkipReason::None;
    ErrorKind error = ErrorKind::None;
    std::optional<std::string> cause;

    std::uint64_t partition_count = 0;
    std::uint32_t failed_publish_count = 0;
    std::vector<std::uint64_t> failed_partitions;
    std::vector<BoundaryWarning> warnings;

    std::string run_id;
    std::string source_id;
    std::string object_key;
    std::uint64_t object_size = 0;
    std::chrono::milliseconds elapsed{0};

    static RunOutcome
    skipped(const RunRequest& request, SkipReason reason);

    static RunOutcome
    aborted(const RunRequest& request, ErrorKind error, std::string cause);
};

struct PartitionerOptions
{
    std::uint64_t partition_target_size_bytes = DEFAULT_PARTITION_TARGET_SIZE;
    std::uint64_t boundary_probe_window_bytes = DEFAULT_PROBE_WINDOW;
    std::uint8_t record_terminator = DEFAULT_RECORD_TERMINATOR;

    /** Extra attempts for a probe read failing with TransientIO */
    unsigned probe_retries = 0;

    /** Broker topic partitions are published to */
    std::string topic = "file-partitions";

    /** Upper bound on waiting for outstanding acknowledgements */
    std::chrono::milliseconds settle_timeout{120000};

    // @throws ConfigError
    void
    validate() const;
};

/**
 * Externally owned stop flag, checked once per partition by the
 * partitioner.
 */
class CancellationToken
{
public:
    void
    cancel()
    {
        cancelled_.store(true);
    }

    bool
    cancelled() const
    {
        return cancelled_.load();
    }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace rangepart::partition
