#include "rangepart/partition/types.h"

namespace rangepart::partition {

std::string_view
to_string(RunStatus status)
{
    switch (status)
    {
        case RunStatus::Completed:
            return "Completed";
        case RunStatus::Aborted:
            return "Aborted";
        case RunStatus::Skipped:
            return "Skipped";
    }
    return "Unknown";
}

std::string_view
to_string(SkipReason reason)
{
    switch (reason)
    {
        case SkipReason::None:
            return "None";
        case SkipReason::AlreadyRunning:
            return "AlreadyRunning";
        case SkipReason::AlreadyCompleted:
            return "AlreadyCompleted";
    }
    return "Unknown";
}

std::string_view
to_string(BoundaryCondition condition)
{
    switch (condition)
    {
        case BoundaryCondition::Aligned:
            return "Aligned";
        case BoundaryCondition::EndOfObject:
            return "EndOfObject";
        case BoundaryCondition::NotFound:
            return "BoundaryNotFound";
        case BoundaryCondition::ProbeFailed:
            return "ProbeFailed";
    }
    return "Unknown";
}

RunOutcome
RunOutcome::skipped(const RunRequest& request, SkipReason reason)
{
    RunOutcome outcome;
    outcome.status = RunStatus::Skipped;
    outcome.skip_reason = reason;
    outcome.cause = std::string(to_string(reason));
    outcome.run_id = request.run_id;
    outcome.source_id = request.source_id;
    outcome.object_key = request.object_key;
    return outcome;
}

RunOutcome
RunOutcome::aborted(const RunRequest& request, ErrorKind error, std::string cause)
{
    RunOutcome outcome;
    outcome.status = RunStatus::Aborted;
    outcome.error = error;
    outcome.cause = std::move(cause);
    outcome.run_id = request.run_id;
    outcome.source_id = request.source_id;
    outcome.object_key = request.object_key;
    return outcome;
}

void
PartitionerOptions::validate() const
{
    if (partition_target_size_bytes == 0)
    {
        throw ConfigError("Partition target size must be greater than zero");
    }
    if (boundary_probe_window_bytes == 0)
    {
        throw ConfigError("Boundary probe window must be greater than zero");
    }
    if (topic.empty())
    {
        throw ConfigError("Topic must not be empty");
    }
    if (settle_timeout.count() <= 0)
    {
        throw ConfigError("Settle timeout must be positive");
    }
}

}  // namespace rangepart::partition
