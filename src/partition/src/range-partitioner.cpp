#include "rangepart/partition/range-partitioner.h"
#include "rangepart/partition/boundary-resolver.h"
#include "rangepart/partition/publish-sink.h"
#include "rangepart/partition/size-probe.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace rangepart::partition {

namespace {

bool
blank(const std::string& value)
{
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c);
    });
}

std::string
describe_failures(
    std::vector<PublishFailure> const& failures,
    std::uint64_t partition_count)
{
    std::ostringstream oss;
    oss << "Failed to send " << failures.size() << " of " << partition_count
        << " partitions";
    constexpr std::size_t max_listed = 10;
    for (std::size_t i = 0; i < failures.size() && i < max_listed; ++i)
    {
        oss << (i == 0 ? ": " : "; ") << "partition "
            << failures[i].sequence_number << " (" << failures[i].error << ")";
    }
    if (failures.size() > max_listed)
    {
        oss << "; ...";
    }
    return oss.str();
}

}  // namespace

void
validate_request(const RunRequest& request)
{
    if (blank(request.source_id))
    {
        throw InvalidInputError("Bucket name cannot be null or empty");
    }
    if (blank(request.object_key))
    {
        throw InvalidInputError("File key cannot be null or empty");
    }
    if (blank(request.run_id))
    {
        throw InvalidInputError("Run id cannot be empty");
    }
}

LogPartition&
RangePartitioner::get_log_partition()
{
    static LogPartition partition("partitioner");
    return partition;
}

RangePartitioner::RangePartitioner(
    storage::ObjectStore& store,
    broker::BrokerClient& broker,
    PartitionerOptions options)
    : store_(store), broker_(broker), options_(std::move(options))
{
    options_.validate();
}

RunOutcome
RangePartitioner::run(const RunRequest& request, const CancellationToken* cancel)
    const
{
    auto start_time = std::chrono::steady_clock::now();
    validate_request(request);

    const std::uint64_t object_size =
        SizeProbe(store_).size(request.source_id, request.object_key);
    if (object_size == 0)
    {
        throw InvalidInputError(
            "File size is zero: " + request.source_id + "/" +
            request.object_key);
    }

    BoundaryResolver resolver(
        store_, request.source_id, request.object_key, options_);
    PublishSink sink(broker_, options_.topic, options_.settle_timeout);

    RunOutcome outcome;
    outcome.run_id = request.run_id;
    outcome.source_id = request.source_id;
    outcome.object_key = request.object_key;
    outcome.object_size = object_size;

    const std::uint64_t target = options_.partition_target_size_bytes;
    const std::uint64_t last_byte = object_size - 1;
    std::uint64_t start = 0;
    std::uint64_t sequence = 0;
    bool cancelled = false;

    while (start < object_size)
    {
        if (cancel && cancel->cancelled())
        {
            cancelled = true;
            break;
        }

        const std::uint64_t proposed_end =
            (last_byte - start < target - 1) ? last_byte : start + target - 1;

        auto resolution = resolver.resolve(proposed_end, object_size);
        if (resolution.degraded())
        {
            outcome.warnings.push_back(
                {sequence,
                 proposed_end,
                 resolution.end,
                 resolution.condition,
                 std::move(resolution.detail)});
        }

        PartitionDescriptor descriptor{
            request.source_id,
            request.object_key,
            start,
            resolution.end,
            sequence,
            request.run_id};

        OLOGD(
            "Partition ",
            sequence,
            ": bytes ",
            descriptor.start_byte,
            "-",
            descriptor.end_byte,
            " (",
            descriptor.size(),
            " bytes)");

        if (observer_)
        {
            observer_(descriptor);
        }
        sink.publish(descriptor);

        start = resolution.end + 1;
        ++sequence;
    }

    outcome.partition_count = sequence;
    outcome.failed_publish_count = sink.await_and_count_failures();
    for (auto const& failure : sink.failures())
    {
        outcome.failed_partitions.push_back(failure.sequence_number);
    }
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    OLOGI(
        "Created ",
        sequence,
        " partitions for ",
        request.source_id,
        "/",
        request.object_key,
        " (run ",
        request.run_id,
        ")");

    for (auto const& warning : outcome.warnings)
    {
        OLOGW(
            "Partition ",
            warning.sequence_number,
            " ends at ",
            warning.resolved_end,
            " (proposed ",
            warning.proposed_end,
            "): ",
            to_string(warning.condition),
            ": ",
            warning.detail);
    }

    if (cancelled)
    {
        outcome.status = RunStatus::Aborted;
        outcome.error = ErrorKind::Cancelled;
        outcome.cause = "Cancelled after " + std::to_string(sequence) +
            " partitions (next start byte " + std::to_string(start) + ")";
        OLOGW("Run ", request.run_id, " cancelled: ", *outcome.cause);
        return outcome;
    }

    if (outcome.failed_publish_count > 0)
    {
        outcome.status = RunStatus::Aborted;
        outcome.error = ErrorKind::PublishFailure;
        outcome.cause = describe_failures(sink.failures(), sequence);
        OLOGE(*outcome.cause, ". Aborting run ", request.run_id);
        return outcome;
    }

    outcome.status = RunStatus::Completed;
    return outcome;
}

}  // namespace rangepart::partition
