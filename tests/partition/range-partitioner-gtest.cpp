#include "rangepart/core/errors.h"
#include "rangepart/partition/range-partitioner.h"
#include "rangepart/partition/wire-format.h"
#include "rangepart/test-utils/fakes.h"
#include "rangepart/test-utils/test-utils.h"
#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>

using namespace rangepart;
using namespace rangepart::partition;
using rangepart::testing::RecordingBrokerClient;
using rangepart::testing::SparseObjectStore;

namespace {

const RunRequest REQUEST{"files", "transactions.txt", "1762026767663"};

std::vector<PartitionDescriptor>
published(RecordingBrokerClient const& client)
{
    std::vector<PartitionDescriptor> out;
    for (auto const& message : client.messages())
    {
        out.push_back(decode_partition(message.payload));
    }
    return out;
}

PartitionerOptions
small_options(std::uint64_t target, std::uint64_t window)
{
    PartitionerOptions options;
    options.partition_target_size_bytes = target;
    options.boundary_probe_window_bytes = window;
    options.settle_timeout = std::chrono::milliseconds(2000);
    return options;
}

// Partitions are contiguous, start at 0 and end on the last byte
void
expect_exact_cover(
    std::vector<PartitionDescriptor> const& partitions,
    std::uint64_t object_size)
{
    ASSERT_FALSE(partitions.empty());
    EXPECT_EQ(partitions.front().start_byte, 0u);
    EXPECT_EQ(partitions.back().end_byte, object_size - 1);
    for (std::size_t i = 0; i < partitions.size(); ++i)
    {
        EXPECT_EQ(partitions[i].sequence_number, i);
        EXPECT_LE(partitions[i].start_byte, partitions[i].end_byte);
        if (i > 0)
        {
            EXPECT_EQ(partitions[i].start_byte, partitions[i - 1].end_byte + 1);
        }
    }
}

}  // namespace

TEST(RangePartitioner, LargeFileCutsOnRecordBoundaries)
{
    SparseObjectStore store(106428389, {52428856, 104857712});
    RecordingBrokerClient broker;
    RangePartitioner partitioner(store, broker, PartitionerOptions{});

    auto outcome = partitioner.run(REQUEST);

    EXPECT_EQ(outcome.status, RunStatus::Completed);
    EXPECT_EQ(outcome.error, ErrorKind::None);
    EXPECT_EQ(outcome.partition_count, 3u);
    EXPECT_EQ(outcome.failed_publish_count, 0u);
    EXPECT_TRUE(outcome.warnings.empty());
    EXPECT_EQ(outcome.object_size, 106428389u);

    auto partitions = published(broker);
    ASSERT_EQ(partitions.size(), 3u);
    EXPECT_EQ(partitions[0].start_byte, 0u);
    EXPECT_EQ(partitions[0].end_byte, 52428856u);
    EXPECT_EQ(partitions[1].start_byte, 52428857u);
    EXPECT_EQ(partitions[1].end_byte, 104857712u);
    EXPECT_EQ(partitions[2].start_byte, 104857713u);
    EXPECT_EQ(partitions[2].end_byte, 106428388u);
    expect_exact_cover(partitions, 106428389);

    for (auto const& partition : partitions)
    {
        EXPECT_EQ(partition.source_id, "files");
        EXPECT_EQ(partition.object_key, "transactions.txt");
        EXPECT_EQ(partition.run_id, "1762026767663");
    }
    EXPECT_EQ(store.head_calls(), 1u);
}

TEST(RangePartitioner, FileSmallerThanTargetIsOnePartition)
{
    SparseObjectStore store(10, {});
    RecordingBrokerClient broker;
    RangePartitioner partitioner(store, broker, PartitionerOptions{});

    auto outcome = partitioner.run(REQUEST);

    EXPECT_EQ(outcome.status, RunStatus::Completed);
    EXPECT_EQ(outcome.partition_count, 1u);
    auto partitions = published(broker);
    ASSERT_EQ(partitions.size(), 1u);
    EXPECT_EQ(partitions[0].start_byte, 0u);
    EXPECT_EQ(partitions[0].end_byte, 9u);
    EXPECT_TRUE(store.reads().empty());
}

TEST(RangePartitioner, MessagesKeyedBySequence)
{
    SparseObjectStore store(1000, {99, 205, 299, 450, 610, 720, 850});
    RecordingBrokerClient broker;
    RangePartitioner partitioner(store, broker, small_options(100, 200));

    auto outcome = partitioner.run(REQUEST);
    ASSERT_EQ(outcome.status, RunStatus::Completed);

    auto messages = broker.messages();
    ASSERT_EQ(messages.size(), outcome.partition_count);
    for (std::size_t i = 0; i < messages.size(); ++i)
    {
        EXPECT_EQ(messages[i].key, "partition-" + std::to_string(i));
        EXPECT_EQ(messages[i].topic, "file-partitions");
    }
}

TEST(RangePartitioner, EveryCutEndsAfterATerminator)
{
    std::vector<std::string> records;
    for (int i = 0; i < 200; ++i)
    {
        records.push_back("txn-" + std::to_string(i) + std::string(i % 17, 'a'));
    }
    const std::string text = make_records(records);
    auto store = SparseObjectStore::from_text(text);
    RecordingBrokerClient broker;
    RangePartitioner partitioner(store, broker, small_options(64, 64));

    auto outcome = partitioner.run(REQUEST);

    ASSERT_EQ(outcome.status, RunStatus::Completed);
    EXPECT_TRUE(outcome.warnings.empty());
    auto partitions = published(broker);
    expect_exact_cover(partitions, text.size());
    for (auto const& partition : partitions)
    {
        EXPECT_EQ(text[partition.end_byte], '\n')
            << "partition " << partition.sequence_number;
        if (partition.sequence_number + 1 < partitions.size())
        {
            EXPECT_GE(partition.size(), 64u);
        }
    }
}

TEST(RangePartitioner, MissingTerminatorDegradesWithWarning)
{
    // Records longer than the probe window
    SparseObjectStore store(1000, {600});
    RecordingBrokerClient broker;
    RangePartitioner partitioner(store, broker, small_options(100, 50));

    auto outcome = partitioner.run(REQUEST);

    EXPECT_EQ(outcome.status, RunStatus::Completed);
    ASSERT_FALSE(outcome.warnings.empty());
    auto const& warning = outcome.warnings.front();
    EXPECT_EQ(warning.sequence_number, 0u);
    EXPECT_EQ(warning.proposed_end, 99u);
    EXPECT_EQ(warning.resolved_end, 148u);
    EXPECT_EQ(warning.condition, BoundaryCondition::NotFound);

    auto partitions = published(broker);
    EXPECT_EQ(partitions[0].end_byte, 148u);
    expect_exact_cover(partitions, 1000);
}

TEST(RangePartitioner, ProbeFailureKeepsNominalCut)
{
    SparseObjectStore store(1000, {120, 230});
    store.fail_reads_covering(99, 99, ErrorKind::TransientIO);
    RecordingBrokerClient broker;
    RangePartitioner partitioner(store, broker, small_options(100, 50));

    auto outcome = partitioner.run(REQUEST);

    EXPECT_EQ(outcome.status, RunStatus::Completed);
    ASSERT_FALSE(outcome.warnings.empty());
    EXPECT_EQ(outcome.warnings[0].sequence_number, 0u);
    EXPECT_EQ(outcome.warnings[0].condition, BoundaryCondition::ProbeFailed);
    auto partitions = published(broker);
    EXPECT_EQ(partitions[0].end_byte, 99u);
    EXPECT_EQ(partitions[1].start_byte, 100u);
    expect_exact_cover(partitions, 1000);
}

TEST(RangePartitioner, TargetLargerThanAddressSpace)
{
    SparseObjectStore store(100, {});
    RecordingBrokerClient broker;
    PartitionerOptions options;
    options.partition_target_size_bytes =
        std::numeric_limits<std::uint64_t>::max();
    RangePartitioner partitioner(store, broker, options);

    auto outcome = partitioner.run(REQUEST);

    EXPECT_EQ(outcome.status, RunStatus::Completed);
    ASSERT_EQ(outcome.partition_count, 1u);
    EXPECT_EQ(published(broker)[0].end_byte, 99u);
}

TEST(RangePartitioner, OneFailedPublishAbortsRun)
{
    SparseObjectStore store(1000, {99, 199, 299, 399, 499, 599, 699, 799, 899});
    RecordingBrokerClient broker;
    broker.fail_delivery(4, "leader not available");
    RangePartitioner partitioner(store, broker, small_options(100, 10));

    auto outcome = partitioner.run(REQUEST);

    EXPECT_EQ(outcome.status, RunStatus::Aborted);
    EXPECT_EQ(outcome.error, ErrorKind::PublishFailure);
    EXPECT_EQ(outcome.partition_count, 10u);
    EXPECT_EQ(outcome.failed_publish_count, 1u);
    EXPECT_EQ(outcome.failed_partitions, std::vector<std::uint64_t>{4});
    ASSERT_TRUE(outcome.cause);
    EXPECT_NE(outcome.cause->find("leader not available"), std::string::npos);
    // The remaining partitions were still published
    EXPECT_EQ(broker.messages().size(), 10u);
}

TEST(RangePartitioner, RejectedSendAbortsRun)
{
    SparseObjectStore store(300, {99, 199});
    RecordingBrokerClient broker;
    broker.reject(0);
    RangePartitioner partitioner(store, broker, small_options(100, 10));

    auto outcome = partitioner.run(REQUEST);

    EXPECT_EQ(outcome.status, RunStatus::Aborted);
    EXPECT_EQ(outcome.error, ErrorKind::PublishFailure);
    EXPECT_EQ(outcome.failed_publish_count, 1u);
    EXPECT_EQ(outcome.partition_count, 3u);
}

TEST(RangePartitioner, UnacknowledgedPublishAbortsAtSettleTimeout)
{
    SparseObjectStore store(300, {99, 199});
    RecordingBrokerClient broker;
    broker.set_deferred(true);
    auto options = small_options(100, 10);
    options.settle_timeout = std::chrono::milliseconds(50);
    RangePartitioner partitioner(store, broker, options);

    auto outcome = partitioner.run(REQUEST);

    EXPECT_EQ(outcome.status, RunStatus::Aborted);
    EXPECT_EQ(outcome.failed_publish_count, 3u);
    broker.release();
}

TEST(RangePartitioner, CancellationStopsBeforeNextPartition)
{
    SparseObjectStore store(1000, {99, 199, 299, 399, 499});
    RecordingBrokerClient broker;
    RangePartitioner partitioner(store, broker, small_options(100, 10));
    CancellationToken cancel;
    partitioner.set_observer([&cancel](PartitionDescriptor const& descriptor) {
        if (descriptor.sequence_number == 1)
        {
            cancel.cancel();
        }
    });

    auto outcome = partitioner.run(REQUEST, &cancel);

    EXPECT_EQ(outcome.status, RunStatus::Aborted);
    EXPECT_EQ(outcome.error, ErrorKind::Cancelled);
    EXPECT_EQ(outcome.partition_count, 2u);
    EXPECT_EQ(broker.messages().size(), 2u);
}

TEST(RangePartitioner, ObserverSeesEveryDescriptor)
{
    SparseObjectStore store(500, {99, 199, 299, 399});
    RecordingBrokerClient broker;
    RangePartitioner partitioner(store, broker, small_options(100, 10));
    std::vector<PartitionDescriptor> seen;
    partitioner.set_observer(
        [&seen](PartitionDescriptor const& descriptor) { seen.push_back(descriptor); });

    partitioner.run(REQUEST);

    EXPECT_EQ(seen, published(broker));
}

TEST(RangePartitioner, EmptyObjectIsInvalid)
{
    SparseObjectStore store(0, {});
    RecordingBrokerClient broker;
    RangePartitioner partitioner(store, broker, PartitionerOptions{});

    EXPECT_THROW(partitioner.run(REQUEST), InvalidInputError);
    EXPECT_TRUE(broker.messages().empty());
}

TEST(RangePartitioner, MissingObjectPropagatesStorageError)
{
    SparseObjectStore store(100, {});
    store.set_missing(true);
    RecordingBrokerClient broker;
    RangePartitioner partitioner(store, broker, PartitionerOptions{});

    try
    {
        partitioner.run(REQUEST);
        FAIL() << "expected StorageError";
    }
    catch (const StorageError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
    EXPECT_TRUE(broker.messages().empty());
}

TEST(RangePartitioner, BlankRequestFieldsRejected)
{
    SparseObjectStore store(100, {});
    RecordingBrokerClient broker;
    RangePartitioner partitioner(store, broker, PartitionerOptions{});

    EXPECT_THROW(partitioner.run({"", "k", "r"}), InvalidInputError);
    EXPECT_THROW(partitioner.run({"files", "  ", "r"}), InvalidInputError);
    EXPECT_THROW(partitioner.run({"files", "k", ""}), InvalidInputError);
    EXPECT_EQ(store.head_calls(), 0u);

    try
    {
        validate_request({" ", "k", "r"});
        FAIL() << "expected InvalidInputError";
    }
    catch (const InvalidInputError& e)
    {
        EXPECT_STREQ(e.what(), "Bucket name cannot be null or empty");
    }
}

TEST(RangePartitioner, InvalidOptionsRejected)
{
    SparseObjectStore store(100, {});
    RecordingBrokerClient broker;

    auto zero_target = small_options(0, 10);
    EXPECT_THROW(RangePartitioner(store, broker, zero_target), ConfigError);

    auto zero_window = small_options(10, 0);
    EXPECT_THROW(RangePartitioner(store, broker, zero_window), ConfigError);

    auto no_topic = small_options(10, 10);
    no_topic.topic.clear();
    EXPECT_THROW(RangePartitioner(store, broker, no_topic), ConfigError);
}
