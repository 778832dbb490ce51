#include "rangepart/core/errors.h"
#include "rangepart/partition/wire-format.h"
#include <gtest/gtest.h>

using namespace rangepart;
using namespace rangepart::partition;

TEST(WireFormat, EncodesFieldsInContractOrder)
{
    PartitionDescriptor descriptor{
        "files", "transactions.txt", 0, 52428799, 0, "1762026767663"};

    EXPECT_EQ(
        encode_partition(descriptor),
        R"({"bucketName":"files","key":"transactions.txt","startByte":0,)"
        R"("endByte":52428799,"partitionNumber":0,"jobExecutionId":"1762026767663"})");
}

TEST(WireFormat, EscapesStrings)
{
    PartitionDescriptor descriptor{
        "files", "dir/\"quoted\" name.txt", 10, 20, 3, "run"};

    auto text = encode_partition(descriptor);
    EXPECT_NE(text.find(R"("key":"dir/\"quoted\" name.txt")"), std::string::npos);
    EXPECT_EQ(decode_partition(text), descriptor);
}

TEST(WireFormat, DecodesWorkerMessage)
{
    auto descriptor = decode_partition(
        R"({"bucketName":"files","key":"transactions.txt","startByte":52428800,)"
        R"("endByte":104857599,"partitionNumber":1,"jobExecutionId":"1762026767663"})");

    EXPECT_EQ(descriptor.source_id, "files");
    EXPECT_EQ(descriptor.object_key, "transactions.txt");
    EXPECT_EQ(descriptor.start_byte, 52428800u);
    EXPECT_EQ(descriptor.end_byte, 104857599u);
    EXPECT_EQ(descriptor.sequence_number, 1u);
    EXPECT_EQ(descriptor.run_id, "1762026767663");
    EXPECT_EQ(descriptor.size(), 52428800u);
}

TEST(WireFormat, DecodesEmbeddedNulInFullLength)
{
    auto descriptor = decode_partition(
        R"({"bucketName":"files","key":"a\u0000b.txt","startByte":0,)"
        R"("endByte":9,"partitionNumber":0,"jobExecutionId":"run\u00007"})");

    EXPECT_EQ(descriptor.object_key, std::string("a\0b.txt", 7));
    EXPECT_EQ(descriptor.run_id, std::string("run\0" "7", 5));
}

TEST(WireFormat, RejectsMalformedMessages)
{
    EXPECT_THROW(decode_partition("not json"), InvalidInputError);
    EXPECT_THROW(decode_partition("[1,2]"), InvalidInputError);
    EXPECT_THROW(
        decode_partition(
            R"({"bucketName":"files","key":"k","startByte":0,"partitionNumber":0,"jobExecutionId":"r"})"),
        InvalidInputError);
    EXPECT_THROW(
        decode_partition(
            R"({"bucketName":"files","key":"k","startByte":-1,"endByte":5,"partitionNumber":0,"jobExecutionId":"r"})"),
        InvalidInputError);
    EXPECT_THROW(
        decode_partition(
            R"({"bucketName":"files","key":"k","startByte":9,"endByte":5,"partitionNumber":0,"jobExecutionId":"r"})"),
        InvalidInputError);
    EXPECT_THROW(
        decode_partition(
            R"({"bucketName":7,"key":"k","startByte":0,"endByte":5,"partitionNumber":0,"jobExecutionId":"r"})"),
        InvalidInputError);
}

TEST(WireFormat, MessageKey)
{
    EXPECT_EQ(message_key(0), "partition-0");
    EXPECT_EQ(message_key(42), "partition-42");
}
