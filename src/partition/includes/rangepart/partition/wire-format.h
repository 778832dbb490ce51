#pragma once

#include "rangepart/partition/types.h"

#include <cstdint>
#include <string>

namespace rangepart::partition {

/**
 * Encode a partition as the JSON message consumed by the workers:
 *
 *   {"bucketName":"files","key":"transactions.txt","startByte":0,
 *    "endByte":52428799,"partitionNumber":0,"jobExecutionId":"1762026767663"}
 *
 * Field names and order are part of the wire contract.
 */
std::string
encode_partition(const PartitionDescriptor& descriptor);

/**
 * Decode a message produced by encode_partition.
 * @throws InvalidInputError if the text is not a valid partition message
 */
PartitionDescriptor
decode_partition(const std::string& text);

// Message key for a partition: "partition-<sequence>"
std::string
message_key(std::uint64_t sequence_number);

}  // namespace rangepart::partition
