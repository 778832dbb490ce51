#include "rangepart/partition/wire-format.h"
#include "rangepart/core/errors.h"

#include <boost/json.hpp>

namespace rangepart::partition {

namespace json = boost::json;

std::string
encode_partition(const PartitionDescriptor& descriptor)
{
    // json::object keeps insertion order, which fixes the field order
    json::object obj;
    obj["bucketName"] = descriptor.source_id;
    obj["key"] = descriptor.object_key;
    obj["startByte"] = descriptor.start_byte;
    obj["endByte"] = descriptor.end_byte;
    obj["partitionNumber"] = descriptor.sequence_number;
    obj["jobExecutionId"] = descriptor.run_id;
    return json::serialize(obj);
}

namespace {

std::uint64_t
get_uint(json::object const& obj, const char* field)
{
    auto const* value = obj.if_contains(field);
    if (!value)
    {
        throw InvalidInputError(
            std::string("Partition message missing ") + field);
    }
    if (value->is_uint64())
    {
        return value->as_uint64();
    }
    if (value->is_int64() && value->as_int64() >= 0)
    {
        return static_cast<std::uint64_t>(value->as_int64());
    }
    throw InvalidInputError(
        std::string("Partition message field ") + field +
        " is not a non-negative integer");
}

std::string
get_string(json::object const& obj, const char* field)
{
    auto const* value = obj.if_contains(field);
    if (!value || !value->is_string())
    {
        throw InvalidInputError(
            std::string("Partition message missing string ") + field);
    }
    return std::string(value->as_string());
}

}  // namespace

PartitionDescriptor
decode_partition(const std::string& text)
{
    boost::system::error_code ec;
    auto parsed = json::parse(text, ec);
    if (ec || !parsed.is_object())
    {
        throw InvalidInputError("Partition message is not a JSON object");
    }
    auto const& obj = parsed.as_object();

    PartitionDescriptor descriptor;
    descriptor.source_id = get_string(obj, "bucketName");
    descriptor.object_key = get_string(obj, "key");
    descriptor.start_byte = get_uint(obj, "startByte");
    descriptor.end_byte = get_uint(obj, "endByte");
    descriptor.sequence_number = get_uint(obj, "partitionNumber");
    descriptor.run_id = get_string(obj, "jobExecutionId");
    if (descriptor.end_byte < descriptor.start_byte)
    {
        throw InvalidInputError("Partition message has endByte < startByte");
    }
    return descriptor;
}

std::string
message_key(std::uint64_t sequence_number)
{
    return "partition-" + std::to_string(sequence_number);
}

}  // namespace rangepart::partition
