#include "rangepart/jobs/event-envelope.h"
#include "rangepart/core/errors.h"
#include "rangepart/core/logger.h"

#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <optional>

namespace rangepart::jobs {

namespace json = boost::json;

namespace {

json::value
parse_json(const std::string& text, const char* what)
{
    boost::system::error_code ec;
    auto parsed = json::parse(text, ec);
    if (ec)
    {
        throw InvalidInputError(
            std::string("Malformed ") + what + ": " + ec.message());
    }
    return parsed;
}

std::string
string_at(json::object const& obj, const char* field)
{
    auto const* value = obj.if_contains(field);
    if (!value || !value->is_string())
    {
        return {};
    }
    return std::string(value->as_string());
}

json::object const*
object_at(json::object const& obj, const char* field)
{
    auto const* value = obj.if_contains(field);
    return (value && value->is_object()) ? &value->as_object() : nullptr;
}

int
hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::optional<ObjectRef>
object_from_record(json::value const& record)
{
    if (!record.is_object())
    {
        LOGW("Skipping non-object record in notification");
        return std::nullopt;
    }
    auto const& obj = record.as_object();

    auto event_name = string_at(obj, "eventName");
    if (event_name.empty())
    {
        LOGW("Missing eventName in record");
        return std::nullopt;
    }
    if (event_name.rfind("ObjectCreated", 0) != 0)
    {
        LOGD("Ignoring non-ObjectCreated event: ", event_name);
        return std::nullopt;
    }

    auto const* s3 = object_at(obj, "s3");
    if (!s3)
    {
        LOGW("Missing s3 node in record");
        return std::nullopt;
    }
    auto const* bucket = object_at(*s3, "bucket");
    auto const* object = object_at(*s3, "object");
    if (!bucket || !object)
    {
        LOGW("Missing bucket or object node in s3 record");
        return std::nullopt;
    }

    ObjectRef ref{
        string_at(*bucket, "name"),
        decode_object_key(string_at(*object, "key"))};
    if (ref.source_id.empty() || ref.object_key.empty())
    {
        LOGW("Empty bucket name or key");
        return std::nullopt;
    }
    return ref;
}

}  // namespace

std::string
decode_object_key(const std::string& encoded)
{
    std::string out;
    out.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i)
    {
        char c = encoded[i];
        if (c == '+')
        {
            out.push_back(' ');
        }
        else if (c == '%' && i + 2 < encoded.size() &&
                 hex_value(encoded[i + 1]) >= 0 &&
                 hex_value(encoded[i + 2]) >= 0)
        {
            out.push_back(static_cast<char>(
                hex_value(encoded[i + 1]) * 16 + hex_value(encoded[i + 2])));
            i += 2;
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<ObjectRef>
parse_upload_notification(const std::string& text)
{
    std::vector<ObjectRef> refs;
    if (std::all_of(text.begin(), text.end(), [](unsigned char c) {
            return std::isspace(c);
        }))
    {
        LOGW("Received empty notification");
        return refs;
    }

    auto root = parse_json(text, "notification");
    json::value const* records = nullptr;
    json::value inner;

    if (root.is_object())
    {
        records = root.as_object().if_contains("Records");
        if (!records)
        {
            auto message = string_at(root.as_object(), "Message");
            if (!message.empty())
            {
                LOGI("Detected SNS wrapper, unwrapping Message field");
                inner = parse_json(message, "SNS message");
                if (inner.is_object())
                {
                    records = inner.as_object().if_contains("Records");
                }
            }
        }
    }

    if (!records || !records->is_array())
    {
        LOGW("No Records array found in notification");
        return refs;
    }

    for (auto const& record : records->as_array())
    {
        if (auto ref = object_from_record(record))
        {
            LOGI(
                "Notification for file: s3://",
                ref->source_id,
                "/",
                ref->object_key);
            refs.push_back(std::move(*ref));
        }
    }
    return refs;
}

}  // namespace rangepart::jobs
