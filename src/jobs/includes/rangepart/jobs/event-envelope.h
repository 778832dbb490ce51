#pragma once

#include <string>
#include <vector>

namespace rangepart::jobs {

// Object named by an upload notification
struct ObjectRef
{
    std::string source_id;
    std::string object_key;

    bool
    operator==(const ObjectRef&) const = default;
};

/**
 * Extract created objects from an S3 event notification.
 *
 * Accepts the plain `{"Records":[...]}` document or an SNS envelope whose
 * `Message` field carries it as a string. Only `ObjectCreated*` records are
 * returned; incomplete records are skipped with a warning. Object keys are
 * URL-decoded.
 *
 * @throws InvalidInputError if the text (or the SNS message) is not JSON
 */
std::vector<ObjectRef>
parse_upload_notification(const std::string& text);

// Decode the form encoding S3 uses for keys in notifications
std::string
decode_object_key(const std::string& encoded);

}  // namespace rangepart::jobs
