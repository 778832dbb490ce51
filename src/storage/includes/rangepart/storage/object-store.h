#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rangepart::storage {

struct ObjectMetadata
{
    std::uint64_t size = 0;
};

/**
 * Read-only access to objects in a bucket-like store.
 *
 * Implementations must be safe to call from several runs at once. All
 * failures are reported as StorageError with kind NotFound, AccessDenied or
 * TransientIO; malformed arguments raise InvalidInputError.
 */
class ObjectStore
{
public:
    virtual ~ObjectStore() = default;

    virtual ObjectMetadata
    head(const std::string& source_id, const std::string& object_key) = 0;

    /**
     * Read the inclusive byte range [first, last].
     *
     * `last` past the end of the object is clamped to the final byte, so the
     * result may be shorter than requested.
     */
    virtual std::vector<std::uint8_t>
    read_range(
        const std::string& source_id,
        const std::string& object_key,
        std::uint64_t first,
        std::uint64_t last) = 0;
};

}  // namespace rangepart::storage
