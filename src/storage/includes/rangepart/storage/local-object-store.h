#pragma once

#include "rangepart/core/logger.h"
#include "rangepart/storage/object-store.h"

#include <boost/filesystem.hpp>

namespace rangepart::storage {

/**
 * Object store backed by a local directory tree.
 *
 * `<root>/<source_id>/<object_key>` names the object, so a bucket is a
 * subdirectory of the root.
 */
class LocalObjectStore : public ObjectStore
{
public:
    explicit LocalObjectStore(boost::filesystem::path root);

    ObjectMetadata
    head(const std::string& source_id, const std::string& object_key)
        override;

    std::vector<std::uint8_t>
    read_range(
        const std::string& source_id,
        const std::string& object_key,
        std::uint64_t first,
        std::uint64_t last) override;

    const boost::filesystem::path&
    root() const
    {
        return root_;
    }

    static LogPartition&
    get_log_partition();

private:
    // Rejects empty names and keys that would escape the bucket
    boost::filesystem::path
    resolve(const std::string& source_id, const std::string& object_key)
        const;

    boost::filesystem::path root_;
};

}  // namespace rangepart::storage
