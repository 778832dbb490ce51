#include "rangepart/storage/local-object-store.h"
#include "rangepart/core/errors.h"

#include <boost/system/error_code.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace fs = boost::filesystem;

namespace rangepart::storage {

namespace {

std::string
describe(const std::string& source_id, const std::string& object_key)
{
    return "local://" + source_id + "/" + object_key;
}

[[noreturn]] void
throw_for_error_code(
    boost::system::error_code const& ec,
    const std::string& what)
{
    if (ec == boost::system::errc::no_such_file_or_directory ||
        ec == boost::system::errc::not_a_directory)
    {
        throw StorageError(ErrorKind::NotFound, "Object not found: " + what);
    }
    if (ec == boost::system::errc::permission_denied ||
        ec == boost::system::errc::operation_not_permitted)
    {
        throw StorageError(
            ErrorKind::AccessDenied, "Access denied: " + what);
    }
    throw StorageError(
        ErrorKind::TransientIO, "I/O error on " + what + ": " + ec.message());
}

}  // namespace

LogPartition&
LocalObjectStore::get_log_partition()
{
    static LogPartition partition("storage");
    return partition;
}

LocalObjectStore::LocalObjectStore(fs::path root) : root_(std::move(root))
{
}

fs::path
LocalObjectStore::resolve(
    const std::string& source_id,
    const std::string& object_key) const
{
    if (source_id.empty() || object_key.empty())
    {
        throw InvalidInputError("Source id and object key must not be empty");
    }

    fs::path bucket(source_id);
    fs::path key(object_key);
    if (bucket.has_root_path() || key.has_root_path())
    {
        throw InvalidInputError(
            "Absolute paths are not allowed: " +
            describe(source_id, object_key));
    }
    for (auto const& part : bucket / key)
    {
        if (part == "..")
        {
            throw InvalidInputError(
                "Object key escapes its bucket: " +
                describe(source_id, object_key));
        }
    }
    return root_ / bucket / key;
}

ObjectMetadata
LocalObjectStore::head(
    const std::string& source_id,
    const std::string& object_key)
{
    auto path = resolve(source_id, object_key);
    auto what = describe(source_id, object_key);

    boost::system::error_code ec;
    auto status = fs::status(path, ec);
    if (ec && ec != boost::system::errc::no_such_file_or_directory)
    {
        throw_for_error_code(ec, what);
    }
    if (!fs::exists(status) || !fs::is_regular_file(status))
    {
        throw StorageError(ErrorKind::NotFound, "Object not found: " + what);
    }

    auto size = fs::file_size(path, ec);
    if (ec)
    {
        throw_for_error_code(ec, what);
    }

    OLOGD("head ", what, " -> ", size, " bytes");
    return ObjectMetadata{static_cast<std::uint64_t>(size)};
}

std::vector<std::uint8_t>
LocalObjectStore::read_range(
    const std::string& source_id,
    const std::string& object_key,
    std::uint64_t first,
    std::uint64_t last)
{
    auto path = resolve(source_id, object_key);
    auto what = describe(source_id, object_key);

    if (last < first)
    {
        throw InvalidInputError(
            "Invalid range " + std::to_string(first) + "-" +
            std::to_string(last) + " for " + what);
    }

    std::ifstream in(path.string(), std::ios::binary);
    if (!in.is_open())
    {
        int err = errno;
        if (!fs::exists(path))
        {
            throw StorageError(
                ErrorKind::NotFound, "Object not found: " + what);
        }
        if (err == EACCES || err == EPERM)
        {
            throw StorageError(
                ErrorKind::AccessDenied, "Access denied: " + what);
        }
        throw StorageError(
            ErrorKind::TransientIO,
            "Cannot open " + what + ": " + std::strerror(err));
    }

    in.seekg(0, std::ios::end);
    auto end_pos = in.tellg();
    if (end_pos < 0)
    {
        throw StorageError(ErrorKind::TransientIO, "Cannot size " + what);
    }
    auto size = static_cast<std::uint64_t>(end_pos);
    if (first >= size)
    {
        throw InvalidInputError(
            "Range start " + std::to_string(first) + " beyond end of " + what +
            " (" + std::to_string(size) + " bytes)");
    }
    last = std::min(last, size - 1);

    std::vector<std::uint8_t> data(last - first + 1);
    in.seekg(static_cast<std::streamoff>(first), std::ios::beg);
    in.read(
        reinterpret_cast<char*>(data.data()),
        static_cast<std::streamsize>(data.size()));
    if (in.gcount() != static_cast<std::streamsize>(data.size()))
    {
        throw StorageError(
            ErrorKind::TransientIO,
            "Short read on " + what + ": expected " +
                std::to_string(data.size()) + " bytes, got " +
                std::to_string(in.gcount()));
    }

    OLOGD(
        "read ", what, " bytes ", first, "-", last, " (", data.size(), ")");
    return data;
}

}  // namespace rangepart::storage
