#pragma once

#include "rangepart/core/logger.h"
#include "rangepart/partition/types.h"

#include <boost/filesystem.hpp>
#include <boost/json/value.hpp>

#include <fstream>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace rangepart::jobs {

/**
 * Where run outcomes are recorded.
 *
 * Implementations must accept concurrent `record` calls from different runs.
 */
class RunHistory
{
public:
    virtual ~RunHistory() = default;

    virtual void
    record(partition::RunOutcome const& outcome) = 0;

    // Registry keys (see registry_key) of runs that ended Completed
    virtual std::set<std::string>
    completed_runs() const = 0;
};

// Key identifying one logical run of one object. Each component is
// length-prefixed ("5:files/6:a.txt/1:7") so distinct triples never share a key.
std::string
registry_key(
    const std::string& source_id,
    const std::string& object_key,
    const std::string& run_id);

boost::json::value
outcome_to_json(partition::RunOutcome const& outcome);

class MemoryRunHistory : public RunHistory
{
public:
    void
    record(partition::RunOutcome const& outcome) override;

    std::set<std::string>
    completed_runs() const override;

    std::vector<partition::RunOutcome>
    outcomes() const;

private:
    mutable std::mutex mutex_;
    std::vector<partition::RunOutcome> outcomes_;
};

/**
 * Append-only JSON-lines history file.
 *
 * Existing lines are read on construction so completed runs are remembered
 * across restarts; unreadable lines are skipped with a warning.
 */
class JsonlRunHistory : public RunHistory
{
public:
    /**
     * @throws StorageError if the file cannot be opened for append
     */
    explicit JsonlRunHistory(boost::filesystem::path path);

    void
    record(partition::RunOutcome const& outcome) override;

    std::set<std::string>
    completed_runs() const override;

    static LogPartition&
    get_log_partition();

private:
    void
    load();

    boost::filesystem::path path_;
    mutable std::mutex mutex_;
    std::ofstream out_;
    std::set<std::string> completed_;
};

}  // namespace rangepart::jobs
