#include "rangepart/jobs/run-history.h"
#include "rangepart/core/errors.h"

#include <boost/json.hpp>

namespace rangepart::jobs {

namespace json = boost::json;
using partition::RunOutcome;
using partition::RunStatus;

namespace {

void
append_component(std::string& key, const std::string& component)
{
    key += std::to_string(component.size());
    key += ':';
    key += component;
}

}  // namespace

std::string
registry_key(
    const std::string& source_id,
    const std::string& object_key,
    const std::string& run_id)
{
    std::string key;
    append_component(key, source_id);
    key += '/';
    append_component(key, object_key);
    key += '/';
    append_component(key, run_id);
    return key;
}

json::value
outcome_to_json(RunOutcome const& outcome)
{
    json::object obj;
    obj["runId"] = outcome.run_id;
    obj["sourceId"] = outcome.source_id;
    obj["objectKey"] = outcome.object_key;
    obj["status"] = std::string(to_string(outcome.status));
    if (outcome.skip_reason != partition::SkipReason::None)
    {
        obj["skipReason"] = std::string(to_string(outcome.skip_reason));
    }
    if (outcome.error != ErrorKind::None)
    {
        obj["error"] = std::string(to_string(outcome.error));
    }
    if (outcome.cause)
    {
        obj["cause"] = *outcome.cause;
    }
    obj["objectSize"] = outcome.object_size;
    obj["partitionCount"] = outcome.partition_count;
    obj["failedPublishCount"] = outcome.failed_publish_count;

    json::array failed;
    for (auto sequence : outcome.failed_partitions)
    {
        failed.emplace_back(sequence);
    }
    obj["failedPartitions"] = std::move(failed);

    json::array warnings;
    for (auto const& warning : outcome.warnings)
    {
        json::object w;
        w["partitionNumber"] = warning.sequence_number;
        w["proposedEnd"] = warning.proposed_end;
        w["resolvedEnd"] = warning.resolved_end;
        w["condition"] = std::string(to_string(warning.condition));
        w["detail"] = warning.detail;
        warnings.emplace_back(std::move(w));
    }
    obj["warnings"] = std::move(warnings);
    obj["elapsedMs"] = outcome.elapsed.count();
    return obj;
}

void
MemoryRunHistory::record(RunOutcome const& outcome)
{
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(outcome);
}

std::set<std::string>
MemoryRunHistory::completed_runs() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> out;
    for (auto const& outcome : outcomes_)
    {
        if (outcome.status == RunStatus::Completed)
        {
            out.insert(registry_key(
                outcome.source_id, outcome.object_key, outcome.run_id));
        }
    }
    return out;
}

std::vector<RunOutcome>
MemoryRunHistory::outcomes() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

LogPartition&
JsonlRunHistory::get_log_partition()
{
    static LogPartition partition("coordinator");
    return partition;
}

JsonlRunHistory::JsonlRunHistory(boost::filesystem::path path)
    : path_(std::move(path))
{
    load();
    out_.open(path_.string(), std::ios::out | std::ios::app);
    if (!out_.is_open())
    {
        throw StorageError(
            ErrorKind::TransientIO,
            "Cannot open run history for append: " + path_.string());
    }
}

void
JsonlRunHistory::load()
{
    std::ifstream in(path_.string());
    if (!in.is_open())
    {
        return;
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line))
    {
        ++line_no;
        if (line.empty())
            continue;

        boost::system::error_code ec;
        auto parsed = json::parse(line, ec);
        if (ec || !parsed.is_object())
        {
            OLOGW(
                "Skipping unreadable history line ",
                line_no,
                " in ",
                path_.string());
            continue;
        }

        auto const& obj = parsed.as_object();
        auto const* status = obj.if_contains("status");
        auto const* source = obj.if_contains("sourceId");
        auto const* key = obj.if_contains("objectKey");
        auto const* run = obj.if_contains("runId");
        if (!status || !source || !key || !run || !status->is_string() ||
            !source->is_string() || !key->is_string() || !run->is_string())
        {
            OLOGW(
                "Skipping incomplete history line ",
                line_no,
                " in ",
                path_.string());
            continue;
        }

        if (status->as_string() == "Completed")
        {
            completed_.insert(registry_key(
                std::string(source->as_string()),
                std::string(key->as_string()),
                std::string(run->as_string())));
        }
    }

    OLOGI(
        "Loaded run history from ",
        path_.string(),
        ": ",
        completed_.size(),
        " completed runs");
}

void
JsonlRunHistory::record(RunOutcome const& outcome)
{
    auto line = json::serialize(outcome_to_json(outcome));

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
    if (!out_.good())
    {
        out_.clear();
        throw StorageError(
            ErrorKind::TransientIO,
            "Failed to append to run history " + path_.string());
    }
    if (outcome.status == RunStatus::Completed)
    {
        completed_.insert(registry_key(
            outcome.source_id, outcome.object_key, outcome.run_id));
    }
}

std::set<std::string>
JsonlRunHistory::completed_runs() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

}  // namespace rangepart::jobs
