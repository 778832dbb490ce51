#pragma once

#include "rangepart/core/logger.h"
#include "rangepart/jobs/run-history.h"
#include "rangepart/partition/range-partitioner.h"
#include "rangepart/partition/types.h"

#include <boost/asio/thread_pool.hpp>

#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rangepart::jobs {

/**
 * Runs partitioning jobs with at most one execution per run.
 *
 * A run is identified by (source id, object key, run id). While a run is
 * in flight a duplicate submission is skipped as AlreadyRunning; once it has
 * Completed every later submission is skipped as AlreadyCompleted. Aborted
 * runs are forgotten and may be submitted again.
 *
 * Every outcome, including skips, is recorded in the run history. Failures
 * of the partitioner never escape as exceptions; they become Aborted
 * outcomes carrying the error kind and message.
 */
class JobCoordinator
{
public:
    enum class RunState { Running, Completed };

    /**
     * @param history Optional; completed runs it knows about are skipped
     * @param workers Threads used by submit_async
     */
    JobCoordinator(
        partition::RangePartitioner& partitioner,
        std::shared_ptr<RunHistory> history,
        std::size_t workers = 2);

    ~JobCoordinator();

    JobCoordinator(const JobCoordinator&) = delete;
    JobCoordinator&
    operator=(const JobCoordinator&) = delete;

    // Run on the calling thread
    partition::RunOutcome
    submit(
        const partition::RunRequest& request,
        const partition::CancellationToken* cancel = nullptr);

    // Claim now, run on the worker pool
    std::future<partition::RunOutcome>
    submit_async(
        partition::RunRequest request,
        std::shared_ptr<partition::CancellationToken> cancel = nullptr);

    // Block until every submit_async run has finished
    void
    wait();

    std::optional<RunState>
    state(const partition::RunRequest& request) const;

    std::size_t
    active_runs() const;

    static LogPartition&
    get_log_partition();

private:
    // Marks one submit_async run finished when it leaves scope
    class AsyncCompletion
    {
    public:
        explicit AsyncCompletion(JobCoordinator& owner) : owner_(owner)
        {
        }
        ~AsyncCompletion();

    private:
        JobCoordinator& owner_;
    };

    // Registers the run as Running, or returns why it must be skipped
    std::optional<partition::SkipReason>
    claim(const partition::RunRequest& request);

    partition::RunOutcome
    execute(
        const partition::RunRequest& request,
        const partition::CancellationToken* cancel);

    void
    finish(
        const partition::RunRequest& request,
        const partition::RunOutcome& outcome);

    partition::RunOutcome
    skip(const partition::RunRequest& request, partition::SkipReason reason);

    void
    record(const partition::RunOutcome& outcome);

    partition::RangePartitioner& partitioner_;
    std::shared_ptr<RunHistory> history_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunState> runs_;
    std::condition_variable idle_;
    std::size_t pending_async_ = 0;

    boost::asio::thread_pool pool_;
};

}  // namespace rangepart::jobs
