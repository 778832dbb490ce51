#include "rangepart/jobs/job-coordinator.h"
#include "rangepart/core/errors.h"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>

namespace rangepart::jobs {

using partition::CancellationToken;
using partition::RunOutcome;
using partition::RunRequest;
using partition::RunStatus;
using partition::SkipReason;

namespace {

std::string
key_of(const RunRequest& request)
{
    return registry_key(request.source_id, request.object_key, request.run_id);
}

}  // namespace

LogPartition&
JobCoordinator::get_log_partition()
{
    static LogPartition partition("coordinator");
    return partition;
}

JobCoordinator::JobCoordinator(
    partition::RangePartitioner& partitioner,
    std::shared_ptr<RunHistory> history,
    std::size_t workers)
    : partitioner_(partitioner)
    , history_(std::move(history))
    , pool_(workers == 0 ? 1 : workers)
{
    if (history_)
    {
        for (auto const& key : history_->completed_runs())
        {
            runs_.emplace(key, RunState::Completed);
        }
    }
}

JobCoordinator::~JobCoordinator()
{
    wait();
    pool_.join();
}

std::optional<SkipReason>
JobCoordinator::claim(const RunRequest& request)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = runs_.emplace(key_of(request), RunState::Running);
    if (inserted)
    {
        return std::nullopt;
    }
    return it->second == RunState::Running ? SkipReason::AlreadyRunning
                                           : SkipReason::AlreadyCompleted;
}

void
JobCoordinator::finish(const RunRequest& request, const RunOutcome& outcome)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outcome.status == RunStatus::Completed)
        {
            runs_[key_of(request)] = RunState::Completed;
        }
        else
        {
            runs_.erase(key_of(request));
        }
    }
    record(outcome);
}

void
JobCoordinator::record(const RunOutcome& outcome)
{
    if (!history_)
        return;
    try
    {
        history_->record(outcome);
    }
    catch (const std::exception& e)
    {
        OLOGE("Failed to record outcome of run ", outcome.run_id, ": ", e.what());
    }
}

RunOutcome
JobCoordinator::skip(const RunRequest& request, SkipReason reason)
{
    OLOGW(
        "Job ",
        reason == SkipReason::AlreadyRunning ? "already running"
                                             : "already completed",
        " for file: ",
        request.source_id,
        "/",
        request.object_key,
        " (run ",
        request.run_id,
        ")");
    auto outcome = RunOutcome::skipped(request, reason);
    record(outcome);
    return outcome;
}

RunOutcome
JobCoordinator::execute(const RunRequest& request, const CancellationToken* cancel)
{
    OLOGI(
        "Starting run ",
        request.run_id,
        " for file: ",
        request.source_id,
        "/",
        request.object_key);

    auto start_time = std::chrono::steady_clock::now();
    RunOutcome outcome;
    try
    {
        outcome = partitioner_.run(request, cancel);
    }
    catch (const RangepartError& e)
    {
        outcome = RunOutcome::aborted(request, e.kind(), e.what());
    }
    catch (const std::exception& e)
    {
        outcome = RunOutcome::aborted(request, ErrorKind::Internal, e.what());
    }
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (outcome.status == RunStatus::Completed)
    {
        OLOGI(
            "Run ",
            request.run_id,
            " completed: ",
            outcome.partition_count,
            " partitions, ",
            outcome.warnings.size(),
            " boundary warnings, ",
            outcome.elapsed.count(),
            " ms");
    }
    else
    {
        OLOGE(
            "Run ",
            request.run_id,
            " aborted (",
            to_string(outcome.error),
            "): ",
            outcome.cause.value_or("no cause"));
    }

    finish(request, outcome);
    return outcome;
}

RunOutcome
JobCoordinator::submit(const RunRequest& request, const CancellationToken* cancel)
{
    try
    {
        partition::validate_request(request);
    }
    catch (const InvalidInputError& e)
    {
        OLOGE("Rejected run request: ", e.what());
        auto outcome =
            RunOutcome::aborted(request, ErrorKind::InvalidInput, e.what());
        record(outcome);
        return outcome;
    }

    if (auto reason = claim(request))
    {
        return skip(request, *reason);
    }
    return execute(request, cancel);
}

std::future<RunOutcome>
JobCoordinator::submit_async(
    RunRequest request,
    std::shared_ptr<CancellationToken> cancel)
{
    auto promise = std::make_shared<std::promise<RunOutcome>>();
    auto future = promise->get_future();

    try
    {
        partition::validate_request(request);
    }
    catch (const InvalidInputError& e)
    {
        OLOGE("Rejected run request: ", e.what());
        auto outcome =
            RunOutcome::aborted(request, ErrorKind::InvalidInput, e.what());
        record(outcome);
        promise->set_value(std::move(outcome));
        return future;
    }

    if (auto reason = claim(request))
    {
        promise->set_value(skip(request, *reason));
        return future;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pending_async_;
    }

    boost::asio::post(
        pool_,
        [this,
         promise,
         request = std::move(request),
         cancel = std::move(cancel)]() {
            AsyncCompletion completion(*this);
            try
            {
                promise->set_value(execute(request, cancel.get()));
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
            }
        });

    return future;
}

JobCoordinator::AsyncCompletion::~AsyncCompletion()
{
    std::lock_guard<std::mutex> lock(owner_.mutex_);
    --owner_.pending_async_;
    owner_.idle_.notify_all();
}

void
JobCoordinator::wait()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return pending_async_ == 0; });
}

std::optional<JobCoordinator::RunState>
JobCoordinator::state(const RunRequest& request) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(key_of(request));
    if (it == runs_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::size_t
JobCoordinator::active_runs() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        runs_.begin(), runs_.end(), [](auto const& entry) {
            return entry.second == RunState::Running;
        }));
}

}  // namespace rangepart::jobs
