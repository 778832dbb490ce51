#include "rangepart/app/arg-options.h"
#include "rangepart/broker/http-broker-client.h"
#include "rangepart/broker/spool-broker-client.h"
#include "rangepart/core/errors.h"
#include "rangepart/core/logger.h"
#include "rangepart/jobs/event-envelope.h"
#include "rangepart/jobs/job-coordinator.h"
#include "rangepart/jobs/run-history.h"
#include "rangepart/partition/range-partitioner.h"
#include "rangepart/storage/http-object-store.h"
#include "rangepart/storage/local-object-store.h"

#include <chrono>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace rangepart;
using namespace rangepart::app;

namespace {

std::unique_ptr<storage::ObjectStore>
make_store(const CommandLineOptions& options)
{
    if (options.store == StoreKind::Http)
    {
        storage::HttpStoreConfig config;
        config.endpoint = *options.endpoint;
        config.region = options.region;
        config.credentials.access_key = options.access_key.value_or("");
        config.credentials.secret_key = options.secret_key.value_or("");
        return std::make_unique<storage::HttpObjectStore>(std::move(config));
    }
    return std::make_unique<storage::LocalObjectStore>(options.store_root);
}

std::unique_ptr<broker::BrokerClient>
make_broker(const CommandLineOptions& options)
{
    if (options.broker == BrokerKind::Http)
    {
        broker::HttpBrokerConfig config;
        config.url = *options.broker_url;
        config.retries = options.publish_retries;
        return std::make_unique<broker::HttpBrokerClient>(std::move(config));
    }
    return std::make_unique<broker::SpoolBrokerClient>(options.spool_file);
}

std::string
read_event_text(const std::string& path)
{
    if (path == "-")
    {
        return std::string(
            std::istreambuf_iterator<char>(std::cin),
            std::istreambuf_iterator<char>());
    }
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw InvalidInputError("Cannot open event file: " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::vector<partition::RunRequest>
collect_requests(const CommandLineOptions& options)
{
    const std::string run_id = options.run_id.value_or(std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count()));

    std::vector<partition::RunRequest> requests;
    if (options.event_file)
    {
        for (auto& ref : jobs::parse_upload_notification(
                 read_event_text(*options.event_file)))
        {
            requests.push_back(
                {std::move(ref.source_id), std::move(ref.object_key), run_id});
        }
    }
    else
    {
        requests.push_back({*options.bucket, *options.key, run_id});
    }
    return requests;
}

void
print_summary(const partition::RunOutcome& outcome)
{
    using partition::RunStatus;
    const char* color = outcome.status == RunStatus::Completed
        ? color::BOLD_GREEN
        : outcome.status == RunStatus::Skipped ? color::BOLD_YELLOW
                                               : color::BOLD_RED;

    std::cout << color << partition::to_string(outcome.status) << color::RESET
              << " " << outcome.source_id << "/" << outcome.object_key
              << " run=" << outcome.run_id
              << " partitions=" << outcome.partition_count
              << " failed=" << outcome.failed_publish_count
              << " warnings=" << outcome.warnings.size();
    if (outcome.cause)
    {
        std::cout << " cause=\"" << *outcome.cause << "\"";
    }
    std::cout << std::endl;
}

}  // namespace

int
main(int argc, char* argv[])
{
    CommandLineOptions options = parse_argv(argc, argv);

    if (options.show_help || !options.valid)
    {
        if (!options.valid && options.error_message)
        {
            std::cerr << "Error: " << *options.error_message << std::endl
                      << std::endl;
        }
        std::cout << options.help_text << std::endl;
        return options.valid ? 0 : 2;
    }

    if (!Logger::set_level(options.log_level))
    {
        Logger::set_level(LogLevel::INFO);
        std::cerr << "Unrecognized log level: " << options.log_level
                  << ", falling back to 'info'" << std::endl;
    }

    try
    {
        auto requests = collect_requests(options);
        if (requests.empty())
        {
            LOGW("Notification contained no created objects, nothing to do");
            return 0;
        }

        partition::PartitionerOptions partitioner_options;
        partitioner_options.partition_target_size_bytes =
            options.partition_size;
        partitioner_options.boundary_probe_window_bytes = options.probe_window;
        partitioner_options.record_terminator = options.terminator;
        partitioner_options.probe_retries = options.probe_retries;
        partitioner_options.topic = options.topic;
        partitioner_options.settle_timeout =
            std::chrono::milliseconds(options.settle_timeout_ms);

        auto store = make_store(options);
        auto broker = make_broker(options);
        partition::RangePartitioner partitioner(
            *store, *broker, partitioner_options);

        std::shared_ptr<jobs::RunHistory> history;
        if (options.history_file)
        {
            history =
                std::make_shared<jobs::JsonlRunHistory>(*options.history_file);
        }
        else
        {
            history = std::make_shared<jobs::MemoryRunHistory>();
        }

        jobs::JobCoordinator coordinator(partitioner, history, options.workers);

        std::vector<std::future<partition::RunOutcome>> futures;
        futures.reserve(requests.size());
        for (auto& request : requests)
        {
            futures.push_back(coordinator.submit_async(std::move(request)));
        }

        int exit_code = 0;
        for (auto& future : futures)
        {
            auto outcome = future.get();
            print_summary(outcome);
            if (outcome.status == partition::RunStatus::Aborted)
            {
                exit_code = 1;
            }
        }
        return exit_code;
    }
    catch (const RangepartError& e)
    {
        LOGE("Fatal error (", to_string(e.kind()), "): ", e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
