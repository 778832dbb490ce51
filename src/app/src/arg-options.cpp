#include "rangepart/app/arg-options.h"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;

namespace rangepart::app {

std::optional<std::uint8_t>
parse_terminator(const std::string& text)
{
    if (text.size() == 1)
    {
        return static_cast<std::uint8_t>(text[0]);
    }
    if (text == "\\n")
        return static_cast<std::uint8_t>('\n');
    if (text == "\\r")
        return static_cast<std::uint8_t>('\r');
    if (text == "\\t")
        return static_cast<std::uint8_t>('\t');
    if (text == "\\0")
        return static_cast<std::uint8_t>('\0');

    if (text.size() > 2 && text.size() <= 4 &&
        (text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0))
    {
        try
        {
            std::size_t consumed = 0;
            unsigned long value = std::stoul(text.substr(2), &consumed, 16);
            if (consumed == text.size() - 2 && value <= 0xFF)
            {
                return static_cast<std::uint8_t>(value);
            }
        }
        catch (const std::exception&)
        {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

namespace {

const char*
env_or_null(const char* name)
{
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

}  // namespace

CommandLineOptions
parse_argv(int argc, char* argv[])
{
    CommandLineOptions options;

    po::options_description general("General");
    general.add_options()("help,h", "Display this help message")(
        "config,c",
        po::value<std::string>(),
        "INI-style file with any of the long options below")(
        "log-level,l",
        po::value<std::string>()->default_value("info"),
        "Log level (error, warn, info, debug)");

    po::options_description job("Job");
    job.add_options()(
        "bucket,b", po::value<std::string>(), "Bucket (source id) of the file")(
        "key,k", po::value<std::string>(), "Object key of the file")(
        "run-id,r",
        po::value<std::string>(),
        "Run id (default: current epoch milliseconds)")(
        "event,e",
        po::value<std::string>(),
        "S3 upload notification JSON to process instead of --bucket/--key "
        "('-' reads stdin)")(
        "history",
        po::value<std::string>(),
        "JSON-lines run history; completed runs recorded there are skipped")(
        "workers,w",
        po::value<std::size_t>()->default_value(2),
        "Concurrent runs");

    po::options_description partitioning("Partitioning");
    partitioning.add_options()(
        "partition-size",
        po::value<std::uint64_t>()->default_value(50ull * 1024 * 1024),
        "Target partition size in bytes")(
        "probe-window",
        po::value<std::uint64_t>()->default_value(1024 * 1024),
        "Bytes read after each proposed cut to find a record terminator")(
        "terminator",
        po::value<std::string>()->default_value("\\n"),
        "Record terminator byte (character, \\n, \\r, \\t, \\0 or 0xNN)")(
        "probe-retries",
        po::value<unsigned>()->default_value(0),
        "Retries for a boundary probe read failing transiently");

    po::options_description storage("Storage");
    storage.add_options()(
        "store",
        po::value<std::string>()->default_value("local"),
        "Object store: local or http")(
        "store-root",
        po::value<std::string>()->default_value("."),
        "Directory containing one subdirectory per bucket (local store)")(
        "endpoint",
        po::value<std::string>(),
        "S3-compatible endpoint, e.g. http://localhost:9000 (http store)")(
        "region",
        po::value<std::string>()->default_value("us-east-1"),
        "Signing region (http store)")(
        "access-key",
        po::value<std::string>(),
        "Access key (default: AWS_ACCESS_KEY_ID)")(
        "secret-key",
        po::value<std::string>(),
        "Secret key (default: AWS_SECRET_ACCESS_KEY)");

    po::options_description broker("Broker");
    broker.add_options()(
        "broker",
        po::value<std::string>()->default_value("spool"),
        "Broker client: spool or http")(
        "spool-file",
        po::value<std::string>()->default_value("partitions.spool"),
        "Spool file receiving partition messages (spool broker)")(
        "broker-url",
        po::value<std::string>(),
        "Kafka REST proxy URL (http broker)")(
        "topic,t",
        po::value<std::string>()->default_value("file-partitions"),
        "Topic partition messages are published to")(
        "publish-retries",
        po::value<unsigned>()->default_value(3),
        "Retries for a message failing transiently (http broker)")(
        "settle-timeout-ms",
        po::value<std::uint64_t>()->default_value(120000),
        "Maximum wait for all publish acknowledgements of a run");

    po::options_description desc("Allowed options");
    desc.add(general).add(job).add(partitioning).add(storage).add(broker);

    std::ostringstream help_stream;
    help_stream << "Range Partitioner" << std::endl
                << "-----------------" << std::endl
                << "Split a delimited-record file into record-aligned byte "
                   "ranges and publish"
                << std::endl
                << "one message per range for parallel workers." << std::endl
                << std::endl
                << "Usage: " << (argc > 0 ? argv[0] : "rangepart")
                << " --bucket <bucket> --key <key> [options]" << std::endl
                << "       " << (argc > 0 ? argv[0] : "rangepart")
                << " --event <notification.json> [options]" << std::endl
                << std::endl
                << desc << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (vm.count("config"))
        {
            const auto config_path = vm["config"].as<std::string>();
            std::ifstream config_stream(config_path);
            if (!config_stream.is_open())
            {
                options.valid = false;
                options.error_message =
                    "Cannot open config file: " + config_path;
                return options;
            }
            // Values already stored from the command line are kept
            po::store(po::parse_config_file(config_stream, desc), vm);
        }
        po::notify(vm);

        options.log_level = vm["log-level"].as<std::string>();
        if (options.log_level != "error" && options.log_level != "warn" &&
            options.log_level != "info" && options.log_level != "debug")
        {
            options.valid = false;
            options.error_message =
                "Log level must be one of: error, warn, info, debug";
            return options;
        }

        // Job source
        if (vm.count("bucket"))
            options.bucket = vm["bucket"].as<std::string>();
        if (vm.count("key"))
            options.key = vm["key"].as<std::string>();
        if (vm.count("run-id"))
            options.run_id = vm["run-id"].as<std::string>();
        if (vm.count("event"))
            options.event_file = vm["event"].as<std::string>();
        if (vm.count("history"))
            options.history_file = vm["history"].as<std::string>();

        if (!options.event_file && (!options.bucket || !options.key))
        {
            options.valid = false;
            options.error_message =
                "Specify --bucket and --key, or --event";
            return options;
        }
        if (options.event_file && (options.bucket || options.key))
        {
            options.valid = false;
            options.error_message =
                "--event cannot be combined with --bucket/--key";
            return options;
        }

        options.workers = vm["workers"].as<std::size_t>();
        if (options.workers == 0)
        {
            options.valid = false;
            options.error_message = "--workers must be at least 1";
            return options;
        }

        // Partitioning
        options.partition_size = vm["partition-size"].as<std::uint64_t>();
        if (options.partition_size == 0)
        {
            options.valid = false;
            options.error_message = "Partition size must be greater than 0";
            return options;
        }
        options.probe_window = vm["probe-window"].as<std::uint64_t>();
        if (options.probe_window == 0)
        {
            options.valid = false;
            options.error_message = "Probe window must be greater than 0";
            return options;
        }
        auto terminator =
            parse_terminator(vm["terminator"].as<std::string>());
        if (!terminator)
        {
            options.valid = false;
            options.error_message =
                "Terminator must name exactly one byte: " +
                vm["terminator"].as<std::string>();
            return options;
        }
        options.terminator = *terminator;
        options.probe_retries = vm["probe-retries"].as<unsigned>();

        // Storage
        const auto store = vm["store"].as<std::string>();
        if (store == "local")
        {
            options.store = StoreKind::Local;
        }
        else if (store == "http")
        {
            options.store = StoreKind::Http;
        }
        else
        {
            options.valid = false;
            options.error_message = "Unknown store: " + store;
            return options;
        }
        options.store_root = vm["store-root"].as<std::string>();
        options.region = vm["region"].as<std::string>();
        if (vm.count("endpoint"))
            options.endpoint = vm["endpoint"].as<std::string>();
        if (vm.count("access-key"))
            options.access_key = vm["access-key"].as<std::string>();
        else if (auto env = env_or_null("AWS_ACCESS_KEY_ID"))
            options.access_key = env;
        if (vm.count("secret-key"))
            options.secret_key = vm["secret-key"].as<std::string>();
        else if (auto env = env_or_null("AWS_SECRET_ACCESS_KEY"))
            options.secret_key = env;

        if (options.store == StoreKind::Http && !options.endpoint)
        {
            options.valid = false;
            options.error_message = "--endpoint is required for the http store";
            return options;
        }

        // Broker
        const auto broker_kind = vm["broker"].as<std::string>();
        if (broker_kind == "spool")
        {
            options.broker = BrokerKind::Spool;
        }
        else if (broker_kind == "http")
        {
            options.broker = BrokerKind::Http;
        }
        else
        {
            options.valid = false;
            options.error_message = "Unknown broker: " + broker_kind;
            return options;
        }
        options.spool_file = vm["spool-file"].as<std::string>();
        if (vm.count("broker-url"))
            options.broker_url = vm["broker-url"].as<std::string>();
        if (options.broker == BrokerKind::Http && !options.broker_url)
        {
            options.valid = false;
            options.error_message =
                "--broker-url is required for the http broker";
            return options;
        }
        options.topic = vm["topic"].as<std::string>();
        if (options.topic.empty())
        {
            options.valid = false;
            options.error_message = "Topic must not be empty";
            return options;
        }
        options.publish_retries = vm["publish-retries"].as<unsigned>();
        options.settle_timeout_ms = vm["settle-timeout-ms"].as<std::uint64_t>();
        if (options.settle_timeout_ms == 0)
        {
            options.valid = false;
            options.error_message = "Settle timeout must be greater than 0";
            return options;
        }
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }
    catch (const std::exception& e)
    {
        options.valid = false;
        options.error_message = std::string("Unexpected error: ") + e.what();
    }

    return options;
}

}  // namespace rangepart::app
