#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace rangepart::app {

enum class StoreKind { Local, Http };

enum class BrokerKind { Spool, Http };

/**
 * Type-safe structure for command line options
 */
struct CommandLineOptions
{
    /** Object store backend */
    StoreKind store = StoreKind::Local;

    /** Root directory holding one subdirectory per bucket (local store) */
    std::string store_root = ".";

    /** S3-compatible endpoint (http store) */
    std::optional<std::string> endpoint;

    std::string region = "us-east-1";

    std::optional<std::string> access_key;

    std::optional<std::string> secret_key;

    /** Broker backend */
    BrokerKind broker = BrokerKind::Spool;

    /** Spool file receiving one line per partition message */
    std::string spool_file = "partitions.spool";

    /** Kafka REST proxy URL (http broker) */
    std::optional<std::string> broker_url;

    std::string topic = "file-partitions";

    unsigned publish_retries = 3;

    std::uint64_t settle_timeout_ms = 120000;

    std::uint64_t partition_size = 50ull * 1024 * 1024;

    std::uint64_t probe_window = 1024 * 1024;

    std::uint8_t terminator = '\n';

    unsigned probe_retries = 0;

    /** Object to partition, unless --event is given */
    std::optional<std::string> bucket;

    std::optional<std::string> key;

    /** Run id; defaults to the current epoch milliseconds */
    std::optional<std::string> run_id;

    /** Upload notification JSON file, "-" for stdin */
    std::optional<std::string> event_file;

    /** JSON-lines run history */
    std::optional<std::string> history_file;

    std::size_t workers = 2;

    /** Log verbosity level */
    std::string log_level = "info";

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;
};

/**
 * Parse command line arguments (and an optional --config file) into a
 * structured options object. Command line values take precedence over the
 * config file.
 *
 * @param argc Argument count from main
 * @param argv Argument values from main
 * @return A populated CommandLineOptions structure
 */
CommandLineOptions
parse_argv(int argc, char* argv[]);

/**
 * Decode a terminator argument: a single character, an escape (\n, \r, \t,
 * \0) or a hex byte (0x0a).
 *
 * @return The byte, or nullopt if the text does not name exactly one byte
 */
std::optional<std::uint8_t>
parse_terminator(const std::string& text);

}  // namespace rangepart::app
