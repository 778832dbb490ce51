#pragma once

#include <atomic>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

// ANSI color codes for terminal output
namespace rangepart::color {
inline constexpr const char* RESET = "\033[0m";
inline constexpr const char* RED = "\033[0;31m";
inline constexpr const char* GREEN = "\033[0;32m";
inline constexpr const char* YELLOW = "\033[0;33m";
inline constexpr const char* CYAN = "\033[0;36m";

inline constexpr const char* BOLD_RED = "\033[1;31m";
inline constexpr const char* BOLD_GREEN = "\033[1;32m";
inline constexpr const char* BOLD_YELLOW = "\033[1;33m";
}  // namespace rangepart::color

// Usage: LOGI(COLORED(RED, "Aborted"), " run 42")
#define COLORED(color_arg, text) \
    rangepart::color::color_arg, text, rangepart::color::RESET

#ifndef PROJECT_ROOT
#define PROJECT_ROOT ""
#define PROJECT_ROOT_LENGTH 0
#endif

#define __RELATIVE_FILEPATH__                                  \
    (strncmp(__FILE__, PROJECT_ROOT, PROJECT_ROOT_LENGTH) == 0 \
         ? &(__FILE__[PROJECT_ROOT_LENGTH])                    \
         : __FILE__)

namespace rangepart {

enum class LogLevel {
    NONE = -2,     // Special level to disable all logging
    INHERIT = -1,  // Special level for partitions to inherit global level
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

class Logger
{
private:
    static std::atomic<LogLevel> current_level_;
    static std::mutex log_mutex_;
    static std::ostream* output_stream_;
    static std::ostream* error_stream_;

    static bool
    should_log(LogLevel level);

    static std::string
    format_timestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
            1000;

        std::tm tm_now;
        localtime_r(&time_t_now, &tm_now);

        std::ostringstream oss;
        oss << "[" << std::setfill('0') << std::setw(2) << tm_now.tm_hour << ":"
            << std::setw(2) << tm_now.tm_min << ":" << std::setw(2)
            << tm_now.tm_sec << "." << std::setw(3) << ms.count() << "] ";

        return oss.str();
    }

    static const char*
    level_tag(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::ERROR:
                return "[ERROR] ";
            case LogLevel::WARNING:
                return "[WARN]  ";
            case LogLevel::INFO:
                return "[INFO]  ";
            case LogLevel::DEBUG:
                return "[DEBUG] ";
            case LogLevel::NONE:
            case LogLevel::INHERIT:
                break;
        }
        return "";
    }

    // Caller must hold log_mutex_
    static std::ostream&
    stream_for(LogLevel level)
    {
        if (level <= LogLevel::WARNING)
            return error_stream_ ? *error_stream_ : std::cerr;
        return output_stream_ ? *output_stream_ : std::cout;
    }

public:
    static void
    set_level(LogLevel level);

    static bool
    set_level(const std::string& level);

    static LogLevel
    get_level();

    // Redirect output (INFO/DEBUG) and error (ERROR/WARNING) lines.
    // Passing nullptr restores the standard streams.
    static void
    set_output_stream(std::ostream* output_stream);

    static void
    set_error_stream(std::ostream* error_stream);

    static void
    reset_streams();

    template <typename... Args>
    static void
    log(LogLevel level, const Args&... args)
    {
        if (!should_log(level))
            return;
        write(level, args...);
    }

    // Emit without consulting the global level; partitions filter first
    template <typename... Args>
    static void
    write(LogLevel level, const Args&... args)
    {
        // Format before taking the lock
        std::ostringstream oss;
        oss << format_timestamp() << level_tag(level);
        (oss << ... << args);

        std::lock_guard<std::mutex> lock(log_mutex_);
        stream_for(level) << oss.str() << std::endl;
    }

    // For values that are expensive to format; formatter only runs when the
    // level is enabled
    template <typename Formatter, typename... Args>
    static void
    log_with_format(LogLevel level, Formatter formatter, const Args&... args)
    {
        if (!should_log(level))
            return;

        std::string formatted = formatter(args...);

        std::ostringstream oss;
        oss << format_timestamp() << level_tag(level) << formatted;

        std::lock_guard<std::mutex> lock(log_mutex_);
        stream_for(level) << oss.str() << std::endl;
    }
};

namespace detail {
template <typename T>
class has_log_partition
{
    template <typename C>
    static constexpr auto
    test(int) -> decltype(C::get_log_partition(), bool())
    {
        return true;
    }

    template <typename>
    static constexpr bool
    test(...)
    {
        return false;
    }

public:
    static constexpr bool value = test<T>(0);
};

template <typename T, typename... Args>
static inline void
log_with_partition_check(
    LogLevel level,
    const char* file,
    int line,
    const T* /* obj */,
    const Args&... args)
{
    if constexpr (has_log_partition<T>::value)
    {
        auto& partition = T::get_log_partition();
        if (partition.should_log(level))
        {
            Logger::write(
                level,
                "[",
                partition.name(),
                "] ",
                args...,
                " (",
                file,
                ":",
                line,
                ")");
        }
    }
    else
    {
        if (Logger::get_level() >= level)
        {
            Logger::log(level, args..., " (", file, ":", line, ")");
        }
    }
}
}  // namespace detail

/**
 * Named logging channel with its own level.
 *
 * A class opts in by exposing `static LogPartition& get_log_partition()`;
 * the OLOG* macros then prefix every line with the partition name and
 * filter on its level instead of the global one.
 */
class LogPartition
{
public:
    LogPartition(const std::string& name, LogLevel level = LogLevel::INHERIT)
        : name_(name), level_(level)
    {
    }

    const std::string&
    name() const
    {
        return name_;
    }

    LogLevel
    level() const
    {
        LogLevel own = level_.load();
        return (own == LogLevel::INHERIT) ? Logger::get_level() : own;
    }

    void
    set_level(LogLevel level)
    {
        level_ = level;
    }

    bool
    should_log(LogLevel message_level) const
    {
        LogLevel effective_level = level();
        return effective_level != LogLevel::NONE &&
            message_level <= effective_level;
    }

private:
    std::string name_;
    std::atomic<LogLevel> level_;
};

}  // namespace rangepart

// Class-aware logging macros with file and line info at the end
#define OLOGE(...)                               \
    rangepart::detail::log_with_partition_check( \
        rangepart::LogLevel::ERROR,              \
        __RELATIVE_FILEPATH__,                   \
        __LINE__,                                \
        this,                                    \
        __VA_ARGS__)
#define OLOGW(...)                               \
    rangepart::detail::log_with_partition_check( \
        rangepart::LogLevel::WARNING,            \
        __RELATIVE_FILEPATH__,                   \
        __LINE__,                                \
        this,                                    \
        __VA_ARGS__)
#define OLOGI(...)                               \
    rangepart::detail::log_with_partition_check( \
        rangepart::LogLevel::INFO,               \
        __RELATIVE_FILEPATH__,                   \
        __LINE__,                                \
        this,                                    \
        __VA_ARGS__)
#define OLOGD(...)                               \
    rangepart::detail::log_with_partition_check( \
        rangepart::LogLevel::DEBUG,              \
        __RELATIVE_FILEPATH__,                   \
        __LINE__,                                \
        this,                                    \
        __VA_ARGS__)

#define LOGE(...)                         \
    rangepart::Logger::log(               \
        rangepart::LogLevel::ERROR,       \
        __VA_ARGS__,                      \
        " (",                             \
        __RELATIVE_FILEPATH__,            \
        ":",                              \
        __LINE__,                         \
        ")")
#define LOGW(...)                                                       \
    if (rangepart::Logger::get_level() >= rangepart::LogLevel::WARNING) \
    rangepart::Logger::log(                                             \
        rangepart::LogLevel::WARNING,                                   \
        __VA_ARGS__,                                                    \
        " (",                                                           \
        __RELATIVE_FILEPATH__,                                          \
        ":",                                                            \
        __LINE__,                                                       \
        ")")
#define LOGI(...)                                                    \
    if (rangepart::Logger::get_level() >= rangepart::LogLevel::INFO) \
    rangepart::Logger::log(                                          \
        rangepart::LogLevel::INFO,                                   \
        __VA_ARGS__,                                                 \
        " (",                                                        \
        __RELATIVE_FILEPATH__,                                       \
        ":",                                                         \
        __LINE__,                                                    \
        ")")
#define LOGD(...)                                                     \
    if (rangepart::Logger::get_level() >= rangepart::LogLevel::DEBUG) \
    rangepart::Logger::log(                                           \
        rangepart::LogLevel::DEBUG,                                   \
        __VA_ARGS__,                                                  \
        " (",                                                         \
        __RELATIVE_FILEPATH__,                                        \
        ":",                                                          \
        __LINE__,                                                     \
        ")")
