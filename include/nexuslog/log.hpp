/**
 * @file log.hpp
 * @brief Asynchronous structured logger
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 *
 * Call sites build an entry and append it to a thread-local batch; a
 * dedicated worker thread per output destination formats, rotates, and
 * writes the entries. Loggers on the same destination share one worker.
 *
 * Basic Usage:
 * @code
 * nexuslog::logger log({.name = "api", .path = "logs/api.log", .level = nexuslog::log_level::debug});
 *
 * log.info("listening on port {}", 8080);
 * log.print(nexuslog::log_level::warn, user_supplied_text); // no format parsing
 * // logs/api_20240115.log:
 * // time=2024-01-15T10:30:00.123456+01:00 level=info name=api msg="listening on port 8080"
 *
 * log.shutdown(); // flush, and stop the worker if no other logger shares it
 * @endcode
 *
 * Process-wide defaults:
 * @code
 * nexuslog::basic_config("logs/app.log", nexuslog::timestamp_mode::unix_epoch);
 * auto a = nexuslog::get_logger("a");
 * auto b = nexuslog::get_logger("b", nexuslog::log_level::debug);
 * // a and b write to the same file through the same worker
 * @endcode
 *
 * Thread Safety:
 * - All logging calls are thread-safe and lock-free unless the channel is full
 * - Entries from one thread reach one sink in call order
 * - Entries from different threads may interleave in any order
 * - Timestamps reflect the logging call, not the write
 * - Entries still batched on another thread when a sink stops are lost
 */
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "fmt_config.hpp" // IWYU pragma: keep

#include "log_types.hpp"
#include "log_timestamp.hpp"
#include "log_entry.hpp"
#include "log_sink.hpp"
#include "log_registry.hpp"
#include "log_line.hpp"

namespace nexuslog
{

/**
 * @brief Construction parameters of a logger
 */
struct logger_options
{
    std::optional<std::string> name;                  ///< Label written as name=; omitted when unset
    std::optional<std::string> path;                  ///< Output file path, std::nullopt for standard output
    log_level level = log_level::info;                ///< Minimum level recorded
    std::optional<timestamp_mode> timestamps;         ///< Time rendering; the process default when unset
};

/**
 * @brief Process-wide defaults used by get_logger()
 */
class log_defaults
{
  public:
    static log_defaults &instance()
    {
        static log_defaults inst;
        return inst;
    }

    void set(std::optional<std::string> path, timestamp_mode timestamps)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path_       = std::move(path);
        timestamps_ = timestamps;
    }

    std::optional<std::string> path() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return path_;
    }

    timestamp_mode timestamps() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return timestamps_;
    }

  private:
    log_defaults() = default;

    mutable std::mutex mutex_;
    std::optional<std::string> path_;
    timestamp_mode timestamps_{timestamp_mode::calendar};
};

/**
 * @brief Handle for logging to one sink
 *
 * Several loggers may share a sink; the sink's worker stops when the last
 * of them is destroyed or shut down. The minimum level is atomic and may be
 * changed from any thread while others are logging.
 */
class logger
{
  public:
    explicit logger(const logger_options &options = {})
    : sink_(sink_registry::instance().resolve(
          {.path = options.path, .timestamps = options.timestamps.value_or(log_defaults::instance().timestamps())})),
      name_(options.name ? std::make_shared<const std::string>(*options.name) : nullptr),
      level_(static_cast<uint8_t>(options.level))
    {
    }

    logger(logger &&other) noexcept
    : sink_(std::move(other.sink_)),
      name_(std::move(other.name_)),
      level_(other.level_.load(std::memory_order_relaxed))
    {
    }

    logger &operator=(logger &&other) noexcept
    {
        if (this != &other)
        {
            if (sink_) { thread_batch::current().flush(sink_->channel()); }
            sink_ = std::move(other.sink_);
            name_ = std::move(other.name_);
            level_.store(other.level_.load(std::memory_order_relaxed), std::memory_order_relaxed);
        }
        return *this;
    }

    logger(const logger &)            = delete;
    logger &operator=(const logger &) = delete;

    // Hands off the calling thread's pending entries before the sink may stop
    ~logger()
    {
        if (sink_) { thread_batch::current().flush(sink_->channel()); }
    }

    void set_level(log_level level) noexcept { level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed); }
    log_level level() const noexcept { return static_cast<log_level>(level_.load(std::memory_order_relaxed)); }

    bool enabled(log_level level) const noexcept
    {
        return sink_ && static_cast<uint8_t>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Log @p text as is, without format parsing
     */
    void print(log_level level, std::string_view text)
    {
        if (!enabled(level)) return;
        submit(level, log_message(text));
    }

    template <typename... Args> void format(log_level level, fmt::format_string<Args...> fmt, Args &&...args)
    {
        if (!enabled(level)) return;
        submit(level, log_message::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args> void trace(fmt::format_string<Args...> fmt, Args &&...args)
    {
        format(log_level::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void debug(fmt::format_string<Args...> fmt, Args &&...args)
    {
        format(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void info(fmt::format_string<Args...> fmt, Args &&...args)
    {
        format(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void warn(fmt::format_string<Args...> fmt, Args &&...args)
    {
        format(log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void error(fmt::format_string<Args...> fmt, Args &&...args)
    {
        format(log_level::error, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Send this thread's pending entries and ask the worker to flush
     *
     * Returns once the flush is queued, not once it has happened.
     */
    void flush()
    {
        if (!sink_) return;
        thread_batch::current().flush(sink_->channel());
        sink_->send(directive::flush());
    }

    /**
     * @brief Flush, then stop the sink's worker if this logger is its only owner
     *
     * Stopping waits until the worker has written everything queued before
     * the exit directive and terminated.
     */
    void shutdown()
    {
        if (!sink_) return;
        flush();
        if (sink_.use_count() == 1) { sink_->stop(); }
    }

    const std::string *name() const noexcept { return name_.get(); }
    const std::shared_ptr<shared_sink> &sink() const noexcept { return sink_; }

  private:
    void submit(log_level level, log_message &&msg)
    {
        thread_batch::current().push(sink_->channel(), log_entry(cached_timestamp(), name_, level, std::move(msg)));
    }

    std::shared_ptr<shared_sink> sink_;
    std::shared_ptr<const std::string> name_;
    std::atomic<uint8_t> level_;
};

/**
 * @brief Set the default target and time rendering used by get_logger()
 *
 * Affects sinks created afterwards only.
 */
inline void basic_config(std::optional<std::string> path = std::nullopt,
                         timestamp_mode timestamps      = timestamp_mode::calendar)
{
    log_defaults::instance().set(std::move(path), timestamps);
}

/**
 * @brief Logger on the default target
 */
inline logger get_logger(std::optional<std::string> name = std::nullopt, log_level level = log_level::info)
{
    return logger({.name = std::move(name), .path = log_defaults::instance().path(), .level = level});
}

} // namespace nexuslog
