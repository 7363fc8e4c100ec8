/**
 * @file log_formatters.hpp
 * @brief Line formatting for sink workers
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 *
 * Two line shapes are produced, selected per sink:
 *
 * @code
 * time=2024-01-15T10:30:00.123456+01:00 level=info name=app msg="started"
 * time=1705311000.123456789 level=info name=app msg="started"
 * @endcode
 *
 * The message is copied byte for byte. Quotes and newlines inside it are
 * not escaped.
 */
#pragma once

#include <cstdint>
#include <ctime>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>

#include "fmt_config.hpp" // IWYU pragma: keep

#include "log_types.hpp"
#include "log_entry.hpp"

namespace nexuslog
{

/**
 * @brief Local calendar date packed as YYYYMMDD, 0 when unset
 */
using log_date = uint32_t;

/**
 * @brief Per-second cache of the rendered time fields
 *
 * Consecutive entries mostly share the same whole second, so the calendar
 * breakdown, the UTC offset and the prefix strings are only recomputed when
 * the second changes.
 */
class timestamp_cache
{
  public:
    /**
     * @brief Make the cache describe @p secs
     */
    void update(uint64_t secs)
    {
        if (secs == last_secs_) return;

        std::time_t t = static_cast<std::time_t>(secs);
        std::tm tm{};
        if (!localtime_r(&t, &tm)) { gmtime_r(&t, &tm); }

        last_secs_ = secs;
        date_      = static_cast<log_date>((tm.tm_year + 1900) * 10000 + (tm.tm_mon + 1) * 100 + tm.tm_mday);

        long offset      = tm.tm_gmtoff;
        char offset_sign = offset >= 0 ? '+' : '-';
        long offset_abs  = offset >= 0 ? offset : -offset;

        calendar_prefix_.clear();
        fmt::format_to(std::back_inserter(calendar_prefix_),
                       "time={:04}-{:02}-{:02}T{:02}:{:02}:{:02}.",
                       tm.tm_year + 1900,
                       tm.tm_mon + 1,
                       tm.tm_mday,
                       tm.tm_hour,
                       tm.tm_min,
                       tm.tm_sec);

        offset_suffix_.clear();
        fmt::format_to(std::back_inserter(offset_suffix_),
                       "{}{:02}:{:02} level=",
                       offset_sign,
                       offset_abs / 3600,
                       (offset_abs % 3600) / 60);

        unix_prefix_.clear();
        fmt::format_to(std::back_inserter(unix_prefix_), "time={}.", secs);
    }

    uint64_t seconds() const noexcept { return last_secs_; }
    log_date date() const noexcept { return date_; }

    /// "time=YYYY-MM-DDTHH:MM:SS."
    std::string_view calendar_prefix() const noexcept { return calendar_prefix_; }

    /// "+HH:MM level="
    std::string_view offset_suffix() const noexcept { return offset_suffix_; }

    /// "time=<epoch seconds>."
    std::string_view unix_prefix() const noexcept { return unix_prefix_; }

  private:
    uint64_t last_secs_{std::numeric_limits<uint64_t>::max()};
    log_date date_{0};
    std::string calendar_prefix_;
    std::string offset_suffix_;
    std::string unix_prefix_;
};

/**
 * @brief Formats entries into text lines for one sink
 */
class line_formatter
{
  public:
    explicit line_formatter(timestamp_mode mode = timestamp_mode::calendar) : mode_(mode) {}

    timestamp_mode mode() const noexcept { return mode_; }

    /**
     * @brief Local date of @p ts, used for rotation
     */
    log_date date_of(log_timestamp ts)
    {
        cache_.update(ts.secs);
        return cache_.date();
    }

    /**
     * @brief Append the full line for @p entry, newline included, to @p out
     */
    void format(const log_entry &entry, fmt::memory_buffer &out)
    {
        auto ts = entry.timestamp();
        cache_.update(ts.secs);

        auto level = string_from_log_level(entry.level());

        if (mode_ == timestamp_mode::unix_epoch)
        {
            append(out, cache_.unix_prefix());
            fmt::format_to(std::back_inserter(out), "{:09} level=", ts.nanos);
        }
        else
        {
            append(out, cache_.calendar_prefix());
            fmt::format_to(std::back_inserter(out), "{:06}", ts.nanos / 1000);
            append(out, cache_.offset_suffix());
        }
        append(out, level);

        if (const std::string *name = entry.name())
        {
            append(out, " name=");
            append(out, *name);
        }

        append(out, " msg=\"");
        append(out, entry.message());
        append(out, "\"\n");
    }

  private:
    static void append(fmt::memory_buffer &out, std::string_view sv) { out.append(sv.data(), sv.data() + sv.size()); }

    timestamp_mode mode_;
    timestamp_cache cache_;
};

} // namespace nexuslog
