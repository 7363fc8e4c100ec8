/**
 * @file log_timestamp.hpp
 * @brief Wall clock and monotonic readers plus the per-thread timestamp cache
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <chrono>

#include "log_types.hpp"

#if defined(__APPLE__) || defined(__linux__)
    #include <time.h>
#endif

namespace nexuslog
{

inline constexpr uint32_t NANOS_PER_SECOND = 1'000'000'000;

/**
 * @brief Wall clock time of a log entry
 *
 * Always derived from a clock reading, never user supplied. nanos is
 * strictly less than one second.
 */
struct log_timestamp
{
    uint64_t secs{0};  ///< Seconds since the Unix epoch
    uint32_t nanos{0}; ///< Nanoseconds within the second

    friend bool operator==(const log_timestamp &, const log_timestamp &) = default;
};

/**
 * @brief Monotonic reading used to anchor the per-thread cache
 */
inline std::chrono::steady_clock::time_point log_fast_timestamp()
{
#if defined(__APPLE__) || defined(__linux__)
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);

    auto duration = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return std::chrono::steady_clock::time_point(std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration));
#else
    return std::chrono::steady_clock::now();
#endif
}

/**
 * @brief Read the wall clock
 *
 * Readings before the epoch clamp to zero.
 */
inline log_timestamp log_wall_timestamp()
{
#if defined(__APPLE__) || defined(__linux__)
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    if (ts.tv_sec < 0) return {};
    return {static_cast<uint64_t>(ts.tv_sec), static_cast<uint32_t>(ts.tv_nsec)};
#else
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    if (since_epoch.count() < 0) return {};
    auto secs  = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
    return {static_cast<uint64_t>(secs.count()), static_cast<uint32_t>(nanos.count())};
#endif
}

/**
 * @brief Per-thread wall clock cache anchored on the monotonic clock
 *
 * Holds a monotonic reading and the wall clock value taken at that reading.
 * Requests within TIMESTAMP_RESYNC_INTERVAL of the anchor are answered by
 * adding the monotonic delta to the anchored wall time; older anchors are
 * replaced by a fresh wall clock reading. A system clock adjustment made
 * between two resyncs is therefore only observed at the next resync.
 */
class thread_timestamp_cache
{
  public:
    thread_timestamp_cache() { refresh(log_fast_timestamp()); }

    log_timestamp now() { return now_at(log_fast_timestamp()); }

    /**
     * @brief Wall time corresponding to the monotonic reading @p mono
     */
    log_timestamp now_at(std::chrono::steady_clock::time_point mono)
    {
        auto elapsed = mono - anchor_;
        if (elapsed >= TIMESTAMP_RESYNC_INTERVAL || elapsed < std::chrono::steady_clock::duration::zero())
        {
            return refresh(mono);
        }

        uint64_t total_nanos =
            base_.nanos + static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
        return {base_.secs + total_nanos / NANOS_PER_SECOND, static_cast<uint32_t>(total_nanos % NANOS_PER_SECOND)};
    }

    std::chrono::steady_clock::time_point anchor() const noexcept { return anchor_; }
    log_timestamp base() const noexcept { return base_; }

  private:
    log_timestamp refresh(std::chrono::steady_clock::time_point mono)
    {
        base_   = log_wall_timestamp();
        anchor_ = mono;
        return base_;
    }

    std::chrono::steady_clock::time_point anchor_;
    log_timestamp base_;
};

/**
 * @brief Timestamp for a new entry from the calling thread's cache
 */
inline log_timestamp cached_timestamp()
{
    thread_local thread_timestamp_cache cache;
    return cache.now();
}

} // namespace nexuslog
