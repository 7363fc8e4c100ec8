/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the logging system
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <algorithm>
#include <cctype>
#include <chrono>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace nexuslog
{

// Transport configuration
inline constexpr size_t CHANNEL_CAPACITY = 65536; // Max directives queued per sink before producers block

// Producer configuration
inline constexpr size_t INLINE_MESSAGE_CAPACITY = 256; // Messages up to this size never allocate
inline constexpr size_t ENTRY_BATCH_SIZE        = 32;  // Entries accumulated per thread before hand-off

// Writer configuration
inline constexpr size_t WRITER_BUFFER_SIZE = 1024 * 1024; // Buffered bytes held by the worker before a write()

// Timing configuration
inline constexpr auto WORKER_RECV_TIMEOUT       = std::chrono::seconds(1); // Max wait for the next directive
inline constexpr auto FLUSH_INTERVAL            = std::chrono::seconds(1); // Periodic flush bound
inline constexpr auto TIMESTAMP_RESYNC_INTERVAL = std::chrono::seconds(1); // Per-thread wall clock resync

/**
 * @brief Enumeration of available log levels in ascending order of severity
 */
enum class log_level : uint8_t
{
    trace = 0, ///< Finest-grained information
    debug = 1, ///< Debugging information
    info  = 2, ///< General information
    warn  = 3, ///< Warning messages
    error = 4, ///< Error messages
};

inline constexpr size_t LOG_LEVEL_COUNT = 5;

// Level names as written into the level= field
inline constexpr std::array<std::string_view, LOG_LEVEL_COUNT> log_level_names = {
    "trace",
    "debug",
    "info",
    "warn",
    "error",
};

/**
 * @brief How the time= field of a line is rendered
 */
enum class timestamp_mode : uint8_t
{
    calendar, ///< Local calendar time with microseconds and UTC offset
    unix_epoch ///< Seconds since the epoch with nanoseconds
};

/**
 * @brief Convert string to log_level
 * @param str Level name (case insensitive)
 * @return Corresponding log_level, or std::nullopt if the name is not recognized
 *
 * Recognized values: "trace", "debug", "info", "warn", "warning", "error"
 */
inline std::optional<log_level> log_level_from_string(std::string_view str)
{
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error") return log_level::error;

    return std::nullopt;
}

/**
 * @brief Convert log_level to string
 * @param level The log level
 * @return String representation of the level
 */
inline std::string_view string_from_log_level(log_level level)
{
    auto idx = static_cast<size_t>(level);
    return idx < log_level_names.size() ? log_level_names[idx] : std::string_view{"unknown"};
}

} // namespace nexuslog
