/**
 * @file log_file_rotator.hpp
 * @brief Daily rotation of sink output files
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 *
 * A file sink writes to a file whose name carries the local date of the
 * entries in it:
 *
 * @code
 * logs/app.log  ->  logs/app_20240115.log
 * logs/app      ->  logs/app_20240115.log   (no extension: suffix and .log appended)
 * @endcode
 *
 * The console sink is never rotated.
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <unistd.h>

#include "fmt_config.hpp" // IWYU pragma: keep

#include "log_formatters.hpp"
#include "log_writers.hpp"

namespace nexuslog
{

/**
 * @brief File name for @p path on @p date
 *
 * "_YYYYMMDD" goes between the stem and the extension. When the path has no
 * stem/extension pair, "_YYYYMMDD.log" is appended to the raw path string.
 */
inline std::string rotated_filename(const std::string &path, log_date date)
{
    auto postfix = fmt::format("_{:08}", date);

    std::filesystem::path input(path);
    auto stem = input.stem().string();
    auto ext  = input.extension().string();

    // extension() keeps the leading dot
    if (stem.empty() || ext.empty()) { return path + postfix + ".log"; }

    auto filename = stem + postfix + ext;
    auto parent   = input.parent_path();
    if (parent.empty()) return filename;
    return (parent / filename).string();
}

/**
 * @brief Owns the open target of one sink and swaps it when the date changes
 *
 * Nothing is opened until the first entry arrives. A file target is opened
 * for the entry's local date; a later entry with a different date flushes
 * and closes the current file and opens the file for the new date. The
 * console target is opened on first use and kept for the sink's lifetime.
 */
class daily_rotator
{
  public:
    /**
     * @param path Configured file path, or std::nullopt for standard output
     */
    explicit daily_rotator(std::optional<std::string> path) : path_(std::move(path)) {}

    bool is_console() const noexcept { return !path_.has_value(); }
    log_date current_date() const noexcept { return date_; }

    /**
     * @brief Writer for an entry dated @p date, rotating first if needed
     * @throws std::system_error if the new file cannot be opened
     */
    file_writer &writer_for(log_date date)
    {
        if (is_console())
        {
            if (!writer_.is_open()) { writer_ = file_writer(STDOUT_FILENO, false, "stdout"); }
            return writer_;
        }

        if (date != date_ || !writer_.is_open()) { rotate(date); }
        return writer_;
    }

    /**
     * @brief Push buffered output of the current target, if any
     */
    void flush()
    {
        if (writer_.is_open()) { writer_.flush(); }
    }

    /**
     * @brief Filename currently written to, empty before the first open
     */
    const std::string &current_filename() const noexcept { return writer_.filename(); }

  private:
    void rotate(log_date date)
    {
        flush();
        writer_ = file_writer{};
        writer_ = file_writer::open_append(rotated_filename(*path_, date));
        date_   = date;
    }

    std::optional<std::string> path_;
    log_date date_{0};
    file_writer writer_;
};

} // namespace nexuslog
