/**
 * @file log_entry.hpp
 * @brief In-memory representation of a log record and the messages carrying it
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <array>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fmt_config.hpp" // IWYU pragma: keep

#include "log_types.hpp"
#include "log_timestamp.hpp"

namespace nexuslog
{

/**
 * @brief Message text of an entry
 *
 * Text up to INLINE_MESSAGE_CAPACITY bytes is stored inline without any
 * allocation. Longer text is held in a heap string, complete and
 * untruncated. Which storage is used is decided once at construction;
 * both are read through view().
 */
class log_message
{
  public:
    log_message() = default;

    explicit log_message(std::string_view text)
    {
        if (text.size() <= INLINE_MESSAGE_CAPACITY)
        {
            std::memcpy(inline_.data(), text.data(), text.size());
            inline_len_ = static_cast<uint16_t>(text.size());
        }
        else { heap_ = std::make_unique<std::string>(text); }
    }

    /**
     * @brief Render a format string into the message
     *
     * Formatting targets the inline buffer first. If fmt reports that the
     * output did not fit, the message is rendered again into a heap string.
     */
    template <typename... Args> static log_message format(fmt::format_string<Args...> fmt, Args &&...args)
    {
        log_message msg;
        auto store  = fmt::make_format_args(args...);
        auto result = fmt::vformat_to_n(msg.inline_.data(), msg.inline_.size(), fmt::string_view(fmt), store);
        if (result.size <= INLINE_MESSAGE_CAPACITY) { msg.inline_len_ = static_cast<uint16_t>(result.size); }
        else { msg.heap_ = std::make_unique<std::string>(fmt::vformat(fmt::string_view(fmt), store)); }
        return msg;
    }

    // Only the used part of the inline buffer is copied
    log_message(log_message &&other) noexcept : heap_(std::move(other.heap_)), inline_len_(other.inline_len_)
    {
        std::memcpy(inline_.data(), other.inline_.data(), inline_len_);
        other.inline_len_ = 0;
    }

    log_message &operator=(log_message &&other) noexcept
    {
        if (this != &other)
        {
            heap_       = std::move(other.heap_);
            inline_len_ = std::exchange(other.inline_len_, uint16_t{0});
            std::memcpy(inline_.data(), other.inline_.data(), inline_len_);
        }
        return *this;
    }

    log_message(const log_message &)            = delete;
    log_message &operator=(const log_message &) = delete;

    std::string_view view() const noexcept
    {
        if (heap_) return *heap_;
        return {inline_.data(), inline_len_};
    }

    size_t size() const noexcept { return view().size(); }
    bool is_inline() const noexcept { return !heap_; }

  private:
    std::unique_ptr<std::string> heap_;
    uint16_t inline_len_{0};
    std::array<char, INLINE_MESSAGE_CAPACITY> inline_;
};

/**
 * @brief One structured log record
 *
 * Immutable once built. The logger name is shared with every other entry
 * from loggers using that name; a null name omits the name= field.
 */
class log_entry
{
  public:
    log_entry() = default;

    log_entry(log_timestamp ts, std::shared_ptr<const std::string> name, log_level level, log_message msg)
    : ts_(ts), name_(std::move(name)), level_(level), msg_(std::move(msg))
    {
    }

    log_entry(log_entry &&) noexcept            = default;
    log_entry &operator=(log_entry &&) noexcept = default;

    log_timestamp timestamp() const noexcept { return ts_; }
    const std::string *name() const noexcept { return name_.get(); }
    log_level level() const noexcept { return level_; }
    std::string_view message() const noexcept { return msg_.view(); }
    bool message_is_inline() const noexcept { return msg_.is_inline(); }

  private:
    log_timestamp ts_;
    std::shared_ptr<const std::string> name_;
    log_level level_{log_level::info};
    log_message msg_;
};

/// Entries from one producer thread in call order
using log_batch = std::vector<log_entry>;

/**
 * @brief Message sent to a sink worker
 *
 * Data and lifecycle control share one channel so that a flush or exit is
 * observed after every batch the same thread sent before it.
 */
struct directive
{
    enum class kind : uint8_t
    {
        write_batch, ///< Format and write batch in order
        flush,       ///< Push buffered output to the target
        exit         ///< Flush and terminate the worker
    };

    kind type{kind::flush};
    log_batch batch;

    static directive write(log_batch b) { return {kind::write_batch, std::move(b)}; }
    static directive flush() { return {kind::flush, {}}; }
    static directive exit() { return {kind::exit, {}}; }
};

} // namespace nexuslog
