/**
 * @file log_line.hpp
 * @brief Producer side: per-thread batching of entries
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <utility>

#include "log_types.hpp"
#include "log_entry.hpp"
#include "log_sink.hpp"

namespace nexuslog
{

/**
 * @brief Entries accumulated by one thread for one sink
 *
 * Owned exclusively by its thread, so appending needs no synchronization.
 * When ENTRY_BATCH_SIZE entries have accumulated the batch is swapped for an
 * empty one and sent to the sink's channel as a single write directive.
 *
 * A batch is bound to one channel at a time. Appending an entry for another
 * sink first sends the pending entries to the sink they were logged for, so
 * per-thread call order holds within every sink. Pending entries are also
 * sent when the thread exits.
 */
class thread_batch
{
  public:
    thread_batch() { entries_.reserve(ENTRY_BATCH_SIZE); }

    ~thread_batch() { hand_off(); }

    thread_batch(const thread_batch &)            = delete;
    thread_batch &operator=(const thread_batch &) = delete;

    /**
     * @brief The calling thread's batch
     */
    static thread_batch &current()
    {
        thread_local thread_batch batch;
        return batch;
    }

    /**
     * @brief Append @p entry for @p channel, sending the batch once full
     *
     * Blocks only if the batch is sent and the channel is full.
     */
    void push(const std::shared_ptr<directive_queue> &channel, log_entry &&entry)
    {
        if (channel_ != channel)
        {
            hand_off();
            channel_ = channel;
        }

        entries_.push_back(std::move(entry));
        if (entries_.size() >= ENTRY_BATCH_SIZE) { hand_off(); }
    }

    /**
     * @brief Send pending entries now if they belong to @p channel
     */
    void flush(const std::shared_ptr<directive_queue> &channel)
    {
        if (channel_ == channel) { hand_off(); }
    }

    size_t pending() const noexcept { return entries_.size(); }

  private:
    void hand_off()
    {
        if (entries_.empty() || !channel_) return;

        log_batch full;
        full.reserve(ENTRY_BATCH_SIZE);
        std::swap(full, entries_);

        // Dropped if the worker is gone
        channel_->push(directive::write(std::move(full)));
    }

    std::shared_ptr<directive_queue> channel_;
    log_batch entries_;
};

} // namespace nexuslog
