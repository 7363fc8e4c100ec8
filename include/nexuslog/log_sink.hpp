/**
 * @file log_sink.hpp
 * @brief Sink worker and the shared sink owning it
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 *
 * A sink is one output destination (a file path or standard output) served
 * by exactly one worker thread. Producers never touch the output: they hand
 * batches to the sink's channel and the worker formats, rotates, and writes
 * them in the order the channel delivers them.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "fmt_config.hpp" // IWYU pragma: keep

#include "log_types.hpp"
#include "log_entry.hpp"
#include "log_queue.hpp"
#include "log_formatters.hpp"
#include "log_file_rotator.hpp"

namespace nexuslog
{

using directive_queue = bounded_queue<directive>;

/**
 * @brief Construction parameters of a sink
 */
struct sink_config
{
    std::optional<std::string> path;                     ///< Output file path, std::nullopt for standard output
    timestamp_mode timestamps = timestamp_mode::calendar; ///< Rendering of the time= field
    size_t channel_capacity   = CHANNEL_CAPACITY;         ///< Directives queued before producers block
};

/**
 * @brief Consumer side of a sink
 *
 * Owns the open target, the rotation date, and the per-second timestamp
 * cache. Used only by the thread running run(); the individual operations
 * are public so the formatting and rotation path can be driven directly.
 */
class sink_worker
{
  public:
    enum class state : uint8_t
    {
        running,  ///< Reading directives
        draining, ///< Exit received: write what is still queued, flush, then stop
        stopped   ///< Thread function has returned
    };

    explicit sink_worker(const sink_config &config);

    /**
     * @brief Process directives until an exit directive arrives
     *
     * Waits at most WORKER_RECV_TIMEOUT for each directive. Whatever happened,
     * output older than FLUSH_INTERVAL is flushed before waiting again.
     *
     * @throws std::system_error on open, write, or flush failure
     */
    void run(directive_queue &queue);

    /**
     * @brief Handle one directive
     * @return false once an exit directive has been handled
     */
    bool handle(directive &d);

    /**
     * @brief Write every batch still queued, without waiting
     *
     * Called after the exit directive. No owner can send once the last one
     * has asked the worker to exit, so an empty queue means nothing is lost.
     */
    void drain(directive_queue &queue);

    void write_batch(const log_batch &batch);
    void write_entry(const log_entry &entry);
    void flush();
    void flush_if_due(std::chrono::steady_clock::time_point now);

    state current_state() const noexcept { return state_; }
    const daily_rotator &rotator() const noexcept { return rotator_; }

  private:
    daily_rotator rotator_;
    line_formatter formatter_;
    fmt::memory_buffer line_;
    std::chrono::steady_clock::time_point last_flush_;
    state state_{state::running};
};

/**
 * @brief One worker thread and its channel, shared by every logger on a target
 *
 * The worker thread starts in the constructor. Nothing is opened until the
 * worker sees its first entry. Destroying the shared sink sends an exit
 * directive and waits for the worker to finish; the thread handle is
 * guarded by a mutex so stop() may race with the destructor of another
 * owner.
 *
 * If the worker fails it reports once to stderr, closes the channel, and
 * exits. Sends after that are dropped without error.
 */
class shared_sink
{
  public:
    explicit shared_sink(sink_config config);
    ~shared_sink();

    shared_sink(const shared_sink &)            = delete;
    shared_sink &operator=(const shared_sink &) = delete;

    /**
     * @brief Queue a directive, blocking while the channel is full
     * @return false if the worker is gone and the directive was dropped
     */
    bool send(directive &&d) { return channel_->push(std::move(d)); }

    /**
     * @brief Send exit and join the worker. Idempotent
     */
    void stop();

    /// True until the worker thread function has returned
    bool running() const noexcept { return !worker_done_.load(std::memory_order_acquire); }

    const sink_config &config() const noexcept { return config_; }
    const std::shared_ptr<directive_queue> &channel() const noexcept { return channel_; }

  private:
    void worker_thread_func();
    std::string describe() const;

    sink_config config_;
    std::shared_ptr<directive_queue> channel_;
    std::atomic<bool> worker_done_{false};

    std::mutex thread_mutex_;
    std::thread worker_thread_;
};

} // namespace nexuslog

#include "log_sink_impl.hpp" // IWYU pragma: keep
