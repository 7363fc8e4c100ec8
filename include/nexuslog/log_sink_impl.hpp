/**
 * @file log_sink_impl.hpp
 * @brief Implementation of the sink worker and shared sink lifecycle
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdio>
#include <exception>

#include "log_sink.hpp"

namespace nexuslog
{

inline sink_worker::sink_worker(const sink_config &config)
: rotator_(config.path),
  formatter_(config.timestamps),
  last_flush_(log_fast_timestamp())
{
}

inline void sink_worker::run(directive_queue &queue)
{
    auto token = queue.consumer_token();
    state_      = state::running;
    last_flush_ = log_fast_timestamp();

    while (state_ == state::running)
    {
        directive d;
        if (queue.pop_wait(token, d, WORKER_RECV_TIMEOUT)) { handle(d); }

        if (state_ == state::running) { flush_if_due(log_fast_timestamp()); }
    }

    drain(queue);
    flush();
    state_ = state::stopped;
}

inline void sink_worker::drain(directive_queue &queue)
{
    // The queue is FIFO per producer only, so batches other threads finished
    // sending before the exit may still be queued behind it
    directive d;
    while (queue.try_pop(d))
    {
        if (d.type == directive::kind::write_batch) { write_batch(d.batch); }
    }
}

inline bool sink_worker::handle(directive &d)
{
    switch (d.type)
    {
    case directive::kind::write_batch: write_batch(d.batch); return true;
    case directive::kind::flush: flush(); return true;
    case directive::kind::exit: state_ = state::draining; return false;
    }
    return true;
}

inline void sink_worker::write_batch(const log_batch &batch)
{
    for (const auto &entry : batch) { write_entry(entry); }
}

inline void sink_worker::write_entry(const log_entry &entry)
{
    // The console never rotates, so its date lookup is skipped
    log_date date = rotator_.is_console() ? 0 : formatter_.date_of(entry.timestamp());
    file_writer &out = rotator_.writer_for(date);

    line_.clear();
    formatter_.format(entry, line_);
    out.write(line_.data(), line_.size());
}

inline void sink_worker::flush()
{
    rotator_.flush();
    last_flush_ = log_fast_timestamp();
}

inline void sink_worker::flush_if_due(std::chrono::steady_clock::time_point now)
{
    if (now - last_flush_ >= FLUSH_INTERVAL) { flush(); }
}

inline shared_sink::shared_sink(sink_config config)
: config_(std::move(config)),
  channel_(std::make_shared<directive_queue>(config_.channel_capacity)),
  worker_thread_(&shared_sink::worker_thread_func, this)
{
}

inline shared_sink::~shared_sink() { stop(); }

inline void shared_sink::stop()
{
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (!worker_thread_.joinable()) return;

    // A failed worker has already closed the channel; the push is then a no-op
    channel_->push(directive::exit());
    worker_thread_.join();
}

inline void shared_sink::worker_thread_func()
{
    try
    {
        sink_worker worker(config_);
        worker.run(*channel_);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[LOG] Sink {} stopped: {}\n", describe(), e.what());
    }

    channel_->close();
    worker_done_.store(true, std::memory_order_release);
}

inline std::string shared_sink::describe() const { return config_.path ? *config_.path : std::string("stdout"); }

} // namespace nexuslog
