/**
 * @file log_queue.hpp
 * @brief Bounded multi-producer single-consumer channel with backpressure
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <utility>

#include "moodycamel/concurrentqueue.h"
#include "moodycamel/blockingconcurrentqueue.h"
#include "moodycamel/lightweightsemaphore.h"

namespace nexuslog
{

/**
 * @brief Bounded channel between producer threads and one sink worker
 *
 * The blocking queue wakes the consumer; a separate semaphore counts free
 * slots so that a full channel blocks producers instead of growing. Each
 * producer thread feeds its own moodycamel implicit sub-queue, so items
 * from one thread are dequeued in the order that thread pushed them.
 * Nothing is ordered across threads.
 *
 * Once closed, push() returns false without enqueuing. Producers already
 * blocked on a full channel are released one after another: each woken
 * producer passes the wake-up on before returning.
 */
template <typename T> class bounded_queue
{
  public:
    explicit bounded_queue(size_t capacity)
    : queue_(capacity),
      free_slots_(static_cast<moodycamel::LightweightSemaphore::ssize_t>(capacity)),
      capacity_(capacity)
    {
    }

    bounded_queue(const bounded_queue &)            = delete;
    bounded_queue &operator=(const bounded_queue &) = delete;

    /**
     * @brief Enqueue, blocking while the channel is full
     * @return false if the channel is closed; the item is dropped
     */
    bool push(T &&item)
    {
        if (closed_.load(std::memory_order_acquire)) return false;

        while (!free_slots_.wait()) {}

        if (closed_.load(std::memory_order_acquire))
        {
            free_slots_.signal();
            return false;
        }

        queue_.enqueue(std::move(item));
        return true;
    }

    /**
     * @brief Enqueue only if a slot is free right now
     * @return false if the channel is full or closed
     */
    bool try_push(T &&item)
    {
        if (closed_.load(std::memory_order_acquire)) return false;
        if (!free_slots_.tryWait()) return false;

        if (closed_.load(std::memory_order_acquire))
        {
            free_slots_.signal();
            return false;
        }

        queue_.enqueue(std::move(item));
        return true;
    }

    /**
     * @brief Dequeue, waiting at most @p timeout for an item
     */
    template <typename Rep, typename Period>
    bool pop_wait(moodycamel::ConsumerToken &token, T &out, std::chrono::duration<Rep, Period> timeout)
    {
        if (!queue_.wait_dequeue_timed(token, out, timeout)) return false;
        free_slots_.signal();
        return true;
    }

    template <typename Rep, typename Period> bool pop_wait(T &out, std::chrono::duration<Rep, Period> timeout)
    {
        if (!queue_.wait_dequeue_timed(out, timeout)) return false;
        free_slots_.signal();
        return true;
    }

    bool try_pop(T &out)
    {
        if (!queue_.try_dequeue(out)) return false;
        free_slots_.signal();
        return true;
    }

    moodycamel::ConsumerToken consumer_token() { return moodycamel::ConsumerToken(queue_); }

    /**
     * @brief Disconnect the channel; later pushes become no-ops
     */
    void close()
    {
        closed_.store(true, std::memory_order_release);
        free_slots_.signal();
    }

    bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }
    size_t capacity() const noexcept { return capacity_; }

  private:
    moodycamel::BlockingConcurrentQueue<T> queue_;
    moodycamel::LightweightSemaphore free_slots_;
    size_t capacity_;
    std::atomic<bool> closed_{false};
};

} // namespace nexuslog
