/**
 * CapyDeploy - Bounded, non-blocking event channel.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace capydeploy
{

    // Producers never block: when the queue is full the newest event is
    // dropped. Consumers treat the stream as best-effort and fall back to
    // polling accessors for authoritative state.
    template <typename Event>
    class BoundedEventQueue
    {
    public:
        explicit BoundedEventQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

        BoundedEventQueue(const BoundedEventQueue &) = delete;
        BoundedEventQueue &operator=(const BoundedEventQueue &) = delete;

        bool try_push(Event event)
        {
            {
                std::lock_guard lock(mutex_);
                if (closed_ || events_.size() >= capacity_)
                {
                    ++dropped_;
                    return false;
                }
                events_.push_back(std::move(event));
            }
            cv_.notify_one();
            return true;
        }

        std::optional<Event> try_pop()
        {
            std::lock_guard lock(mutex_);
            return pop_locked();
        }

        template <typename Rep, typename Period>
        std::optional<Event> pop_for(std::chrono::duration<Rep, Period> timeout)
        {
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, timeout, [this]
                         { return closed_ || !events_.empty(); });
            return pop_locked();
        }

        // Wakes blocked consumers; queued events stay readable.
        void close()
        {
            {
                std::lock_guard lock(mutex_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        bool closed() const
        {
            std::lock_guard lock(mutex_);
            return closed_;
        }

        std::size_t size() const
        {
            std::lock_guard lock(mutex_);
            return events_.size();
        }

        std::size_t capacity() const noexcept { return capacity_; }

        std::uint64_t dropped() const
        {
            std::lock_guard lock(mutex_);
            return dropped_;
        }

    private:
        std::optional<Event> pop_locked()
        {
            if (events_.empty())
            {
                return std::nullopt;
            }
            Event event = std::move(events_.front());
            events_.pop_front();
            return event;
        }

        const std::size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<Event> events_;
        bool closed_{false};
        std::uint64_t dropped_{0};
    };

} // namespace capydeploy
