#pragma once
/**
 * @file bounded_channel.hpp
 * @brief Fixed-capacity multi-producer queue with drop-oldest overflow and an
 *        end-of-stream state.
 *
 * Used as the delivery channel of a subscription: the session reader pushes, the
 * consumer pops. When the channel is full the oldest item is evicted so the consumer
 * always sees the most recent state. `close()` lets the consumer drain what is left,
 * after which `pop()` returns std::nullopt (end-of-stream).
 */
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace lgtv::utils
{

template <typename T> class BoundedChannel
{
  public:
    explicit BoundedChannel(size_t capacity) : m_capacity(capacity > 0 ? capacity : 1) {}

    BoundedChannel(const BoundedChannel &) = delete;
    BoundedChannel &operator=(const BoundedChannel &) = delete;

    /**
     * @brief Appends an item, evicting the oldest one when full.
     * @return true if an item was evicted. Pushing to a closed channel is ignored.
     */
    bool push(T item)
    {
        bool evicted = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed)
            {
                return false;
            }
            if (m_items.size() >= m_capacity)
            {
                m_items.pop_front();
                ++m_dropped;
                evicted = true;
            }
            m_items.push_back(std::move(item));
        }
        m_cv.notify_one();
        return evicted;
    }

    /// @brief Blocks until an item is available or the channel is closed and drained.
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return !m_items.empty() || m_closed; });
        return take_locked();
    }

    /// @brief Like pop() but gives up after `timeout` (std::nullopt; check is_drained()).
    std::optional<T> pop_for(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, timeout, [this] { return !m_items.empty() || m_closed; });
        return take_locked();
    }

    std::optional<T> try_pop()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return take_locked();
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    /// @brief Closed and nothing left to read.
    bool is_drained() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed && m_items.empty();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    size_t capacity() const noexcept { return m_capacity; }

    uint64_t dropped() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dropped;
    }

  private:
    std::optional<T> take_locked()
    {
        if (m_items.empty())
        {
            return std::nullopt;
        }
        T item = std::move(m_items.front());
        m_items.pop_front();
        return item;
    }

    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<T> m_items;
    uint64_t m_dropped{0};
    bool m_closed{false};
};

} // namespace lgtv::utils
