/**
 * @file MessageQueue.hpp
 * @brief Closable multi-producer queue used for all cross-unit traffic.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace psyche::application {

/**
 * @class MessageQueue
 * @brief FIFO queue with optional capacity. A capacity of 0 means unbounded.
 *
 * After close() producers are rejected and consumers drain what is left.
 */
template <typename T>
class MessageQueue {
public:
    explicit MessageQueue(size_t capacity = 0) : m_capacity(capacity) {}

    /** @brief Blocks while the queue is full. Returns false once closed. */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notFull.wait(lock, [this] { return m_closed || m_capacity == 0 || m_items.size() < m_capacity; });
        if (m_closed) return false;
        m_items.push_back(std::move(item));
        lock.unlock();
        m_notEmpty.notify_one();
        return true;
    }

    /** @brief Never blocks. Returns false when full or closed. */
    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) return false;
            if (m_capacity != 0 && m_items.size() >= m_capacity) return false;
            m_items.push_back(std::move(item));
        }
        m_notEmpty.notify_one();
        return true;
    }

    /** @brief Blocks until an item arrives. Returns nullopt once closed and drained. */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notEmpty.wait(lock, [this] { return m_closed || !m_items.empty(); });
        return takeLocked(lock);
    }

    /** @brief Like pop() but gives up after the timeout. */
    template <typename Rep, typename Period>
    std::optional<T> popFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notEmpty.wait_for(lock, timeout, [this] { return m_closed || !m_items.empty(); });
        return takeLocked(lock);
    }

    std::optional<T> tryPop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        return takeLocked(lock);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_notEmpty.notify_all();
        m_notFull.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

private:
    std::optional<T> takeLocked(std::unique_lock<std::mutex>& lock) {
        if (m_items.empty()) return std::nullopt;
        T item = std::move(m_items.front());
        m_items.pop_front();
        lock.unlock();
        m_notFull.notify_one();
        return item;
    }

    size_t m_capacity;
    std::deque<T> m_items;
    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
    bool m_closed = false;
};

} // namespace psyche::application
