// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace framecast
{

/// @brief Bounded single-producer/single-consumer FIFO with an end-of-stream marker.
///
/// push() blocks while the queue is full, pop() blocks while it is empty. Both
/// waits wake up when the given stop token is triggered. close() marks the end
/// of the stream: nothing can be pushed afterwards, and pop() drains the
/// remaining items before reporting the end.
template <typename T>
class FrameQueue
{
  public:
    explicit FrameQueue(std::size_t capacity): _capacity(capacity == 0 ? 1 : capacity) {}

    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    /// @brief Appends an item, waiting for free space.
    /// @return False if the queue was closed or a stop was requested; the item is dropped.
    [[nodiscard]] auto push(T item, const std::stop_token& stopToken) -> bool
    {
        auto lock = std::unique_lock(_mutex);
        if (!_notFull.wait(lock, stopToken, [this] { return _closed || _items.size() < _capacity; }))
            return false;
        if (_closed)
            return false;

        _items.push_back(std::move(item));
        lock.unlock();
        _notEmpty.notify_one();
        return true;
    }

    /// @brief Removes the oldest item, waiting until one is available.
    /// @return The item, or std::nullopt once the queue is closed and drained or a stop was requested.
    [[nodiscard]] auto pop(const std::stop_token& stopToken) -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        if (!_notEmpty.wait(lock, stopToken, [this] { return _closed || !_items.empty(); }))
            return std::nullopt;
        if (_items.empty())
            return std::nullopt;

        auto item = std::move(_items.front());
        _items.pop_front();
        lock.unlock();
        _notFull.notify_one();
        return item;
    }

    /// @brief Enqueues the end-of-stream marker. Idempotent.
    void close()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _closed = true;
        }
        _notEmpty.notify_all();
        _notFull.notify_all();
    }

    /// @brief True once close() was called and every item has been popped.
    [[nodiscard]] auto finished() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _closed && _items.empty();
    }

    [[nodiscard]] auto closed() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _closed;
    }

    [[nodiscard]] auto size() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _items.size();
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return _capacity; }

  private:
    std::size_t const _capacity;
    mutable std::mutex _mutex;
    std::condition_variable_any _notFull;
    std::condition_variable_any _notEmpty;
    std::deque<T> _items;
    bool _closed = false;
};

} // namespace framecast
