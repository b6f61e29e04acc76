#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace tether {

/// Blocking bounded FIFO queue shared between one producer and many consumers
///
/// Thread safety: all methods may be called from any thread.
/// The producer never blocks: try_push() fails when the queue is full and
/// the producer is expected to retry once the pop listener fires.
///
/// @tparam T Element type (must be move-constructible)
template <typename T>
class BoundedQueue {
    static_assert(std::is_move_constructible_v<T>,
                  "T must be move constructible");

public:
    /// Called after every successful pop, outside the lock
    using PopListener = std::function<void()>;

    /// @param capacity Maximum number of queued elements (0 = unbounded)
    explicit BoundedQueue(std::size_t capacity) noexcept : capacity_(capacity) {}

    // Non-copyable, non-movable (contains mutex)
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;
    BoundedQueue(BoundedQueue&&) = delete;
    BoundedQueue& operator=(BoundedQueue&&) = delete;

    /// Try to push an element to the queue
    /// @return true if successful, false if the queue is full or closed
    [[nodiscard]] bool try_push(T&& value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_ || full_locked()) {
                return false;
            }
            items_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    /// Try to pop an element without waiting
    [[nodiscard]] std::optional<T> try_pop() {
        std::optional<T> result;
        {
            std::lock_guard lock(mutex_);
            if (items_.empty()) {
                return std::nullopt;
            }
            result.emplace(take_front_locked());
        }
        notify_popped();
        return result;
    }

    /// Wait up to timeout for an element
    /// @return The element, or std::nullopt on timeout or when closed and empty
    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::optional<T> result;
        {
            std::unique_lock lock(mutex_);
            if (!not_empty_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; })) {
                return std::nullopt;
            }
            if (items_.empty()) {
                return std::nullopt;
            }
            result.emplace(take_front_locked());
        }
        notify_popped();
        return result;
    }

    /// Wait for an element until the queue is closed
    /// @return The element, or std::nullopt once closed and empty
    [[nodiscard]] std::optional<T> pop() {
        std::optional<T> result;
        {
            std::unique_lock lock(mutex_);
            not_empty_.wait(lock, [this] { return !items_.empty() || closed_; });
            if (items_.empty()) {
                return std::nullopt;
            }
            result.emplace(take_front_locked());
        }
        notify_popped();
        return result;
    }

    /// Reject further pushes and wake every waiting consumer
    /// Elements already queued can still be popped.
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    void set_pop_listener(PopListener listener) {
        std::lock_guard lock(mutex_);
        pop_listener_ = std::move(listener);
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] bool is_empty() const {
        return size() == 0;
    }

    [[nodiscard]] bool is_full() const {
        std::lock_guard lock(mutex_);
        return full_locked();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

private:
    [[nodiscard]] bool full_locked() const noexcept {
        return capacity_ != 0 && items_.size() >= capacity_;
    }

    T take_front_locked() {
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    void notify_popped() {
        PopListener listener;
        {
            std::lock_guard lock(mutex_);
            listener = pop_listener_;
        }
        if (listener) {
            listener();
        }
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_{false};
    PopListener pop_listener_;
};

}  // namespace tether
