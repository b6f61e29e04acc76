#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tether::websocket {

/// Manually reset flag that threads can wait on
class Event {
public:
    explicit Event(bool initially_set = false) noexcept : set_(initially_set) {}

    void set() {
        {
            std::lock_guard lock(mutex_);
            set_ = true;
        }
        cv_.notify_all();
    }

    void clear() {
        std::lock_guard lock(mutex_);
        set_ = false;
    }

    [[nodiscard]] bool is_set() const {
        std::lock_guard lock(mutex_);
        return set_;
    }

    /// @return true if the flag was set within timeout
    template <typename Rep, typename Period>
    [[nodiscard]] bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return set_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool set_;
};

}  // namespace tether::websocket
