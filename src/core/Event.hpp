// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace mcphost
{

/// @brief A one-shot, manually set flag that threads can block on.
///
/// Once set, the event stays set; all current and future waiters are released.
class Event
{
  public:
    Event() = default;

    Event(const Event&) = delete;
    Event& operator=(const Event&) = delete;

    /// @brief Sets the event and wakes all waiters.
    void set()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _set = true;
        }
        _cv.notify_all();
    }

    [[nodiscard]] auto isSet() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _set;
    }

    /// @brief Blocks until the event is set.
    void wait()
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait(lock, [this] { return _set; });
    }

    /// @brief Blocks until the event is set or the timeout elapses.
    /// @return true if the event was set.
    template <typename Rep, typename Period>
    [[nodiscard]] auto waitFor(std::chrono::duration<Rep, Period> timeout) -> bool
    {
        auto lock = std::unique_lock(_mutex);
        return _cv.wait_for(lock, timeout, [this] { return _set; });
    }

    /// @brief Blocks until the event is set or the deadline passes.
    /// @return true if the event was set.
    template <typename Clock, typename Duration>
    [[nodiscard]] auto waitUntil(std::chrono::time_point<Clock, Duration> deadline) -> bool
    {
        auto lock = std::unique_lock(_mutex);
        return _cv.wait_until(lock, deadline, [this] { return _set; });
    }

  private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    bool _set = false;
};

} // namespace mcphost
