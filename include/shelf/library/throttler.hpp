#pragma once

/// @file throttler.hpp
/// @brief Rate limiter that runs an action at most once per window.
///
/// Rapid requests are coalesced: the most recent request always runs,
/// either immediately (window elapsed) or when the window closes.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace shelf::library {

/// Throttled executor with one owned, cancellable timer thread.
///
/// Usage:
/// @code
///   Throttler throttler(std::chrono::milliseconds(500));
///   throttler.scheduleCall([&] { store.persist(); });  // runs now
///   throttler.scheduleCall([&] { store.persist(); });  // runs after 500 ms
/// @endcode
///
/// Thread-safe. An action that runs inline executes on the caller's thread;
/// a deferred action executes on the timer thread.
class Throttler {
public:
    using Action = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    explicit Throttler(std::chrono::milliseconds window);
    ~Throttler();

    Throttler(const Throttler&) = delete;
    Throttler& operator=(const Throttler&) = delete;

    /// Request execution of @p action.
    ///
    /// If at least one window has elapsed since the last execution the
    /// action runs inline before this call returns. Otherwise the timer is
    /// armed for the remainder of the window (once) and @p action replaces
    /// any action already waiting.
    void scheduleCall(Action action);

    /// Drop the pending action, if any. An action already running is not
    /// interrupted.
    void cancel();

    [[nodiscard]] bool hasPending() const;
    [[nodiscard]] std::chrono::milliseconds window() const noexcept { return window_; }

    /// Total actions executed (inline and deferred).
    [[nodiscard]] uint64_t executionCount() const;

    /// Requests absorbed into an already pending execution.
    [[nodiscard]] uint64_t coalescedCount() const;

private:
    void timerLoop();

    const std::chrono::milliseconds window_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Clock::time_point lastExecution_{};
    Clock::time_point deadline_{};
    Action pending_;
    bool hasPending_ = false;
    bool stopping_ = false;
    uint64_t executions_ = 0;
    uint64_t coalesced_ = 0;

    std::thread timer_;
};

} // namespace shelf::library
