/// @file throttler.cpp
/// @brief Throttler implementation.

#include "shelf/library/throttler.hpp"

#include <exception>
#include <string>

#include "shelf/foundation/shelf_logger.hpp"

namespace shelf::library {

using shelf::foundation::LogCategory;

namespace {

void runAction(const Throttler::Action& action) {
    try {
        action();
    } catch (const std::exception& e) {
        SHELF_LOG_ERROR(LogCategory::Scheduler,
                        std::string("throttled action failed: ") + e.what());
    }
}

} // namespace

// -- Construction / destruction ----------------------------------------------

Throttler::Throttler(std::chrono::milliseconds window)
    : window_(window < std::chrono::milliseconds::zero()
                  ? std::chrono::milliseconds::zero()
                  : window) {
    timer_ = std::thread([this]() { timerLoop(); });
}

Throttler::~Throttler() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
        hasPending_ = false;
        pending_ = nullptr;
    }
    cv_.notify_all();
    if (timer_.joinable()) {
        timer_.join();
    }
}

// -- Scheduling --------------------------------------------------------------

void Throttler::scheduleCall(Action action) {
    if (!action) {
        return;
    }

    std::unique_lock lock(mutex_);
    if (stopping_) {
        return;
    }

    auto now = Clock::now();
    bool neverRan = lastExecution_ == Clock::time_point{};
    if (neverRan || now - lastExecution_ >= window_) {
        // Window elapsed: whatever was waiting is superseded by this call.
        if (hasPending_) {
            hasPending_ = false;
            pending_ = nullptr;
            ++coalesced_;
            cv_.notify_all();
        }
        lastExecution_ = now;
        ++executions_;
        lock.unlock();
        runAction(action);
        return;
    }

    if (hasPending_) {
        pending_ = std::move(action);
        ++coalesced_;
        return;
    }

    pending_ = std::move(action);
    hasPending_ = true;
    deadline_ = lastExecution_ + window_;
    SHELF_LOG_DEBUG(LogCategory::Scheduler,
                    "armed timer for " +
                        std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                                           deadline_ - now)
                                           .count()) +
                        " ms");
    cv_.notify_all();
}

void Throttler::cancel() {
    {
        std::lock_guard lock(mutex_);
        if (!hasPending_) {
            return;
        }
        hasPending_ = false;
        pending_ = nullptr;
    }
    cv_.notify_all();
}

// -- Queries -----------------------------------------------------------------

bool Throttler::hasPending() const {
    std::lock_guard lock(mutex_);
    return hasPending_;
}

uint64_t Throttler::executionCount() const {
    std::lock_guard lock(mutex_);
    return executions_;
}

uint64_t Throttler::coalescedCount() const {
    std::lock_guard lock(mutex_);
    return coalesced_;
}

// -- Timer thread ------------------------------------------------------------

void Throttler::timerLoop() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        if (!hasPending_) {
            cv_.wait(lock, [this]() { return stopping_ || hasPending_; });
            continue;
        }

        // Predicate true means stopped or cancelled before the deadline.
        if (cv_.wait_until(lock, deadline_,
                           [this]() { return stopping_ || !hasPending_; })) {
            continue;
        }

        Action action = std::move(pending_);
        pending_ = nullptr;
        hasPending_ = false;
        lastExecution_ = Clock::now();
        ++executions_;

        lock.unlock();
        runAction(action);
        lock.lock();
    }
}

} // namespace shelf::library
