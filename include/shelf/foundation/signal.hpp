#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> used for store change and diff
///        notifications.
///
/// Slots are registered via connect() and invoked by emit(). The slot table
/// is guarded by a std::shared_mutex; emit() copies the table and invokes the
/// copies with no lock held, so a slot may connect or disconnect freely.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace shelf::foundation {

/// Publish/subscribe channel.
///
/// Slots are invoked in connection order on the emitting thread.
///
/// @code
///   Signal<const LibraryDiff&> onDiff;
///   auto id = onDiff.connect([](const LibraryDiff& d) { ... });
///   onDiff.emit(diff);
///   onDiff.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    /// Returned by connect() when the slot is empty.
    static constexpr SlotId kInvalidSlot = 0;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    SlotId connect(Slot slot) {
        if (!slot) {
            return kInvalidSlot;
        }
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace(id, std::move(slot));
        return id;
    }

    /// @return true if @p id was connected.
    bool disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        return slots_.erase(id) > 0;
    }

    void disconnectAll() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

    void emit(Args... args) const {
        std::vector<Slot> pending;
        {
            std::shared_lock lock(mutex_);
            pending.reserve(slots_.size());
            for (const auto& [id, slot] : slots_) {
                pending.push_back(slot);
            }
        }
        for (const auto& slot : pending) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    // Ordered by id, which is connection order.
    std::map<SlotId, Slot> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

} // namespace shelf::foundation
