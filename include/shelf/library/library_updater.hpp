#pragma once

/// @file library_updater.hpp
/// @brief Throttled reconciliation driver that publishes library diffs.
///
/// Whenever the store changes, the updater (at most once per window)
/// compares the snapshot it saw last with the current one and emits the
/// resulting LibraryDiff to subscribers.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

#include "shelf/foundation/signal.hpp"
#include "shelf/library/library_store.hpp"
#include "shelf/library/snapshot_reconciler.hpp"
#include "shelf/library/throttler.hpp"

namespace shelf::library {

struct UpdaterConfig {
    /// Minimum spacing between two reconciliation passes.
    std::chrono::milliseconds window{500};
};

class LibraryUpdater {
public:
    /// The baseline is the store's content at construction.
    explicit LibraryUpdater(LibraryStore& store, UpdaterConfig config = {});

    /// Detaches from the store and drops any pending pass.
    ~LibraryUpdater();

    LibraryUpdater(const LibraryUpdater&) = delete;
    LibraryUpdater& operator=(const LibraryUpdater&) = delete;

    /// Schedule a pass on every store mutation.
    void attach();
    void detach();
    [[nodiscard]] bool isAttached() const;

    /// Request a throttled pass.
    void scheduleUpdate();

    /// Run a pass on the calling thread.
    /// @return The diff against the previous baseline (emitted if non-empty).
    LibraryDiff updateNow();

    /// Adopt the store's current content as the baseline without emitting.
    void rebase();

    /// Fired with every non-empty diff. Slots run with the pass lock held
    /// and must not call updateNow() or rebase().
    foundation::Signal<const LibraryDiff&>& onDiff() { return onDiff_; }

    /// Completed passes, including those that found no change.
    [[nodiscard]] uint64_t passCount() const { return passes_.load(); }

    [[nodiscard]] LibrarySnapshot baseline() const;

private:
    LibraryStore& store_;
    foundation::Signal<const LibraryDiff&> onDiff_;

    mutable std::mutex passMutex_;  // Serializes passes; guards previous_.
    LibrarySnapshot previous_;
    std::atomic<uint64_t> passes_{0};

    mutable std::mutex attachMutex_;
    std::optional<foundation::Signal<>::SlotId> slot_;

    // Declared last so its timer thread is joined before the rest goes.
    Throttler throttler_;
};

} // namespace shelf::library
