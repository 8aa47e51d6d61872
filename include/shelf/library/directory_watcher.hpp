#pragma once

/// @file directory_watcher.hpp
/// @brief Keeps a LibraryStore in step with a watched directory tree.
///
/// The watcher subscribes to a notification source, classifies each event
/// and re-derives the affected collection records from disk. Events for
/// independent collections may be applied in any order; events for the same
/// path are applied in the order the source delivers them.

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "shelf/foundation/shelf_result.hpp"
#include "shelf/library/event_classifier.hpp"
#include "shelf/library/library_store.hpp"
#include "shelf/library/notification_source.hpp"

namespace shelf::library {

struct WatcherConfig {
    /// Absolute path of the library root.
    std::filesystem::path root;

    /// Case-sensitive suffix identifying chapter archives.
    std::string chapterExtension = ".cbz";

    /// Rescan the whole root when the watcher starts.
    bool initialScan = true;
};

enum class WatcherState {
    Stopped,
    Watching,
};

struct WatcherStats {
    uint64_t received = 0;  ///< Events delivered by the source.
    uint64_t applied = 0;   ///< Events that updated the store.
    uint64_t dropped = 0;   ///< Irrelevant or unresolvable events.
    uint64_t failed = 0;    ///< Events whose update failed.
    uint64_t resyncs = 0;   ///< Full rescans performed.
};

/// Filesystem-driven writer of the library store.
///
/// Usage:
/// @code
///   DirectoryWatcher watcher({.root = "/srv/manga"}, store,
///                            makeNotificationSource({}));
///   if (auto r = watcher.start(); !r) { ... }
///   ...
///   watcher.stop();
/// @endcode
class DirectoryWatcher {
public:
    DirectoryWatcher(WatcherConfig config,
                     LibraryStore& store,
                     std::unique_ptr<INotificationSource> source);

    /// Stops the watcher if it is still running.
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    /// Validate the root, subscribe to the source and run the startup scan.
    /// Calling start() while already watching is a logged no-op.
    /// @return InvalidRoot or NotificationSourceFailed on failure; the
    ///         watcher then stays Stopped.
    foundation::ShelfResult<void> start();

    /// Unsubscribe and wait for the source to quiesce. No store mutation
    /// originates from this watcher once stop() returns.
    void stop();

    /// Refresh every collection directory under the root and drop records
    /// whose directories are gone.
    /// @return The number of collections refreshed.
    foundation::ShelfResult<std::size_t> resync();

    /// Classify and apply one notification. Failures are logged and
    /// counted; they never propagate.
    void handleEvent(const FsEvent& event);

    /// Stopped also when the source quit delivering while Watching.
    [[nodiscard]] WatcherState state() const;
    [[nodiscard]] WatcherStats stats() const;
    [[nodiscard]] const WatcherConfig& config() const noexcept { return config_; }

private:
    foundation::ShelfResult<void> apply(const Classification& change);
    foundation::ShelfResult<void> refresh(const std::string& id,
                                          const std::filesystem::path& path);
    [[nodiscard]] bool isChapterFile(const std::string& name) const;

    WatcherConfig config_;
    LibraryStore& store_;
    std::unique_ptr<INotificationSource> source_;
    EventClassifier classifier_;

    mutable std::mutex stateMutex_;
    WatcherState state_ = WatcherState::Stopped;

    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> applied_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> resyncs_{0};
};

} // namespace shelf::library
