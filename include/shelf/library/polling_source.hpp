#pragma once

/// @file polling_source.hpp
/// @brief Notification source that periodically diffs directory snapshots.
///
/// Works on any filesystem, including network mounts where kernel
/// notifications are unavailable. Renames are recognized by matching the
/// device and inode of a vanished entry with a newly appeared one.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "shelf/library/notification_source.hpp"

namespace shelf::library {

struct PollingConfig {
    /// Time between two scans. Zero disables the background thread; events
    /// are then only produced by explicit poll() calls.
    std::chrono::milliseconds interval{5000};

    /// Levels below the root included in a scan (2 = collections and their
    /// direct children).
    int maxDepth = 2;
};

class PollingSource : public INotificationSource {
public:
    explicit PollingSource(PollingConfig config = {});
    ~PollingSource() override;

    PollingSource(const PollingSource&) = delete;
    PollingSource& operator=(const PollingSource&) = delete;

    /// Records the baseline snapshot; changes that exist before this call
    /// are never reported.
    foundation::ShelfResult<void> subscribe(const std::filesystem::path& root,
                                            FsEventHandler handler) override;
    void unsubscribe() override;

    [[nodiscard]] bool isSubscribed() const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "polling"; }

    /// Rescan now and deliver the differences on the calling thread.
    /// A pass whose root listing fails is skipped.
    /// @return Number of events delivered; 0 when not subscribed.
    std::size_t poll();

private:
    struct Entry {
        bool isDirectory = false;
        uint64_t device = 0;
        uint64_t inode = 0;
    };
    using Tree = std::map<std::filesystem::path, Entry>;

    /// Snapshot of the tree below root_, or nullopt when the root itself
    /// could not be listed completely. A subdirectory that cannot be listed
    /// keeps its entries from tree_.
    [[nodiscard]] std::optional<Tree> scan() const;
    void addEntry(const std::filesystem::path& path, int depth, Tree& tree) const;
    void scanDirectory(const std::filesystem::path& dir, int depth, Tree& tree) const;
    [[nodiscard]] static std::vector<FsEvent> diff(const Tree& before, const Tree& after);
    void loop();

    PollingConfig config_;

    std::mutex pollMutex_;  // Serializes poll(); guards tree_ and handler_.
    std::filesystem::path root_;
    FsEventHandler handler_;
    Tree tree_;

    mutable std::mutex stateMutex_;
    std::condition_variable cv_;
    bool subscribed_ = false;
    bool running_ = false;
    std::thread thread_;
};

} // namespace shelf::library
