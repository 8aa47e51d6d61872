#pragma once

/// @file inotify_source.hpp
/// @brief Linux inotify notification source with recursive watches.
///
/// Directories up to a configurable depth below the root are watched.
/// IN_MOVED_FROM / IN_MOVED_TO pairs sharing a cookie become a single Moved
/// event; an unpaired half degrades to Deleted or Created. A queue overflow
/// is reported as an Overflow event.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "shelf/library/notification_source.hpp"

struct inotify_event;

namespace shelf::library {

struct InotifyConfig {
    /// Upper bound on one blocking wait, so stop requests are seen promptly.
    std::chrono::milliseconds pollTimeout{200};

    /// How long a lone IN_MOVED_FROM waits for its IN_MOVED_TO partner
    /// before it is reported as a deletion.
    std::chrono::milliseconds moveGrace{20};

    /// Directory levels watched (1 = root only, 2 = root and collections).
    int maxDepth = 2;
};

class InotifySource : public INotificationSource {
public:
    explicit InotifySource(InotifyConfig config = {});
    ~InotifySource() override;

    InotifySource(const InotifySource&) = delete;
    InotifySource& operator=(const InotifySource&) = delete;

    foundation::ShelfResult<void> subscribe(const std::filesystem::path& root,
                                            FsEventHandler handler) override;
    void unsubscribe() override;

    /// False once the delivery thread has stopped on a fatal poll/read error.
    [[nodiscard]] bool isSubscribed() const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "inotify"; }

    /// Number of directories currently watched.
    [[nodiscard]] std::size_t watchCount() const;

private:
    struct Watch {
        std::filesystem::path path;
        int depth = 0;
    };

    struct PendingMove {
        uint32_t cookie = 0;
        std::filesystem::path from;
        bool isDirectory = false;
    };

    /// Watch @p dir and its subdirectories within maxDepth. When @p synthesize
    /// is set, entries already present are reported as Created into @p out.
    bool addWatchTree(const std::filesystem::path& dir, int depth, bool synthesize,
                      std::vector<FsEvent>& out);
    void dropWatchesUnder(const std::filesystem::path& dir);
    void retargetWatches(const std::filesystem::path& from, const std::filesystem::path& to);
    [[nodiscard]] std::optional<Watch> watchFor(int wd) const;

    void loop();
    void fail(const std::string& reason);
    void handle(const inotify_event& ev, std::vector<FsEvent>& out);
    void flushPendingMove(std::vector<FsEvent>& out);
    void deliver(std::vector<FsEvent>& events);

    InotifyConfig config_;

    int fd_ = -1;
    std::filesystem::path root_;
    FsEventHandler handler_;

    // Touched by subscribe() before the thread starts, by the delivery
    // thread while running, and by unsubscribe() after the join.
    std::unordered_map<int, Watch> watches_;
    std::optional<PendingMove> pendingMove_;

    std::atomic<bool> subscribed_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::atomic<std::size_t> watchCount_{0};
    std::thread thread_;
};

} // namespace shelf::library
