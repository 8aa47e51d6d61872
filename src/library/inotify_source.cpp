/// @file inotify_source.cpp
/// @brief InotifySource: kernel notifications translated into FsEvents.

#include "shelf/library/inotify_source.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <string>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include "shelf/foundation/shelf_logger.hpp"

namespace shelf::library {

namespace fs = std::filesystem;

using shelf::foundation::ErrorCode;
using shelf::foundation::LogCategory;
using shelf::foundation::ShelfError;
using shelf::foundation::ShelfResult;

namespace {

constexpr uint32_t kWatchMask =
    IN_CREATE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO | IN_ONLYDIR | IN_EXCL_UNLINK;

constexpr std::size_t kBufferSize = 1024 * (sizeof(struct inotify_event) + 256);

bool isSameOrUnder(const fs::path& path, const fs::path& base) {
    if (path == base) {
        return true;
    }
    auto rel = path.lexically_relative(base);
    return !rel.empty() && rel != "." && *rel.begin() != "..";
}

fs::path stripTrailingSeparator(const fs::path& p) {
    auto out = p.lexically_normal();
    if (!out.has_filename() && out != out.root_path()) {
        out = out.parent_path();
    }
    return out;
}

} // namespace

// -- Construction / destruction ----------------------------------------------

InotifySource::InotifySource(InotifyConfig config)
    : config_(config) {
    if (config_.maxDepth < 1) {
        config_.maxDepth = 1;
    }
}

InotifySource::~InotifySource() {
    unsubscribe();
}

// -- Subscription ------------------------------------------------------------

ShelfResult<void> InotifySource::subscribe(const fs::path& root, FsEventHandler handler) {
    if (subscribed_.load()) {
        return ShelfResult<void>::err(
            ShelfError(ErrorCode::NotificationSourceFailed,
                       "inotify source is already subscribed", root));
    }

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return ShelfResult<void>::err(
            ShelfError(ErrorCode::NotificationSourceFailed,
                       "cannot watch a non-directory", root));
    }

    fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) {
        return ShelfResult<void>::err(
            ShelfError(ErrorCode::NotificationSourceFailed,
                       std::string("inotify_init1 failed: ") + std::strerror(errno), root));
    }

    root_ = stripTrailingSeparator(root);
    std::vector<FsEvent> unused;
    if (!addWatchTree(root_, 0, false, unused)) {
        ::close(fd_);
        fd_ = -1;
        watches_.clear();
        watchCount_.store(0);
        return ShelfResult<void>::err(
            ShelfError(ErrorCode::NotificationSourceFailed,
                       "cannot add inotify watch on root", root_));
    }

    handler_ = std::move(handler);
    failed_.store(false);
    subscribed_.store(true);
    running_.store(true);
    thread_ = std::thread([this]() { loop(); });

    SHELF_LOG_INFO(LogCategory::Watcher,
                   "inotify watching " + root_.string() + " (" +
                       std::to_string(watches_.size()) + " directories)");
    return ShelfResult<void>::ok();
}

void InotifySource::unsubscribe() {
    if (!subscribed_.exchange(false)) {
        return;
    }

    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }

    for (const auto& [wd, watch] : watches_) {
        ::inotify_rm_watch(fd_, wd);
    }
    watches_.clear();
    watchCount_.store(0);
    pendingMove_.reset();

    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    handler_ = nullptr;
}

bool InotifySource::isSubscribed() const {
    return subscribed_.load() && !failed_.load();
}

std::size_t InotifySource::watchCount() const {
    return watchCount_.load();
}

// -- Watch bookkeeping -------------------------------------------------------

bool InotifySource::addWatchTree(const fs::path& dir, int depth, bool synthesize,
                                 std::vector<FsEvent>& out) {
    if (depth >= config_.maxDepth) {
        return true;
    }

    int wd = ::inotify_add_watch(fd_, dir.c_str(), kWatchMask);
    if (wd < 0) {
        int err = errno;
        if (err == ENOSPC) {
            SHELF_LOG_ERROR(LogCategory::Watcher,
                            "inotify watch limit reached; raise "
                            "/proc/sys/fs/inotify/max_user_watches");
            return false;
        }
        // Vanished or unreadable subdirectories are skipped; the root is not.
        SHELF_LOG_WARN(LogCategory::Watcher,
                       "cannot watch " + dir.string() + ": " + std::strerror(err));
        return depth > 0;
    }

    watches_[wd] = Watch{dir, depth};
    watchCount_.store(watches_.size());

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        bool isDir = it->is_directory(typeEc);
        if (synthesize) {
            out.push_back({FsEventKind::Created, isDir, it->path(), {}});
        }
        if (isDir && !addWatchTree(it->path(), depth + 1, synthesize, out)) {
            return false;
        }
    }
    return true;
}

void InotifySource::dropWatchesUnder(const fs::path& dir) {
    for (auto it = watches_.begin(); it != watches_.end();) {
        if (isSameOrUnder(it->second.path, dir)) {
            ::inotify_rm_watch(fd_, it->first);
            it = watches_.erase(it);
        } else {
            ++it;
        }
    }
    watchCount_.store(watches_.size());
}

void InotifySource::retargetWatches(const fs::path& from, const fs::path& to) {
    for (auto& [wd, watch] : watches_) {
        if (watch.path == from) {
            watch.path = to;
        } else if (isSameOrUnder(watch.path, from)) {
            watch.path = to / watch.path.lexically_relative(from);
        }
    }
}

std::optional<InotifySource::Watch> InotifySource::watchFor(int wd) const {
    auto it = watches_.find(wd);
    if (it == watches_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// -- Delivery thread ---------------------------------------------------------

void InotifySource::loop() {
    std::vector<char> buffer(kBufferSize);

    while (running_.load()) {
        auto timeout = pendingMove_ ? config_.moveGrace : config_.pollTimeout;
        struct pollfd pfd {};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            fail(std::string("inotify poll failed: ") + std::strerror(errno));
            break;
        }

        std::vector<FsEvent> events;
        if (rc == 0) {
            // The partner of a lone IN_MOVED_FROM never came: moved out.
            flushPendingMove(events);
            deliver(events);
            continue;
        }

        ssize_t len = ::read(fd_, buffer.data(), buffer.size());
        if (len < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            fail(std::string("inotify read failed: ") + std::strerror(errno));
            break;
        }

        for (ssize_t offset = 0; offset < len;) {
            const auto* ev = reinterpret_cast<const struct inotify_event*>(buffer.data() + offset);
            handle(*ev, events);
            offset += static_cast<ssize_t>(sizeof(struct inotify_event) + ev->len);
        }
        deliver(events);
    }
}

void InotifySource::fail(const std::string& reason) {
    // Stays subscribed for unsubscribe() to clean up, but no longer reports
    // itself as delivering.
    failed_.store(true);
    SHELF_LOG_ERROR(LogCategory::Watcher,
                    reason + "; no further events from " + root_.string());
}

void InotifySource::handle(const inotify_event& ev, std::vector<FsEvent>& out) {
    if (ev.mask & IN_Q_OVERFLOW) {
        flushPendingMove(out);
        SHELF_LOG_WARN(LogCategory::Watcher, "inotify queue overflow, events lost");
        out.push_back({FsEventKind::Overflow, false, root_, {}});
        return;
    }
    if (ev.mask & IN_IGNORED) {
        watches_.erase(ev.wd);
        watchCount_.store(watches_.size());
        return;
    }

    auto watch = watchFor(ev.wd);
    if (!watch || ev.len == 0) {
        return;
    }

    auto path = watch->path / ev.name;
    bool isDir = (ev.mask & IN_ISDIR) != 0;

    if (ev.mask & IN_MOVED_FROM) {
        flushPendingMove(out);
        pendingMove_ = PendingMove{ev.cookie, path, isDir};
        return;
    }

    if (ev.mask & IN_MOVED_TO) {
        if (pendingMove_ && pendingMove_->cookie == ev.cookie) {
            auto from = pendingMove_->from;
            pendingMove_.reset();
            out.push_back({FsEventKind::Moved, isDir, from, path});
            if (isDir) {
                int oldDepth = -1;
                for (const auto& [wd, w] : watches_) {
                    if (w.path == from) {
                        oldDepth = w.depth;
                        break;
                    }
                }
                if (oldDepth == watch->depth + 1) {
                    retargetWatches(from, path);
                } else {
                    std::vector<FsEvent> unused;
                    dropWatchesUnder(from);
                    addWatchTree(path, watch->depth + 1, false, unused);
                }
            }
            return;
        }
        flushPendingMove(out);
        out.push_back({FsEventKind::Created, isDir, path, {}});
        if (isDir) {
            addWatchTree(path, watch->depth + 1, true, out);
        }
        return;
    }

    if (ev.mask & IN_CREATE) {
        out.push_back({FsEventKind::Created, isDir, path, {}});
        if (isDir) {
            // Entries created before the watch existed are reported here.
            addWatchTree(path, watch->depth + 1, true, out);
        }
        return;
    }

    if (ev.mask & IN_DELETE) {
        out.push_back({FsEventKind::Deleted, isDir, path, {}});
    }
}

void InotifySource::flushPendingMove(std::vector<FsEvent>& out) {
    if (!pendingMove_) {
        return;
    }
    auto pending = std::move(*pendingMove_);
    pendingMove_.reset();
    out.push_back({FsEventKind::Deleted, pending.isDirectory, pending.from, {}});
    if (pending.isDirectory) {
        dropWatchesUnder(pending.from);
    }
}

void InotifySource::deliver(std::vector<FsEvent>& events) {
    for (const auto& event : events) {
        try {
            handler_(event);
        } catch (const std::exception& e) {
            SHELF_LOG_ERROR(LogCategory::Watcher,
                            std::string("event handler failed: ") + e.what());
        }
    }
    events.clear();
}

} // namespace shelf::library
