/// @file polling_source.cpp
/// @brief PollingSource: periodic tree snapshots diffed into FsEvents.

#include "shelf/library/polling_source.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

#include <sys/stat.h>

#include "shelf/foundation/shelf_logger.hpp"

namespace shelf::library {

namespace fs = std::filesystem;

using shelf::foundation::ErrorCode;
using shelf::foundation::LogCategory;
using shelf::foundation::ShelfError;
using shelf::foundation::ShelfResult;

namespace {

std::ptrdiff_t depthOf(const fs::path& p) {
    return std::distance(p.begin(), p.end());
}

bool isUnder(const fs::path& path, const fs::path& base) {
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

PollingSource::PollingSource(PollingConfig config)
    : config_(config) {
    if (config_.maxDepth < 1) {
        config_.maxDepth = 1;
    }
}

PollingSource::~PollingSource() {
    unsubscribe();
}

// -- Subscription ------------------------------------------------------------

ShelfResult<void> PollingSource::subscribe(const fs::path& root, FsEventHandler handler) {
    {
        std::lock_guard lock(stateMutex_);
        if (subscribed_) {
            return ShelfResult<void>::err(
                ShelfError(ErrorCode::NotificationSourceFailed,
                           "polling source is already subscribed", root));
        }
    }

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return ShelfResult<void>::err(
            ShelfError(ErrorCode::NotificationSourceFailed,
                       "cannot poll a non-directory", root));
    }

    std::size_t baseline = 0;
    {
        std::lock_guard lock(pollMutex_);
        root_ = stripTrailingSeparator(root);
        auto initial = scan();
        if (!initial) {
            return ShelfResult<void>::err(
                ShelfError(ErrorCode::NotificationSourceFailed,
                           "cannot take the baseline snapshot", root_));
        }
        handler_ = std::move(handler);
        tree_ = std::move(*initial);
        baseline = tree_.size();
    }

    {
        std::lock_guard lock(stateMutex_);
        subscribed_ = true;
        running_ = config_.interval > std::chrono::milliseconds::zero();
        if (running_) {
            thread_ = std::thread([this]() { loop(); });
        }
    }

    SHELF_LOG_INFO(LogCategory::Watcher,
                   "polling " + root_.string() + " every " +
                       std::to_string(config_.interval.count()) + " ms (" +
                       std::to_string(baseline) + " entries)");
    return ShelfResult<void>::ok();
}

void PollingSource::unsubscribe() {
    {
        std::lock_guard lock(stateMutex_);
        if (!subscribed_) {
            return;
        }
        subscribed_ = false;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard lock(pollMutex_);
    handler_ = nullptr;
    tree_.clear();
}

bool PollingSource::isSubscribed() const {
    std::lock_guard lock(stateMutex_);
    return subscribed_;
}

// -- Scanning ----------------------------------------------------------------

std::size_t PollingSource::poll() {
    std::lock_guard lock(pollMutex_);
    if (!handler_) {
        return 0;
    }

    auto current = scan();
    if (!current) {
        return 0;
    }
    auto events = diff(tree_, *current);
    tree_ = std::move(*current);

    for (const auto& event : events) {
        handler_(event);
    }
    return events.size();
}

std::optional<PollingSource::Tree> PollingSource::scan() const {
    Tree tree;
    std::error_code ec;
    fs::directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        addEntry(it->path(), 1, tree);
    }
    if (ec) {
        // A partial listing of the root would read as mass deletion.
        SHELF_LOG_WARN(LogCategory::Watcher,
                       "scan of " + root_.string() + " failed, keeping previous snapshot: " +
                           ec.message());
        return std::nullopt;
    }
    return tree;
}

void PollingSource::addEntry(const fs::path& path, int depth, Tree& tree) const {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return;  // Vanished between readdir and stat.
    }

    Entry entry;
    entry.isDirectory = S_ISDIR(st.st_mode);
    entry.device = static_cast<uint64_t>(st.st_dev);
    entry.inode = static_cast<uint64_t>(st.st_ino);
    tree.emplace(path, entry);

    if (entry.isDirectory && depth < config_.maxDepth) {
        scanDirectory(path, depth + 1, tree);
    }
}

void PollingSource::scanDirectory(const fs::path& dir, int depth, Tree& tree) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        addEntry(it->path(), depth, tree);
    }
    if (!ec) {
        return;
    }

    // Only this subtree is affected by the failure.
    for (auto entry = tree.begin(); entry != tree.end();) {
        entry = isUnder(entry->first, dir) ? tree.erase(entry) : std::next(entry);
    }
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        tree.erase(dir);  // Removed while being listed.
        return;
    }

    SHELF_LOG_WARN(LogCategory::Watcher,
                   "cannot list " + dir.string() + ", keeping previous entries: " +
                       ec.message());
    for (const auto& [path, entry] : tree_) {
        if (isUnder(path, dir)) {
            tree.emplace(path, entry);
        }
    }
}

std::vector<FsEvent> PollingSource::diff(const Tree& before, const Tree& after) {
    using Item = std::pair<fs::path, Entry>;
    std::vector<Item> removed;
    std::vector<Item> added;

    for (const auto& [path, entry] : before) {
        auto it = after.find(path);
        if (it == after.end() || it->second.isDirectory != entry.isDirectory) {
            removed.emplace_back(path, entry);
        }
    }
    for (const auto& [path, entry] : after) {
        auto it = before.find(path);
        if (it == before.end() || it->second.isDirectory != entry.isDirectory) {
            added.emplace_back(path, entry);
        }
    }

    auto shallowFirst = [](const Item& a, const Item& b) {
        return depthOf(a.first) < depthOf(b.first);
    };
    std::stable_sort(removed.begin(), removed.end(), shallowFirst);
    std::stable_sort(added.begin(), added.end(), shallowFirst);

    std::map<std::pair<uint64_t, uint64_t>, std::size_t> addedByInode;
    for (std::size_t i = 0; i < added.size(); ++i) {
        const auto& e = added[i].second;
        addedByInode.emplace(std::make_pair(e.device, e.inode), i);
    }
    std::vector<bool> addedMatched(added.size(), false);

    std::vector<FsEvent> deletions;
    std::vector<FsEvent> moves;
    std::vector<std::pair<fs::path, fs::path>> movedDirs;

    // Parents are matched before children, so a child that travelled with
    // its moved directory is recognized and not reported separately.
    for (const auto& item : removed) {
        const auto& path = item.first;
        const auto& entry = item.second;
        auto match = addedByInode.find({entry.device, entry.inode});
        if (match != addedByInode.end() && !addedMatched[match->second] &&
            added[match->second].second.isDirectory == entry.isDirectory) {
            const auto& dest = added[match->second].first;
            addedMatched[match->second] = true;

            bool carried = std::any_of(
                movedDirs.begin(), movedDirs.end(), [&](const auto& moved) {
                    return isUnder(path, moved.first) &&
                           dest == moved.second / path.lexically_relative(moved.first);
                });
            if (!carried) {
                moves.push_back({FsEventKind::Moved, entry.isDirectory, path, dest});
                if (entry.isDirectory) {
                    movedDirs.emplace_back(path, dest);
                }
            }
            continue;
        }
        deletions.push_back({FsEventKind::Deleted, entry.isDirectory, path, {}});
    }

    std::stable_sort(deletions.begin(), deletions.end(),
                     [](const FsEvent& a, const FsEvent& b) {
                         return depthOf(a.sourcePath) > depthOf(b.sourcePath);
                     });

    std::vector<FsEvent> events = std::move(deletions);
    events.insert(events.end(), moves.begin(), moves.end());
    for (std::size_t i = 0; i < added.size(); ++i) {
        if (!addedMatched[i]) {
            events.push_back({FsEventKind::Created, added[i].second.isDirectory,
                              added[i].first, {}});
        }
    }
    return events;
}

// -- Background thread -------------------------------------------------------

void PollingSource::loop() {
    std::unique_lock lock(stateMutex_);
    while (running_) {
        if (cv_.wait_for(lock, config_.interval, [this]() { return !running_; })) {
            break;
        }
        lock.unlock();
        try {
            poll();
        } catch (const std::exception& e) {
            SHELF_LOG_ERROR(LogCategory::Watcher,
                            std::string("polling pass failed: ") + e.what());
        }
        lock.lock();
    }
}

} // namespace shelf::library
