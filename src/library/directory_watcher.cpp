/// @file directory_watcher.cpp
/// @brief DirectoryWatcher implementation.

#include "shelf/library/directory_watcher.hpp"

#include <exception>
#include <set>
#include <system_error>

#include "shelf/foundation/shelf_logger.hpp"

namespace shelf::library {

namespace fs = std::filesystem;

using shelf::foundation::ErrorCode;
using shelf::foundation::LogCategory;
using shelf::foundation::LogContext;
using shelf::foundation::LogLevel;
using shelf::foundation::ShelfError;
using shelf::foundation::ShelfLogger;
using shelf::foundation::ShelfResult;

namespace {

void logFailure(const std::string& message, const std::string& collectionId,
                const fs::path& path) {
    LogContext ctx;
    if (!collectionId.empty()) {
        ctx.collectionId = collectionId;
    }
    if (!path.empty()) {
        ctx.path = path.string();
    }
    ShelfLogger::instance().logWithContext(LogLevel::Error, LogCategory::Watcher,
                                           message, ctx);
}

} // namespace

DirectoryWatcher::DirectoryWatcher(WatcherConfig config,
                                   LibraryStore& store,
                                   std::unique_ptr<INotificationSource> source)
    : config_(std::move(config))
    , store_(store)
    , source_(std::move(source))
    , classifier_(config_.root) {}

DirectoryWatcher::~DirectoryWatcher() {
    stop();
}

// -- Lifecycle ---------------------------------------------------------------

ShelfResult<void> DirectoryWatcher::start() {
    std::lock_guard lock(stateMutex_);
    if (state_ == WatcherState::Watching) {
        SHELF_LOG_INFO(LogCategory::Watcher,
                       "already watching " + classifier_.root().string());
        return ShelfResult<void>::ok();
    }

    const auto& root = classifier_.root();
    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec)) {
        return ShelfResult<void>::err(
            ShelfError(ErrorCode::InvalidRoot, "library root is not a directory", root));
    }
    if (!source_) {
        return ShelfResult<void>::err(
            ShelfError(ErrorCode::NotificationSourceFailed, "no notification source", root));
    }

    // Subscribe before scanning so nothing that changes during the scan is
    // missed; refreshing a collection twice is harmless.
    auto subscribed = source_->subscribe(root, [this](const FsEvent& event) {
        handleEvent(event);
    });
    if (subscribed.hasError()) {
        SHELF_LOG_ERROR(LogCategory::Watcher,
                        "cannot subscribe: " + subscribed.error().describe());
        return subscribed;
    }

    if (config_.initialScan) {
        auto scanned = resync();
        if (scanned.hasError()) {
            SHELF_LOG_WARN(LogCategory::Watcher,
                           "startup scan failed: " + scanned.error().describe());
        }
    }

    state_ = WatcherState::Watching;
    SHELF_LOG_INFO(LogCategory::Watcher,
                   "watching " + root.string() + " via " + std::string(source_->name()));
    return ShelfResult<void>::ok();
}

void DirectoryWatcher::stop() {
    std::lock_guard lock(stateMutex_);
    if (state_ == WatcherState::Stopped) {
        return;
    }
    source_->unsubscribe();
    state_ = WatcherState::Stopped;
    SHELF_LOG_INFO(LogCategory::Watcher, "stopped watching " + classifier_.root().string());
}

WatcherState DirectoryWatcher::state() const {
    std::lock_guard lock(stateMutex_);
    if (state_ == WatcherState::Watching && !source_->isSubscribed()) {
        return WatcherState::Stopped;  // Source stopped delivering on its own.
    }
    return state_;
}

WatcherStats DirectoryWatcher::stats() const {
    WatcherStats s;
    s.received = received_.load();
    s.applied = applied_.load();
    s.dropped = dropped_.load();
    s.failed = failed_.load();
    s.resyncs = resyncs_.load();
    return s;
}

// -- Full rescan -------------------------------------------------------------

ShelfResult<std::size_t> DirectoryWatcher::resync() {
    const auto& root = classifier_.root();

    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        return ShelfResult<std::size_t>::err(
            ShelfError(ErrorCode::InvalidRoot, "cannot list root: " + ec.message(), root));
    }

    std::set<std::string> present;
    std::size_t refreshed = 0;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code typeEc;
        if (!it->is_directory(typeEc)) {
            continue;
        }
        auto id = it->path().filename().string();
        present.insert(id);

        auto result = refresh(id, it->path());
        if (result.hasError()) {
            ++failed_;
            logFailure("resync refresh failed: " + result.error().describe(), id,
                       it->path());
            continue;
        }
        ++refreshed;
    }
    if (ec) {
        return ShelfResult<std::size_t>::err(
            ShelfError(ErrorCode::InvalidRoot, "root listing interrupted: " + ec.message(),
                       root));
    }

    // A record missing from the listing may belong to a directory created
    // after the listing was read, so it is re-derived rather than dropped.
    std::size_t removed = 0;
    auto snapshot = store_.snapshot();
    for (const auto& [id, record] : snapshot.records()) {
        if (present.count(id) != 0) {
            continue;
        }
        auto outcome = store_.refreshCollection(id, root / id, config_.chapterExtension);
        if (outcome.hasError()) {
            ++failed_;
            logFailure("resync refresh failed: " + outcome.error().describe(), id, root / id);
            continue;
        }
        if (outcome.value() == RefreshOutcome::Removed) {
            ++removed;
        }
    }

    ++resyncs_;
    SHELF_LOG_INFO(LogCategory::Watcher,
                   "resync: " + std::to_string(refreshed) + " collections refreshed, " +
                       std::to_string(removed) + " removed");
    return ShelfResult<std::size_t>::ok(refreshed);
}

// -- Event handling ----------------------------------------------------------

void DirectoryWatcher::handleEvent(const FsEvent& event) {
    ++received_;

    if (event.kind == FsEventKind::Overflow) {
        SHELF_LOG_WARN(LogCategory::Watcher, "notifications lost, rescanning");
        auto result = resync();
        if (result.hasError()) {
            ++failed_;
            logFailure("overflow resync failed: " + result.error().describe(), {},
                       classifier_.root());
        } else {
            ++applied_;
        }
        return;
    }

    auto resolved = classifier_.resolve(event);
    if (resolved.hasError()) {
        ++dropped_;
        SHELF_LOG_DEBUG(LogCategory::Watcher,
                        "dropped event: " + resolved.error().describe());
        return;
    }

    const auto& change = resolved.value();
    if (change.kind == ChangeKind::Irrelevant) {
        ++dropped_;
        return;
    }
    if (change.isChapterChange() && !isChapterFile(change.chapterName) &&
        !isChapterFile(change.previousChapterName)) {
        ++dropped_;
        return;
    }

    SHELF_LOG_DEBUG(LogCategory::Watcher,
                    std::string(changeKindName(change.kind)) + " " + change.collectionId);

    try {
        auto result = apply(change);
        if (result.hasError()) {
            ++failed_;
            logFailure(result.error().describe(), change.collectionId,
                       change.collectionPath);
            return;
        }
        ++applied_;
    } catch (const std::exception& e) {
        ++failed_;
        logFailure(std::string("update threw: ") + e.what(), change.collectionId,
                   change.collectionPath);
    }
}

ShelfResult<void> DirectoryWatcher::apply(const Classification& change) {
    switch (change.kind) {
        case ChangeKind::CollectionCreated:
            return refresh(change.collectionId, change.collectionPath);

        case ChangeKind::CollectionRenamed:
            if (store_.renameCollection(change.previousCollectionId, change.collectionId,
                                        change.collectionPath)) {
                return ShelfResult<void>::ok();
            }
            return refresh(change.collectionId, change.collectionPath);

        case ChangeKind::CollectionRemoved:
            if (store_.remove(change.collectionId)) {
                SHELF_LOG_INFO(LogCategory::Watcher,
                               "collection removed: " + change.collectionId);
            }
            return ShelfResult<void>::ok();

        case ChangeKind::ChapterAdded:
        case ChangeKind::ChapterRemoved:
            return refresh(change.collectionId, change.collectionPath);

        case ChangeKind::ChapterRenamed: {
            auto result = refresh(change.collectionId, change.collectionPath);
            if (result.hasError() || change.previousCollectionId == change.collectionId) {
                return result;
            }
            return refresh(change.previousCollectionId, change.previousCollectionPath);
        }

        case ChangeKind::Irrelevant:
            break;
    }
    return ShelfResult<void>::ok();
}

ShelfResult<void> DirectoryWatcher::refresh(const std::string& id, const fs::path& path) {
    auto outcome = store_.refreshCollection(id, path, config_.chapterExtension);
    if (outcome.hasError()) {
        return ShelfResult<void>::err(outcome.error());
    }
    if (outcome.value() == RefreshOutcome::Created) {
        SHELF_LOG_INFO(LogCategory::Watcher, "collection added: " + id);
    }
    return ShelfResult<void>::ok();
}

bool DirectoryWatcher::isChapterFile(const std::string& name) const {
    const auto& ext = config_.chapterExtension;
    return !name.empty() && name.size() >= ext.size() &&
           name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
}

} // namespace shelf::library
