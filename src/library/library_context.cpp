/// @file library_context.cpp
/// @brief LibraryContext lifecycle.

#include "shelf/library/library_context.hpp"

#include "shelf/foundation/shelf_logger.hpp"

namespace shelf::library {

using shelf::foundation::LogCategory;
using shelf::foundation::ShelfResult;

namespace {

StoreConfig storeConfigFrom(const LibraryConfig& config) {
    StoreConfig out;
    out.file = config.storeFile;
    out.flushWindow = config.flushWindow;
    return out;
}

UpdaterConfig updaterConfigFrom(const LibraryConfig& config) {
    UpdaterConfig out;
    out.window = config.reconcileWindow;
    return out;
}

} // namespace

// -- Construction / destruction ----------------------------------------------

LibraryContext::LibraryContext(LibraryConfig config)
    : LibraryContext(config, [source = config.source]() {
          return makeNotificationSource(source);
      }) {}

LibraryContext::LibraryContext(LibraryConfig config, SourceFactory factory)
    : config_(std::move(config))
    , factory_(std::move(factory))
    , store_(storeConfigFrom(config_))
    , updater_(store_, updaterConfigFrom(config_))
    , watcher_(makeWatcher()) {}

LibraryContext::~LibraryContext() {
    stop();
}

std::unique_ptr<DirectoryWatcher> LibraryContext::makeWatcher() {
    WatcherConfig config;
    config.root = config_.root;
    config.chapterExtension = config_.chapterExtension;
    config.initialScan = config_.initialScan;
    return std::make_unique<DirectoryWatcher>(std::move(config), store_, factory_());
}

// -- Lifecycle ---------------------------------------------------------------

ShelfResult<void> LibraryContext::start() {
    std::lock_guard lock(mutex_);
    if (running_) {
        return ShelfResult<void>::ok();
    }

    auto loaded = store_.open();
    if (loaded.hasError()) {
        SHELF_LOG_WARN(LogCategory::Core,
                       "library file not loaded: " + loaded.error().describe());
    }

    // Loaded records are the baseline, not news.
    updater_.rebase();
    updater_.attach();

    auto started = watcher_->start();
    if (started.hasError()) {
        updater_.detach();
        SHELF_LOG_ERROR(LogCategory::Core,
                        "cannot start watcher: " + started.error().describe());
        return started;
    }

    running_ = true;
    SHELF_LOG_INFO(LogCategory::Core,
                   "library started: " + std::to_string(store_.size()) +
                       " collections under " + config_.root.string());
    return ShelfResult<void>::ok();
}

void LibraryContext::stop() {
    std::lock_guard lock(mutex_);
    if (!running_) {
        return;
    }

    watcher_->stop();
    (void)updater_.updateNow();
    updater_.detach();

    auto flushed = store_.forceFlush();
    if (flushed.hasError()) {
        SHELF_LOG_ERROR(LogCategory::Core,
                        "final flush failed: " + flushed.error().describe());
    }

    running_ = false;
    SHELF_LOG_INFO(LogCategory::Core, "library stopped");
}

ShelfResult<void> LibraryContext::restartWatcher() {
    std::lock_guard lock(mutex_);
    watcher_->stop();
    watcher_ = makeWatcher();
    if (!running_) {
        return ShelfResult<void>::ok();
    }

    auto started = watcher_->start();
    if (started.hasError()) {
        SHELF_LOG_ERROR(LogCategory::Core,
                        "watcher restart failed: " + started.error().describe());
    } else {
        SHELF_LOG_INFO(LogCategory::Core, "watcher restarted");
    }
    return started;
}

bool LibraryContext::isRunning() const {
    std::lock_guard lock(mutex_);
    return running_;
}

} // namespace shelf::library
