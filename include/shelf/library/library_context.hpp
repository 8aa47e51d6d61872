#pragma once

/// @file library_context.hpp
/// @brief Owns the store, updater and watcher of one library instance.
///
/// Constructed once at process start and passed to whatever needs the
/// library. Several contexts may coexist, each with its own root and file.

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "shelf/foundation/shelf_result.hpp"
#include "shelf/library/directory_watcher.hpp"
#include "shelf/library/library_store.hpp"
#include "shelf/library/library_updater.hpp"
#include "shelf/library/notification_source.hpp"

namespace shelf::library {

struct LibraryConfig {
    std::filesystem::path root;
    std::filesystem::path storeFile = "manga_library.json";
    std::string chapterExtension = ".cbz";
    bool initialScan = true;

    std::chrono::milliseconds flushWindow{500};
    std::chrono::milliseconds reconcileWindow{500};

    SourceOptions source;
};

class LibraryContext {
public:
    using SourceFactory = std::function<std::unique_ptr<INotificationSource>()>;

    /// Notification sources are built from @c config.source.
    explicit LibraryContext(LibraryConfig config);

    /// Notification sources are built by @p factory, once per watcher.
    LibraryContext(LibraryConfig config, SourceFactory factory);

    /// Stops the context if it is running.
    ~LibraryContext();

    LibraryContext(const LibraryContext&) = delete;
    LibraryContext& operator=(const LibraryContext&) = delete;

    /// Load the store (a corrupt file is logged, not fatal), attach the
    /// updater and start the watcher.
    foundation::ShelfResult<void> start();

    /// Stop the watcher, publish a final diff and flush the store.
    void stop();

    /// Replace the watcher with a fresh one bound to the same store and,
    /// if the context is running, start it.
    foundation::ShelfResult<void> restartWatcher();

    [[nodiscard]] bool isRunning() const;

    LibraryStore& store() noexcept { return store_; }
    LibraryUpdater& updater() noexcept { return updater_; }
    DirectoryWatcher& watcher() noexcept { return *watcher_; }
    [[nodiscard]] const LibraryConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::unique_ptr<DirectoryWatcher> makeWatcher();

    LibraryConfig config_;
    SourceFactory factory_;

    LibraryStore store_;
    LibraryUpdater updater_;
    std::unique_ptr<DirectoryWatcher> watcher_;

    mutable std::mutex mutex_;
    bool running_ = false;
};

} // namespace shelf::library
