/// @file library_settings.cpp
/// @brief buildLibraryConfig / applyLoggingConfig.

#include "shelf/service/library_settings.hpp"

#include <chrono>
#include <cstdlib>
#include <string>

namespace shelf::service {

using shelf::foundation::ConfigManager;
using shelf::foundation::ErrorCode;
using shelf::foundation::LogCategory;
using shelf::foundation::ShelfError;
using shelf::foundation::ShelfResult;
using shelf::library::LibraryConfig;

namespace {

ShelfResult<LibraryConfig> invalid(const std::string& message) {
    return ShelfResult<LibraryConfig>::err(
        ShelfError(ErrorCode::InvalidArgument, message));
}

/// Read a non-negative millisecond value.
ShelfResult<std::chrono::milliseconds> readWindow(const ConfigManager& config,
                                                  std::string_view key,
                                                  int fallback) {
    auto value = config.getOr<int>(key, fallback);
    if (value.hasError()) {
        return ShelfResult<std::chrono::milliseconds>::err(value.error());
    }
    if (value.value() < 0) {
        return ShelfResult<std::chrono::milliseconds>::err(
            ShelfError(ErrorCode::InvalidArgument,
                       std::string(key) + " must not be negative"));
    }
    return ShelfResult<std::chrono::milliseconds>::ok(
        std::chrono::milliseconds(value.value()));
}

} // namespace

ShelfResult<LibraryConfig> buildLibraryConfig(const ConfigManager& config) {
    LibraryConfig cfg;

    const char* envRoot = std::getenv("MANGA_PATH");
    if (envRoot != nullptr && *envRoot != '\0') {
        cfg.root = envRoot;
    } else {
        auto root = config.get<std::string>("library.root");
        if (root.hasError()) {
            return ShelfResult<LibraryConfig>::err(root.error());
        }
        cfg.root = root.value();
    }
    if (cfg.root.empty() || cfg.root.is_relative()) {
        return invalid("library root must be an absolute path: '" + cfg.root.string() + "'");
    }

    auto storeFile = config.getOr<std::string>("library.store_file", "manga_library.json");
    if (storeFile.hasError()) {
        return ShelfResult<LibraryConfig>::err(storeFile.error());
    }
    if (storeFile.value().empty()) {
        return invalid("library.store_file must not be empty");
    }
    cfg.storeFile = storeFile.value();

    auto extension = config.getOr<std::string>("library.chapter_extension", ".cbz");
    if (extension.hasError()) {
        return ShelfResult<LibraryConfig>::err(extension.error());
    }
    if (extension.value().empty()) {
        return invalid("library.chapter_extension must not be empty");
    }
    cfg.chapterExtension = extension.value();

    auto initialScan = config.getOr<bool>("library.initial_scan", true);
    if (initialScan.hasError()) {
        return ShelfResult<LibraryConfig>::err(initialScan.error());
    }
    cfg.initialScan = initialScan.value();

    auto flushWindow = readWindow(config, "persistence.flush_window_ms", 500);
    if (flushWindow.hasError()) {
        return ShelfResult<LibraryConfig>::err(flushWindow.error());
    }
    cfg.flushWindow = flushWindow.value();

    auto reconcileWindow = readWindow(config, "reconcile.window_ms", 500);
    if (reconcileWindow.hasError()) {
        return ShelfResult<LibraryConfig>::err(reconcileWindow.error());
    }
    cfg.reconcileWindow = reconcileWindow.value();

    auto backendName = config.getOr<std::string>("watcher.backend", "polling");
    if (backendName.hasError()) {
        return ShelfResult<LibraryConfig>::err(backendName.error());
    }
    auto backend = library::parseSourceBackend(backendName.value());
    if (!backend) {
        return invalid("unknown watcher.backend '" + backendName.value() +
                       "' (expected polling or inotify)");
    }
    cfg.source.backend = *backend;

    auto pollInterval = readWindow(config, "watcher.poll_interval_ms", 5000);
    if (pollInterval.hasError()) {
        return ShelfResult<LibraryConfig>::err(pollInterval.error());
    }
    if (cfg.source.backend == library::SourceBackend::Polling &&
        pollInterval.value().count() == 0) {
        return invalid("watcher.poll_interval_ms must be positive for the polling backend");
    }
    cfg.source.pollInterval = pollInterval.value();

    return ShelfResult<LibraryConfig>::ok(std::move(cfg));
}

ShelfResult<void> applyLoggingConfig(const ConfigManager& config,
                                     foundation::ShelfLogger& logger) {
    if (!config.hasKey("logging.level")) {
        return ShelfResult<void>::ok();
    }
    auto name = config.get<std::string>("logging.level");
    if (name.hasError()) {
        return ShelfResult<void>::err(name.error());
    }
    auto level = foundation::parseLogLevel(name.value());
    if (!level) {
        return ShelfResult<void>::err(
            ShelfError(ErrorCode::InvalidArgument, "unknown logging.level '" + name.value() + "'"));
    }
    logger.setAllCategoryLevels(*level);
    SHELF_LOG_INFO(LogCategory::Config,
                   "log level set to " + std::string(foundation::logLevelName(*level)));
    return ShelfResult<void>::ok();
}

} // namespace shelf::service
