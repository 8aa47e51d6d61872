#pragma once

/// @file library_settings.hpp
/// @brief Translate daemon configuration into library and logger settings.
///
/// Recognized keys (defaults in parentheses):
/// | Key                          | Type   | Default              |
/// |------------------------------|--------|----------------------|
/// | library.root                 | string | required             |
/// | library.store_file           | string | manga_library.json   |
/// | library.chapter_extension    | string | .cbz                 |
/// | library.initial_scan         | bool   | true                 |
/// | persistence.flush_window_ms  | int    | 500                  |
/// | reconcile.window_ms          | int    | 500                  |
/// | watcher.backend              | string | polling              |
/// | watcher.poll_interval_ms     | int    | 5000                 |
/// | logging.level                | string | info                 |
///
/// The MANGA_PATH environment variable, when set, replaces library.root.

#include "shelf/foundation/config_manager.hpp"
#include "shelf/foundation/shelf_logger.hpp"
#include "shelf/foundation/shelf_result.hpp"
#include "shelf/library/library_context.hpp"

namespace shelf::service {

/// Read and validate the library section of @p config.
/// @return The settings, or ConfigKeyNotFound / ConfigTypeMismatch /
///         InvalidArgument describing the first problem found.
[[nodiscard]] foundation::ShelfResult<library::LibraryConfig>
buildLibraryConfig(const foundation::ConfigManager& config);

/// Apply logging.level to every category of @p logger.
/// A missing key leaves the logger untouched.
[[nodiscard]] foundation::ShelfResult<void>
applyLoggingConfig(const foundation::ConfigManager& config, foundation::ShelfLogger& logger);

} // namespace shelf::service
