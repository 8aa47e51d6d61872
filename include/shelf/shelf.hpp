#pragma once

/// @file shelf.hpp
/// @brief Convenience header pulling in the public library API.

#include "shelf/version.hpp"

#include "shelf/foundation/config_manager.hpp"
#include "shelf/foundation/shelf_logger.hpp"
#include "shelf/foundation/shelf_result.hpp"

#include "shelf/library/collection_record.hpp"
#include "shelf/library/directory_watcher.hpp"
#include "shelf/library/event_classifier.hpp"
#include "shelf/library/library_context.hpp"
#include "shelf/library/library_store.hpp"
#include "shelf/library/library_updater.hpp"
#include "shelf/library/snapshot_reconciler.hpp"
