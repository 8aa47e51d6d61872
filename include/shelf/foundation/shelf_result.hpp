#pragma once

/// @file shelf_result.hpp
/// @brief ShelfResult<T> alias used by every fallible operation.

#include "shelf/core/result.hpp"
#include "shelf/foundation/shelf_error.hpp"

namespace shelf::foundation {

/// Result type specialized with ShelfError.
///
/// Example:
/// @code
///   ShelfResult<std::size_t> countCollections(const fs::path& root) {
///       if (!fs::is_directory(root)) {
///           return ShelfResult<std::size_t>::err(
///               ShelfError(ErrorCode::InvalidRoot, "not a directory", root));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using ShelfResult = shelf::Result<T, ShelfError>;

}  // namespace shelf::foundation
