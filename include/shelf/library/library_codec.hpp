#pragma once

/// @file library_codec.hpp
/// @brief JSON encoding of the collection index.
///
/// On-disk layout, keyed by collection id:
/// @code
///   {
///     "Berserk": {
///       "path": "/srv/manga/Berserk",
///       "created_at": "2024-01-02T03:04:05.123456",
///       "last_updated": "2024-01-02T03:04:05.123456",
///       "cbz_files": ["v01.cbz", "v02.cbz"],
///       "total_chapters": 2
///     }
///   }
/// @endcode

#include <string>
#include <string_view>

#include "shelf/foundation/shelf_result.hpp"
#include "shelf/library/collection_record.hpp"

namespace shelf::library {

/// Serialize @p records, pretty-printed with two-space indentation. Names
/// that are not valid UTF-8 are written with U+FFFD replacement characters.
[[nodiscard]] std::string encodeLibrary(const LibraryMap& records);

/// Parse a persisted index.
///
/// "total_chapters" is ignored; the count is derived from "cbz_files".
/// @return The mapping, or PersistenceLoadFailed on malformed input.
[[nodiscard]] foundation::ShelfResult<LibraryMap> decodeLibrary(std::string_view text);

} // namespace shelf::library
