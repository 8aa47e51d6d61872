#pragma once

/// @file collection_record.hpp
/// @brief Per-collection index entry and immutable library snapshots.

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>

#include "shelf/foundation/time_format.hpp"

namespace shelf::library {

using shelf::foundation::Timestamp;

/// Index entry for one collection directory.
///
/// The chapter count is always derived from @c chapterFiles; it is never
/// stored separately in memory.
struct CollectionRecord {
    std::string id;                      ///< Directory name, unique in the store.
    std::filesystem::path path;          ///< Absolute path of the directory.
    Timestamp createdAt{};               ///< Set once on first detection.
    Timestamp lastUpdated{};             ///< Overwritten on every mutation.
    std::set<std::string> chapterFiles;  ///< Archive file names, ordered.

    [[nodiscard]] std::size_t totalChapters() const noexcept {
        return chapterFiles.size();
    }

    bool operator==(const CollectionRecord&) const = default;
};

/// Live id -> record mapping owned by the store.
using LibraryMap = std::map<std::string, CollectionRecord>;

/// Immutable point-in-time copy of the library.
///
/// Copies share the underlying map; nothing mutates it after capture.
class LibrarySnapshot {
public:
    LibrarySnapshot()
        : records_(std::make_shared<const LibraryMap>()) {}

    LibrarySnapshot(LibraryMap records, Timestamp capturedAt)
        : records_(std::make_shared<const LibraryMap>(std::move(records)))
        , capturedAt_(capturedAt) {}

    [[nodiscard]] const LibraryMap& records() const noexcept { return *records_; }
    [[nodiscard]] Timestamp capturedAt() const noexcept { return capturedAt_; }

    [[nodiscard]] std::size_t size() const noexcept { return records_->size(); }
    [[nodiscard]] bool empty() const noexcept { return records_->empty(); }

    /// @return The record for @p id, or nullptr.
    [[nodiscard]] const CollectionRecord* find(const std::string& id) const {
        auto it = records_->find(id);
        return it == records_->end() ? nullptr : &it->second;
    }

private:
    std::shared_ptr<const LibraryMap> records_;
    Timestamp capturedAt_{};
};

} // namespace shelf::library
