#pragma once

/// @file library_store.hpp
/// @brief Persistent collection index with throttled, atomic JSON flushes.
///
/// The store owns the live id -> CollectionRecord mapping. Every mutation is
/// visible to readers immediately; durability is deferred to a throttled
/// flush that writes the whole mapping to a sibling temp file and renames it
/// over the target, so the file on disk is always a complete snapshot.

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "shelf/foundation/shelf_result.hpp"
#include "shelf/foundation/signal.hpp"
#include "shelf/library/collection_record.hpp"

namespace shelf::library {

/// Configuration for the LibraryStore.
struct StoreConfig {
    /// JSON file holding the persisted index.
    std::filesystem::path file = "manga_library.json";

    /// Minimum spacing between two flushes.
    std::chrono::milliseconds flushWindow{500};
};

/// Result of a collection-level refresh.
enum class RefreshOutcome {
    Created,  ///< Directory found, record did not exist.
    Updated,  ///< Directory found, existing record rewritten.
    Removed,  ///< Directory gone, record deleted.
    Absent,   ///< Directory gone and no record existed.
};

[[nodiscard]] std::string_view refreshOutcomeName(RefreshOutcome outcome) noexcept;

/// Flush bookkeeping exposed for tests and diagnostics.
struct StoreStats {
    uint64_t flushes = 0;        ///< Successful writes.
    uint64_t flushFailures = 0;  ///< Writes that failed and were rolled back.
    uint64_t mutations = 0;      ///< Mutations applied since construction.
};

/// Thread-safe persistent mapping of collection id to CollectionRecord.
///
/// Usage:
/// @code
///   LibraryStore store({.file = "/var/lib/shelf/manga_library.json"});
///   (void)store.open();
///   store.refreshCollection("Foo", "/srv/manga/Foo", ".cbz");
///   auto snap = store.snapshot();
///   (void)store.forceFlush();
/// @endcode
class LibraryStore {
public:
    explicit LibraryStore(StoreConfig config);

    /// Cancels any pending flush and writes unflushed mutations.
    ~LibraryStore();

    LibraryStore(const LibraryStore&) = delete;
    LibraryStore& operator=(const LibraryStore&) = delete;

    /// Load the persisted file into memory, replacing current contents.
    ///
    /// A missing file yields an empty store. A corrupt file also yields an
    /// empty store but returns PersistenceLoadFailed. A stale temp file left
    /// by an interrupted write is removed.
    foundation::ShelfResult<void> open();

    [[nodiscard]] std::optional<CollectionRecord> get(const std::string& id) const;
    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] std::size_t size() const;

    /// Insert or replace the record stored under @p id.
    /// The record's id field is forced to @p id.
    void set(const std::string& id, CollectionRecord record);

    /// @return true if a record was removed.
    bool remove(const std::string& id);

    /// Immutable copy of the current mapping.
    [[nodiscard]] LibrarySnapshot snapshot() const;

    /// Re-derive the record for @p id from @p directory.
    ///
    /// The directory is listed without holding the store lock. Regular
    /// entries whose names end in @p extension (case-sensitive) become the
    /// chapter set; created_at is preserved for existing records.
    /// @return The outcome, or CollectionUpdateFailed if listing failed.
    foundation::ShelfResult<RefreshOutcome> refreshCollection(
        const std::string& id,
        const std::filesystem::path& directory,
        const std::string& extension);

    /// Move the record under @p oldId to @p newId with a new path.
    ///
    /// created_at and chapters are preserved, last_updated is set to now.
    /// An existing record under @p newId is overwritten.
    /// @return false if @p oldId does not exist.
    bool renameCollection(const std::string& oldId,
                          const std::string& newId,
                          const std::filesystem::path& newPath);

    /// Cancel the pending throttled flush and write immediately.
    foundation::ShelfResult<void> forceFlush();

    /// True while mutations exist that have not been written.
    [[nodiscard]] bool isDirty() const;

    [[nodiscard]] StoreStats stats() const;
    [[nodiscard]] const std::filesystem::path& file() const noexcept;

    /// Fired after every mutation, outside the store lock.
    foundation::Signal<>& onChanged();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace shelf::library
