#pragma once

/// @file snapshot_reconciler.hpp
/// @brief Pure diff between two library snapshots.

#include <map>
#include <set>
#include <string>
#include <vector>

#include "shelf/library/collection_record.hpp"

namespace shelf::library {

/// Chapter-level change within one collection present in both snapshots.
struct ChapterDelta {
    std::set<std::string> added;
    std::set<std::string> removed;

    [[nodiscard]] bool empty() const noexcept { return added.empty() && removed.empty(); }

    bool operator==(const ChapterDelta&) const = default;
};

/// Difference between two snapshots.
///
/// Chapters of an added collection are implied and not listed in
/// @c changedCollections.
struct LibraryDiff {
    std::vector<std::string> addedCollections;    ///< Sorted.
    std::vector<std::string> removedCollections;  ///< Sorted.
    std::map<std::string, ChapterDelta> changedCollections;

    [[nodiscard]] bool empty() const noexcept {
        return addedCollections.empty() && removedCollections.empty() &&
               changedCollections.empty();
    }

    bool operator==(const LibraryDiff&) const = default;
};

/// Compare @p previous with @p current.
///
/// Deterministic and side-effect free: reconcile(s, s) is empty, and
/// swapping the arguments swaps added with removed at every level.
[[nodiscard]] LibraryDiff reconcile(const LibrarySnapshot& previous,
                                    const LibrarySnapshot& current);

/// One-line summary for logs, e.g.
/// "+2 collections [A, B], -1 collections [C], 3 changed (+4/-1 chapters)".
[[nodiscard]] std::string summarize(const LibraryDiff& diff);

} // namespace shelf::library
