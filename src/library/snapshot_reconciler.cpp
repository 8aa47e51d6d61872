/// @file snapshot_reconciler.cpp
/// @brief Snapshot diff and its log summary.

#include "shelf/library/snapshot_reconciler.hpp"

#include <algorithm>
#include <iterator>

namespace shelf::library {

namespace {

std::set<std::string> difference(const std::set<std::string>& a,
                                 const std::set<std::string>& b) {
    std::set<std::string> out;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(),
                        std::inserter(out, out.end()));
    return out;
}

std::string joinIds(const std::vector<std::string>& ids, std::size_t limit) {
    std::string out = "[";
    for (std::size_t i = 0; i < ids.size() && i < limit; ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += ids[i];
    }
    if (ids.size() > limit) {
        out += ", ...";
    }
    out += "]";
    return out;
}

} // namespace

LibraryDiff reconcile(const LibrarySnapshot& previous, const LibrarySnapshot& current) {
    LibraryDiff diff;
    const auto& before = previous.records();
    const auto& after = current.records();

    // Both maps are ordered by id, so one merge pass covers every case.
    auto b = before.begin();
    auto a = after.begin();
    while (b != before.end() || a != after.end()) {
        if (a == after.end() || (b != before.end() && b->first < a->first)) {
            diff.removedCollections.push_back(b->first);
            ++b;
        } else if (b == before.end() || a->first < b->first) {
            diff.addedCollections.push_back(a->first);
            ++a;
        } else {
            ChapterDelta delta;
            delta.added = difference(a->second.chapterFiles, b->second.chapterFiles);
            delta.removed = difference(b->second.chapterFiles, a->second.chapterFiles);
            if (!delta.empty()) {
                diff.changedCollections.emplace(a->first, std::move(delta));
            }
            ++a;
            ++b;
        }
    }
    return diff;
}

std::string summarize(const LibraryDiff& diff) {
    if (diff.empty()) {
        return "no changes";
    }

    constexpr std::size_t kMaxListed = 5;
    std::string out;
    auto append = [&out](const std::string& part) {
        if (!out.empty()) {
            out += ", ";
        }
        out += part;
    };

    if (!diff.addedCollections.empty()) {
        append("+" + std::to_string(diff.addedCollections.size()) + " collections " +
               joinIds(diff.addedCollections, kMaxListed));
    }
    if (!diff.removedCollections.empty()) {
        append("-" + std::to_string(diff.removedCollections.size()) + " collections " +
               joinIds(diff.removedCollections, kMaxListed));
    }
    if (!diff.changedCollections.empty()) {
        std::size_t addedChapters = 0;
        std::size_t removedChapters = 0;
        for (const auto& [id, delta] : diff.changedCollections) {
            addedChapters += delta.added.size();
            removedChapters += delta.removed.size();
        }
        append(std::to_string(diff.changedCollections.size()) + " changed (+" +
               std::to_string(addedChapters) + "/-" + std::to_string(removedChapters) +
               " chapters)");
    }
    return out;
}

} // namespace shelf::library
