#pragma once

/// @file event_classifier.hpp
/// @brief Maps raw filesystem notifications to collection/chapter changes.
///
/// A collection is a directory directly under the watched root; a chapter
/// is a file directly inside a collection. Everything else (the root
/// itself, files inside chapters, deeper nesting) is irrelevant.

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "shelf/foundation/shelf_result.hpp"
#include "shelf/library/fs_event.hpp"

namespace shelf::library {

enum class ChangeKind : uint8_t {
    CollectionCreated,
    CollectionRemoved,
    CollectionRenamed,
    ChapterAdded,
    ChapterRemoved,
    ChapterRenamed,
    Irrelevant,
};

[[nodiscard]] std::string_view changeKindName(ChangeKind kind) noexcept;

/// Classified change.
///
/// Collection changes fill @c collectionId (and @c previousCollectionId for
/// renames). Chapter changes also fill @c chapterName; a chapter rename
/// carries both sides, and the two collection ids differ when the file moved
/// between collections.
struct Classification {
    ChangeKind kind = ChangeKind::Irrelevant;

    std::string collectionId;
    std::filesystem::path collectionPath;
    std::string chapterName;

    std::string previousCollectionId;
    std::filesystem::path previousCollectionPath;
    std::string previousChapterName;

    [[nodiscard]] bool isCollectionChange() const noexcept {
        return kind == ChangeKind::CollectionCreated ||
               kind == ChangeKind::CollectionRemoved ||
               kind == ChangeKind::CollectionRenamed;
    }

    [[nodiscard]] bool isChapterChange() const noexcept {
        return kind == ChangeKind::ChapterAdded ||
               kind == ChangeKind::ChapterRemoved ||
               kind == ChangeKind::ChapterRenamed;
    }
};

/// Stateless classifier bound to one watched root.
class EventClassifier {
public:
    /// @p root is normalized; a trailing separator is ignored.
    explicit EventClassifier(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /// Classify @p event.
    ///
    /// @return The classification, or ClassificationAmbiguous when the
    ///         event's paths cannot be resolved against the root (empty or
    ///         relative paths, a move without destination, Overflow).
    [[nodiscard]] foundation::ShelfResult<Classification> resolve(const FsEvent& event) const;

    /// Like resolve(), but ambiguity is reported as Irrelevant.
    [[nodiscard]] Classification classify(const FsEvent& event) const;

private:
    enum class Level : uint8_t { Collection, Chapter, Other };

    [[nodiscard]] Level levelOf(const std::filesystem::path& path, bool isDirectory) const;

    std::filesystem::path root_;
};

} // namespace shelf::library
