/// @file event_classifier.cpp
/// @brief EventClassifier implementation.

#include "shelf/library/event_classifier.hpp"

namespace shelf::library {

namespace fs = std::filesystem;

using shelf::foundation::ErrorCode;
using shelf::foundation::ShelfError;
using shelf::foundation::ShelfResult;

std::string_view changeKindName(ChangeKind kind) noexcept {
    switch (kind) {
        case ChangeKind::CollectionCreated: return "CollectionCreated";
        case ChangeKind::CollectionRemoved: return "CollectionRemoved";
        case ChangeKind::CollectionRenamed: return "CollectionRenamed";
        case ChangeKind::ChapterAdded:      return "ChapterAdded";
        case ChangeKind::ChapterRemoved:    return "ChapterRemoved";
        case ChangeKind::ChapterRenamed:    return "ChapterRenamed";
        case ChangeKind::Irrelevant:        return "Irrelevant";
    }
    return "Unknown";
}

namespace {

fs::path normalized(const fs::path& p) {
    auto out = p.lexically_normal();
    if (!out.has_filename() && out != out.root_path()) {
        out = out.parent_path();
    }
    return out;
}

ShelfResult<Classification> ambiguous(std::string message, const fs::path& path) {
    return ShelfResult<Classification>::err(
        ShelfError(ErrorCode::ClassificationAmbiguous, std::move(message), path));
}

void fillCollection(Classification& c, const fs::path& dir) {
    c.collectionId = dir.filename().string();
    c.collectionPath = dir;
}

void fillChapter(Classification& c, const fs::path& file) {
    fillCollection(c, file.parent_path());
    c.chapterName = file.filename().string();
}

} // namespace

EventClassifier::EventClassifier(fs::path root)
    : root_(normalized(root)) {}

EventClassifier::Level EventClassifier::levelOf(const fs::path& path,
                                                bool isDirectory) const {
    if (path == root_ || !path.has_parent_path()) {
        return Level::Other;
    }
    auto parent = path.parent_path();
    if (isDirectory) {
        return parent == root_ ? Level::Collection : Level::Other;
    }
    if (parent != root_ && parent.has_parent_path() && parent.parent_path() == root_) {
        return Level::Chapter;
    }
    return Level::Other;
}

ShelfResult<Classification> EventClassifier::resolve(const FsEvent& event) const {
    if (event.kind == FsEventKind::Overflow) {
        return ambiguous("overflow carries no path", {});
    }
    if (event.sourcePath.empty() || event.sourcePath.is_relative()) {
        return ambiguous("source path is not absolute", event.sourcePath);
    }

    Classification out;
    auto source = normalized(event.sourcePath);

    if (event.kind != FsEventKind::Moved) {
        auto level = levelOf(source, event.isDirectory);
        bool created = event.kind == FsEventKind::Created;
        if (level == Level::Collection) {
            out.kind = created ? ChangeKind::CollectionCreated : ChangeKind::CollectionRemoved;
            fillCollection(out, source);
        } else if (level == Level::Chapter) {
            out.kind = created ? ChangeKind::ChapterAdded : ChangeKind::ChapterRemoved;
            fillChapter(out, source);
        }
        return ShelfResult<Classification>::ok(std::move(out));
    }

    if (event.destPath.empty() || event.destPath.is_relative()) {
        return ambiguous("move without absolute destination", event.sourcePath);
    }
    auto dest = normalized(event.destPath);
    auto fromLevel = levelOf(source, event.isDirectory);
    auto toLevel = levelOf(dest, event.isDirectory);

    if (event.isDirectory) {
        bool from = fromLevel == Level::Collection;
        bool to = toLevel == Level::Collection;
        if (from && to) {
            out.kind = ChangeKind::CollectionRenamed;
            fillCollection(out, dest);
            out.previousCollectionId = source.filename().string();
            out.previousCollectionPath = source;
        } else if (to) {
            out.kind = ChangeKind::CollectionCreated;
            fillCollection(out, dest);
        } else if (from) {
            out.kind = ChangeKind::CollectionRemoved;
            fillCollection(out, source);
        }
        return ShelfResult<Classification>::ok(std::move(out));
    }

    bool from = fromLevel == Level::Chapter;
    bool to = toLevel == Level::Chapter;
    if (from && to) {
        out.kind = ChangeKind::ChapterRenamed;
        fillChapter(out, dest);
        out.previousCollectionId = source.parent_path().filename().string();
        out.previousCollectionPath = source.parent_path();
        out.previousChapterName = source.filename().string();
    } else if (to) {
        out.kind = ChangeKind::ChapterAdded;
        fillChapter(out, dest);
    } else if (from) {
        out.kind = ChangeKind::ChapterRemoved;
        fillChapter(out, source);
    }
    return ShelfResult<Classification>::ok(std::move(out));
}

Classification EventClassifier::classify(const FsEvent& event) const {
    auto resolved = resolve(event);
    if (resolved.hasError()) {
        return Classification{};
    }
    return std::move(resolved).value();
}

} // namespace shelf::library
