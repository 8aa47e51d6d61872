#include <gtest/gtest.h>

#include "shelf/library/event_classifier.hpp"

using namespace shelf::library;
using shelf::foundation::ErrorCode;

namespace {

FsEvent created(const char* path, bool dir) {
    return FsEvent{FsEventKind::Created, dir, path, {}};
}

FsEvent deleted(const char* path, bool dir) {
    return FsEvent{FsEventKind::Deleted, dir, path, {}};
}

FsEvent moved(const char* from, const char* to, bool dir) {
    return FsEvent{FsEventKind::Moved, dir, from, to};
}

} // namespace

class EventClassifierTest : public ::testing::Test {
protected:
    EventClassifier classifier_{"/srv/manga/"};
};

TEST_F(EventClassifierTest, RootIsNormalized) {
    EXPECT_EQ(classifier_.root(), std::filesystem::path("/srv/manga"));
}

TEST_F(EventClassifierTest, CollectionCreatedAndRemoved) {
    auto c = classifier_.classify(created("/srv/manga/Berserk", true));
    EXPECT_EQ(c.kind, ChangeKind::CollectionCreated);
    EXPECT_EQ(c.collectionId, "Berserk");
    EXPECT_EQ(c.collectionPath, std::filesystem::path("/srv/manga/Berserk"));
    EXPECT_TRUE(c.isCollectionChange());

    auto r = classifier_.classify(deleted("/srv/manga/Berserk", true));
    EXPECT_EQ(r.kind, ChangeKind::CollectionRemoved);
    EXPECT_EQ(r.collectionId, "Berserk");
}

TEST_F(EventClassifierTest, ChapterAddedAndRemoved) {
    auto c = classifier_.classify(created("/srv/manga/Berserk/v01.cbz", false));
    EXPECT_EQ(c.kind, ChangeKind::ChapterAdded);
    EXPECT_EQ(c.collectionId, "Berserk");
    EXPECT_EQ(c.chapterName, "v01.cbz");
    EXPECT_TRUE(c.isChapterChange());

    auto r = classifier_.classify(deleted("/srv/manga/Berserk/v01.cbz", false));
    EXPECT_EQ(r.kind, ChangeKind::ChapterRemoved);
    EXPECT_EQ(r.chapterName, "v01.cbz");
}

TEST_F(EventClassifierTest, IrrelevantLevels) {
    // File directly under the root.
    EXPECT_EQ(classifier_.classify(created("/srv/manga/readme.txt", false)).kind,
              ChangeKind::Irrelevant);
    // Directory inside a collection.
    EXPECT_EQ(classifier_.classify(created("/srv/manga/Berserk/extras", true)).kind,
              ChangeKind::Irrelevant);
    // File nested below a collection.
    EXPECT_EQ(classifier_.classify(created("/srv/manga/Berserk/extras/a.cbz", false)).kind,
              ChangeKind::Irrelevant);
    // The root itself and paths outside it.
    EXPECT_EQ(classifier_.classify(deleted("/srv/manga", true)).kind, ChangeKind::Irrelevant);
    EXPECT_EQ(classifier_.classify(created("/tmp/Berserk", true)).kind,
              ChangeKind::Irrelevant);
}

TEST_F(EventClassifierTest, CollectionRename) {
    auto c = classifier_.classify(moved("/srv/manga/Old", "/srv/manga/New", true));
    EXPECT_EQ(c.kind, ChangeKind::CollectionRenamed);
    EXPECT_EQ(c.collectionId, "New");
    EXPECT_EQ(c.previousCollectionId, "Old");
    EXPECT_EQ(c.previousCollectionPath, std::filesystem::path("/srv/manga/Old"));
}

TEST_F(EventClassifierTest, CollectionMovedInOrOut) {
    auto in = classifier_.classify(moved("/tmp/Incoming", "/srv/manga/Incoming", true));
    EXPECT_EQ(in.kind, ChangeKind::CollectionCreated);
    EXPECT_EQ(in.collectionId, "Incoming");

    auto out = classifier_.classify(moved("/srv/manga/Gone", "/tmp/Gone", true));
    EXPECT_EQ(out.kind, ChangeKind::CollectionRemoved);
    EXPECT_EQ(out.collectionId, "Gone");
}

TEST_F(EventClassifierTest, ChapterRenameAcrossCollections) {
    auto c = classifier_.classify(
        moved("/srv/manga/A/old.cbz", "/srv/manga/B/new.cbz", false));
    EXPECT_EQ(c.kind, ChangeKind::ChapterRenamed);
    EXPECT_EQ(c.collectionId, "B");
    EXPECT_EQ(c.chapterName, "new.cbz");
    EXPECT_EQ(c.previousCollectionId, "A");
    EXPECT_EQ(c.previousChapterName, "old.cbz");
}

TEST_F(EventClassifierTest, ChapterMovedInOrOut) {
    auto in = classifier_.classify(moved("/tmp/x.cbz", "/srv/manga/A/x.cbz", false));
    EXPECT_EQ(in.kind, ChangeKind::ChapterAdded);
    EXPECT_EQ(in.collectionId, "A");

    auto out = classifier_.classify(moved("/srv/manga/A/x.cbz", "/srv/manga/x.cbz", false));
    EXPECT_EQ(out.kind, ChangeKind::ChapterRemoved);
    EXPECT_EQ(out.chapterName, "x.cbz");
}

TEST_F(EventClassifierTest, AmbiguousEvents) {
    auto overflow = classifier_.resolve(FsEvent{FsEventKind::Overflow, false, {}, {}});
    ASSERT_TRUE(overflow.hasError());
    EXPECT_EQ(overflow.error().code(), ErrorCode::ClassificationAmbiguous);

    auto relative = classifier_.resolve(created("Berserk", true));
    ASSERT_TRUE(relative.hasError());
    EXPECT_EQ(relative.error().code(), ErrorCode::ClassificationAmbiguous);

    auto noDest = classifier_.resolve(FsEvent{FsEventKind::Moved, true, "/srv/manga/A", {}});
    ASSERT_TRUE(noDest.hasError());

    EXPECT_EQ(classifier_.classify(created("", false)).kind, ChangeKind::Irrelevant);
}

TEST(ChangeKindTest, Names) {
    EXPECT_EQ(changeKindName(ChangeKind::ChapterRenamed), "ChapterRenamed");
    EXPECT_EQ(fsEventKindName(FsEventKind::Overflow), "overflow");
}
