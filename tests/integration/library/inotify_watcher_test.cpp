/// @file inotify_watcher_test.cpp
/// @brief End-to-end: real filesystem changes under an inotify-backed
///        LibraryContext reach the store, the JSON file and diff subscribers.

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "shelf/library/inotify_source.hpp"
#include "shelf/library/library_codec.hpp"
#include "shelf/library/library_context.hpp"
#include "temp_dir.hpp"

using namespace shelf::library;
using namespace std::chrono_literals;
using shelf::test::readFile;
using shelf::test::TempDir;
using shelf::test::writeFile;

namespace fs = std::filesystem;

namespace {

bool eventually(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = 3s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return condition();
}

} // namespace

class InotifyWatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs::create_directories(root());
        LibraryConfig cfg;
        cfg.root = root();
        cfg.storeFile = tmp_ / "manga_library.json";
        cfg.flushWindow = 50ms;
        cfg.reconcileWindow = 50ms;
        cfg.source.backend = SourceBackend::Inotify;
        config_ = cfg;
    }

    fs::path root() const { return tmp_ / "manga"; }

    TempDir tmp_;
    LibraryConfig config_;
};

TEST_F(InotifyWatcherTest, WatchesRootAndCollections) {
    fs::create_directories(root() / "A");
    fs::create_directories(root() / "B");

    InotifySource source;
    ASSERT_TRUE(source.subscribe(root(), [](const FsEvent&) {}).hasValue());
    EXPECT_EQ(source.watchCount(), 3u);
    source.unsubscribe();
    EXPECT_FALSE(source.isSubscribed());
}

TEST_F(InotifyWatcherTest, NewCollectionAndChapterAreIndexed) {
    LibraryContext ctx(config_);
    ASSERT_TRUE(ctx.start().hasValue());

    fs::create_directories(root() / "Foo");
    // Give the source a moment to add the new directory's watch.
    ASSERT_TRUE(eventually([&] { return ctx.store().contains("Foo"); }));
    writeFile(root() / "Foo" / "v1c1.cbz");

    ASSERT_TRUE(eventually([&] {
        auto record = ctx.store().get("Foo");
        return record && record->chapterFiles.count("v1c1.cbz") == 1;
    }));

    ASSERT_TRUE(eventually([&] {
        auto decoded = decodeLibrary(readFile(config_.storeFile));
        return decoded.hasValue() && decoded.value().count("Foo") == 1 &&
               decoded.value().at("Foo").totalChapters() == 1;
    }));
}

TEST_F(InotifyWatcherTest, RenamedCollectionKeepsCreatedAt) {
    writeFile(root() / "Old" / "a.cbz");
    LibraryContext ctx(config_);
    ASSERT_TRUE(ctx.start().hasValue());
    auto created = ctx.store().get("Old")->createdAt;

    fs::rename(root() / "Old", root() / "New");

    ASSERT_TRUE(eventually([&] {
        return ctx.store().contains("New") && !ctx.store().contains("Old");
    }));
    EXPECT_EQ(ctx.store().get("New")->createdAt, created);

    // The renamed directory is still watched under its new name.
    writeFile(root() / "New" / "b.cbz");
    EXPECT_TRUE(eventually([&] { return ctx.store().get("New")->totalChapters() == 2; }));
}

TEST_F(InotifyWatcherTest, RemovedCollectionIsDropped) {
    writeFile(root() / "Gone" / "a.cbz");
    LibraryContext ctx(config_);
    ASSERT_TRUE(ctx.start().hasValue());
    ASSERT_TRUE(ctx.store().contains("Gone"));

    fs::remove_all(root() / "Gone");
    EXPECT_TRUE(eventually([&] { return !ctx.store().contains("Gone"); }));
}

TEST_F(InotifyWatcherTest, ChapterMovedBetweenCollections) {
    writeFile(root() / "A" / "x.cbz");
    fs::create_directories(root() / "B");
    LibraryContext ctx(config_);
    ASSERT_TRUE(ctx.start().hasValue());

    fs::rename(root() / "A" / "x.cbz", root() / "B" / "x.cbz");
    EXPECT_TRUE(eventually([&] {
        return ctx.store().get("A")->totalChapters() == 0 &&
               ctx.store().get("B")->totalChapters() == 1;
    }));
}

TEST_F(InotifyWatcherTest, DiffsReachSubscribers) {
    LibraryContext ctx(config_);
    std::mutex mutex;
    std::vector<std::string> added;
    ctx.updater().onDiff().connect([&](const LibraryDiff& diff) {
        std::lock_guard lock(mutex);
        added.insert(added.end(), diff.addedCollections.begin(), diff.addedCollections.end());
    });
    ASSERT_TRUE(ctx.start().hasValue());

    fs::create_directories(root() / "One");
    fs::create_directories(root() / "Two");

    EXPECT_TRUE(eventually([&] {
        std::lock_guard lock(mutex);
        return added.size() == 2;
    }));
}
