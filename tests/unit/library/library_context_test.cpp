#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

#include "shelf/library/library_codec.hpp"
#include "shelf/library/library_context.hpp"
#include "shelf/library/polling_source.hpp"
#include "temp_dir.hpp"

using namespace shelf::library;
using namespace std::chrono_literals;
using shelf::foundation::ErrorCode;
using shelf::test::readFile;
using shelf::test::TempDir;
using shelf::test::writeFile;

namespace fs = std::filesystem;

class LibraryContextTest : public ::testing::Test {
protected:
    void SetUp() override { fs::create_directories(root()); }

    fs::path root() const { return tmp_ / "manga"; }

    LibraryConfig config() const {
        LibraryConfig cfg;
        cfg.root = root();
        cfg.storeFile = tmp_ / "state" / "manga_library.json";
        cfg.flushWindow = 50ms;
        cfg.reconcileWindow = 50ms;
        return cfg;
    }

    /// Each watcher gets a manual polling source; the latest is kept in
    /// source_ so tests can drive it.
    LibraryContext::SourceFactory manualSources() {
        return [this]() {
            PollingConfig pc;
            pc.interval = 0ms;
            auto source = std::make_unique<PollingSource>(pc);
            source_ = source.get();
            ++sourcesBuilt_;
            return source;
        };
    }

    TempDir tmp_;
    PollingSource* source_ = nullptr;
    int sourcesBuilt_ = 0;
};

TEST_F(LibraryContextTest, StartIndexesAndStopFlushes) {
    writeFile(root() / "Foo" / "a.cbz");
    auto cfg = config();
    {
        LibraryContext ctx(cfg, manualSources());
        ASSERT_TRUE(ctx.start().hasValue());
        EXPECT_TRUE(ctx.isRunning());
        EXPECT_TRUE(ctx.store().contains("Foo"));

        writeFile(root() / "Bar" / "b.cbz");
        source_->poll();
        EXPECT_TRUE(ctx.store().contains("Bar"));

        ctx.stop();
        EXPECT_FALSE(ctx.isRunning());
        EXPECT_FALSE(ctx.store().isDirty());
    }

    auto decoded = decodeLibrary(readFile(cfg.storeFile));
    ASSERT_TRUE(decoded.hasValue());
    EXPECT_EQ(decoded.value().size(), 2u);
}

TEST_F(LibraryContextTest, LoadedRecordsAreNotReportedAsNew) {
    auto cfg = config();
    cfg.initialScan = false;
    writeFile(cfg.storeFile, R"({"Old": {"path": "/x/Old",
        "created_at": "2024-01-01T00:00:00.000000",
        "last_updated": "2024-01-01T00:00:00.000000", "cbz_files": []}})");

    LibraryContext ctx(cfg, manualSources());
    ASSERT_TRUE(ctx.start().hasValue());
    EXPECT_TRUE(ctx.store().contains("Old"));
    EXPECT_TRUE(ctx.updater().updateNow().empty());
}

TEST_F(LibraryContextTest, CorruptStoreIsNotFatal) {
    auto cfg = config();
    writeFile(cfg.storeFile, "garbage");

    LibraryContext ctx(cfg, manualSources());
    EXPECT_TRUE(ctx.start().hasValue());
    EXPECT_EQ(ctx.store().size(), 0u);
}

TEST_F(LibraryContextTest, InvalidRootFailsStart) {
    auto cfg = config();
    cfg.root = tmp_ / "missing";

    LibraryContext ctx(cfg, manualSources());
    auto result = ctx.start();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidRoot);
    EXPECT_FALSE(ctx.isRunning());
    EXPECT_FALSE(ctx.updater().isAttached());
}

TEST_F(LibraryContextTest, DiffsArePublished) {
    LibraryContext ctx(config(), manualSources());
    std::vector<LibraryDiff> diffs;
    ctx.updater().onDiff().connect([&](const LibraryDiff& d) { diffs.push_back(d); });
    ASSERT_TRUE(ctx.start().hasValue());

    writeFile(root() / "Foo" / "a.cbz");
    source_->poll();
    ctx.stop();

    ASSERT_FALSE(diffs.empty());
    EXPECT_EQ(diffs.front().addedCollections, (std::vector<std::string>{"Foo"}));
}

TEST_F(LibraryContextTest, RestartWatcherBuildsFreshSource) {
    LibraryContext ctx(config(), manualSources());
    ASSERT_TRUE(ctx.start().hasValue());
    EXPECT_EQ(sourcesBuilt_, 1);

    ASSERT_TRUE(ctx.restartWatcher().hasValue());
    EXPECT_EQ(sourcesBuilt_, 2);
    EXPECT_EQ(ctx.watcher().state(), WatcherState::Watching);

    writeFile(root() / "Late" / "a.cbz");
    source_->poll();
    EXPECT_TRUE(ctx.store().contains("Late"));
}

TEST_F(LibraryContextTest, RestartWhileStoppedDoesNotStart) {
    LibraryContext ctx(config(), manualSources());
    ASSERT_TRUE(ctx.restartWatcher().hasValue());
    EXPECT_EQ(ctx.watcher().state(), WatcherState::Stopped);
}

TEST_F(LibraryContextTest, DefaultFactoryUsesConfiguredBackend) {
    auto cfg = config();
    cfg.source.backend = SourceBackend::Polling;
    cfg.source.pollInterval = 20ms;

    LibraryContext ctx(cfg);
    ASSERT_TRUE(ctx.start().hasValue());
    writeFile(root() / "Foo" / "a.cbz");

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!ctx.store().contains("Foo") && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(ctx.store().contains("Foo"));
}
