#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "shelf/library/notification_source.hpp"
#include "shelf/library/polling_source.hpp"
#include "temp_dir.hpp"

using namespace shelf::library;
using namespace std::chrono_literals;
using shelf::foundation::ErrorCode;
using shelf::test::TempDir;
using shelf::test::writeFile;

namespace fs = std::filesystem;

class PollingSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        PollingConfig config;
        config.interval = 0ms;  // manual poll() only
        source_ = std::make_unique<PollingSource>(config);
    }

    void subscribe() {
        auto result = source_->subscribe(tmp_.path(), [this](const FsEvent& event) {
            events_.push_back(event);
        });
        ASSERT_TRUE(result.hasValue());
    }

    TempDir tmp_;
    std::unique_ptr<PollingSource> source_;
    std::vector<FsEvent> events_;
};

TEST_F(PollingSourceTest, ExistingEntriesAreBaseline) {
    writeFile(tmp_ / "Foo" / "a.cbz");
    subscribe();

    EXPECT_EQ(source_->poll(), 0u);
    EXPECT_TRUE(events_.empty());
    EXPECT_TRUE(source_->isSubscribed());
    EXPECT_EQ(source_->name(), "polling");
}

TEST_F(PollingSourceTest, ReportsCreatedDirectoryAndFile) {
    subscribe();
    writeFile(tmp_ / "Foo" / "a.cbz");

    ASSERT_EQ(source_->poll(), 2u);
    EXPECT_EQ(events_[0], (FsEvent{FsEventKind::Created, true, tmp_ / "Foo", {}}));
    EXPECT_EQ(events_[1], (FsEvent{FsEventKind::Created, false, tmp_ / "Foo" / "a.cbz", {}}));
}

TEST_F(PollingSourceTest, DeletionsAreDeepestFirst) {
    writeFile(tmp_ / "Foo" / "a.cbz");
    subscribe();
    fs::remove_all(tmp_ / "Foo");

    ASSERT_EQ(source_->poll(), 2u);
    EXPECT_EQ(events_[0], (FsEvent{FsEventKind::Deleted, false, tmp_ / "Foo" / "a.cbz", {}}));
    EXPECT_EQ(events_[1], (FsEvent{FsEventKind::Deleted, true, tmp_ / "Foo", {}}));
}

TEST_F(PollingSourceTest, DirectoryRenameIsOneMove) {
    writeFile(tmp_ / "Old" / "a.cbz");
    writeFile(tmp_ / "Old" / "b.cbz");
    subscribe();
    fs::rename(tmp_ / "Old", tmp_ / "New");

    ASSERT_EQ(source_->poll(), 1u);
    EXPECT_EQ(events_[0], (FsEvent{FsEventKind::Moved, true, tmp_ / "Old", tmp_ / "New"}));
}

TEST_F(PollingSourceTest, FileRenameBetweenCollections) {
    writeFile(tmp_ / "A" / "x.cbz");
    fs::create_directories(tmp_ / "B");
    subscribe();
    fs::rename(tmp_ / "A" / "x.cbz", tmp_ / "B" / "y.cbz");

    ASSERT_EQ(source_->poll(), 1u);
    EXPECT_EQ(events_[0],
              (FsEvent{FsEventKind::Moved, false, tmp_ / "A" / "x.cbz", tmp_ / "B" / "y.cbz"}));
}

TEST_F(PollingSourceTest, IgnoresEntriesBeyondDepth) {
    fs::create_directories(tmp_ / "Foo" / "extras");
    subscribe();
    writeFile(tmp_ / "Foo" / "extras" / "deep.cbz");

    EXPECT_EQ(source_->poll(), 0u);
}

TEST_F(PollingSourceTest, SecondSubscribeFails) {
    subscribe();
    auto again = source_->subscribe(tmp_.path(), [](const FsEvent&) {});
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::NotificationSourceFailed);
}

TEST_F(PollingSourceTest, MissingRootFails) {
    auto result = source_->subscribe(tmp_ / "absent", [](const FsEvent&) {});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotificationSourceFailed);
    EXPECT_FALSE(source_->isSubscribed());
}

TEST_F(PollingSourceTest, UnsubscribeStopsDelivery) {
    subscribe();
    source_->unsubscribe();
    writeFile(tmp_ / "Foo" / "a.cbz");

    EXPECT_EQ(source_->poll(), 0u);
    EXPECT_FALSE(source_->isSubscribed());
}

TEST_F(PollingSourceTest, UnlistableRootSkipsPass) {
    auto lib = tmp_ / "lib";
    writeFile(lib / "A" / "a.cbz");
    fs::create_directories(lib / "B");
    ASSERT_TRUE(source_->subscribe(lib, [this](const FsEvent& event) {
        events_.push_back(event);
    }).hasValue());

    fs::rename(lib, tmp_ / "lib.away");
    EXPECT_EQ(source_->poll(), 0u);
    fs::rename(tmp_ / "lib.away", lib);
    EXPECT_EQ(source_->poll(), 0u);
    EXPECT_TRUE(events_.empty());

    writeFile(lib / "A" / "b.cbz");
    ASSERT_EQ(source_->poll(), 1u);
    EXPECT_EQ(events_[0], (FsEvent{FsEventKind::Created, false, lib / "A" / "b.cbz", {}}));
}

TEST_F(PollingSourceTest, ConcurrentRemovalDoesNotTouchOtherCollections) {
    constexpr int kStable = 50;
    for (int i = 0; i < kStable; ++i) {
        writeFile(tmp_ / ("Stable" + std::to_string(i)) / "a.cbz");
    }
    subscribe();

    std::atomic<bool> done{false};
    std::thread churn([&]() {
        for (int i = 0; i < 300; ++i) {
            auto dir = tmp_ / ("Churn" + std::to_string(i % 5));
            writeFile(dir / "x.cbz");
            std::error_code ec;
            fs::remove_all(dir, ec);
        }
        done = true;
    });
    while (!done) {
        source_->poll();
    }
    churn.join();
    source_->poll();

    for (const auto& event : events_) {
        auto name = event.sourcePath.lexically_relative(tmp_.path()).begin()->string();
        EXPECT_EQ(name.rfind("Stable", 0), std::string::npos)
            << fsEventKindName(event.kind) << " " << event.sourcePath;
    }
}

TEST(NotificationSourceFactoryTest, ParsesBackends) {
    EXPECT_EQ(parseSourceBackend("Polling"), SourceBackend::Polling);
    EXPECT_EQ(parseSourceBackend("INOTIFY"), SourceBackend::Inotify);
    EXPECT_FALSE(parseSourceBackend("fanotify").has_value());
    EXPECT_EQ(sourceBackendName(SourceBackend::Inotify), "inotify");
}

TEST(NotificationSourceFactoryTest, BuildsSelectedBackend) {
    SourceOptions options;
    options.backend = SourceBackend::Inotify;
    EXPECT_EQ(makeNotificationSource(options)->name(), "inotify");

    options.backend = SourceBackend::Polling;
    EXPECT_EQ(makeNotificationSource(options)->name(), "polling");
}
