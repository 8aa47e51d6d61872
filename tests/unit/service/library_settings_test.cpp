#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "shelf/service/library_settings.hpp"

using namespace shelf::service;
using namespace std::chrono_literals;
using shelf::foundation::ConfigManager;
using shelf::foundation::ErrorCode;
using shelf::foundation::LogCategory;
using shelf::foundation::LogLevel;
using shelf::foundation::ShelfLogger;
using shelf::library::SourceBackend;

class LibrarySettingsTest : public ::testing::Test {
protected:
    void SetUp() override { ::unsetenv("MANGA_PATH"); }
    void TearDown() override { ::unsetenv("MANGA_PATH"); }

    const ConfigManager& load(const std::string& yaml) {
        EXPECT_TRUE(config_.loadFromString(yaml).hasValue());
        return config_;
    }

    ConfigManager config_;
};

TEST_F(LibrarySettingsTest, Defaults) {
    const auto& config = load("library:\n  root: /srv/manga\n");
    auto result = buildLibraryConfig(config);
    ASSERT_TRUE(result.hasValue());

    const auto& cfg = result.value();
    EXPECT_EQ(cfg.root, std::filesystem::path("/srv/manga"));
    EXPECT_EQ(cfg.storeFile, std::filesystem::path("manga_library.json"));
    EXPECT_EQ(cfg.chapterExtension, ".cbz");
    EXPECT_TRUE(cfg.initialScan);
    EXPECT_EQ(cfg.flushWindow, 500ms);
    EXPECT_EQ(cfg.reconcileWindow, 500ms);
    EXPECT_EQ(cfg.source.backend, SourceBackend::Polling);
    EXPECT_EQ(cfg.source.pollInterval, 5000ms);
}

TEST_F(LibrarySettingsTest, ExplicitValues) {
    const auto& config = load(R"(
library:
  root: /data/comics
  store_file: /var/lib/shelf/index.json
  chapter_extension: .cbr
  initial_scan: false
persistence:
  flush_window_ms: 0
reconcile:
  window_ms: 1000
watcher:
  backend: inotify
  poll_interval_ms: 0
)");
    auto result = buildLibraryConfig(config);
    ASSERT_TRUE(result.hasValue());

    const auto& cfg = result.value();
    EXPECT_EQ(cfg.storeFile, std::filesystem::path("/var/lib/shelf/index.json"));
    EXPECT_EQ(cfg.chapterExtension, ".cbr");
    EXPECT_FALSE(cfg.initialScan);
    EXPECT_EQ(cfg.flushWindow, 0ms);
    EXPECT_EQ(cfg.reconcileWindow, 1000ms);
    EXPECT_EQ(cfg.source.backend, SourceBackend::Inotify);
}

TEST_F(LibrarySettingsTest, EnvironmentOverridesRoot) {
    ::setenv("MANGA_PATH", "/mnt/manga", 1);
    const auto& config = load("{}");
    auto result = buildLibraryConfig(config);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().root, std::filesystem::path("/mnt/manga"));
}

TEST_F(LibrarySettingsTest, MissingRoot) {
    auto result = buildLibraryConfig(load("{}"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(LibrarySettingsTest, RelativeRootRejected) {
    auto result = buildLibraryConfig(load("library:\n  root: manga\n"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(LibrarySettingsTest, InvalidValuesRejected) {
    const char* cases[] = {
        "library:\n  root: /m\n  chapter_extension: ''\n",
        "library:\n  root: /m\n  store_file: ''\n",
        "library:\n  root: /m\npersistence:\n  flush_window_ms: -1\n",
        "library:\n  root: /m\nwatcher:\n  backend: fanotify\n",
        "library:\n  root: /m\nwatcher:\n  poll_interval_ms: 0\n",
    };
    for (const char* yaml : cases) {
        auto result = buildLibraryConfig(load(yaml));
        ASSERT_TRUE(result.hasError()) << yaml;
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument) << yaml;
    }
}

TEST_F(LibrarySettingsTest, WrongTypeReported) {
    auto result = buildLibraryConfig(load("library:\n  root: /m\n  initial_scan: maybe\n"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(LibrarySettingsTest, LoggingLevelApplied) {
    ShelfLogger logger;
    ASSERT_TRUE(applyLoggingConfig(load("logging:\n  level: debug\n"), logger).hasValue());
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Scheduler), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Store), LogLevel::Debug);
}

TEST_F(LibrarySettingsTest, LoggingLevelMissingOrUnknown) {
    ShelfLogger logger;
    EXPECT_TRUE(applyLoggingConfig(load("{}"), logger).hasValue());
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Scheduler), LogLevel::Warning);

    auto bad = applyLoggingConfig(load("logging:\n  level: chatty\n"), logger);
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidArgument);
}
