#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "shelf/foundation/console_logger.hpp"
#include "shelf/foundation/shelf_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace shelf::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class ShelfLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, Names) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Watcher), "Watcher");
    EXPECT_EQ(logCategoryName(LogCategory::Store), "Store");
    EXPECT_EQ(logCategoryName(LogCategory::Scheduler), "Scheduler");
    EXPECT_EQ(logCategoryName(LogCategory::Reconciler), "Reconciler");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
}

TEST(LogLevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("Warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

TEST(LogLevelTest, Names) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Critical), "CRITICAL");
}

// ---------------------------------------------------------------------------
// ShelfLogger
// ---------------------------------------------------------------------------

TEST_F(ShelfLoggerTest, DefaultCategoryLevels) {
    ShelfLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Watcher), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Scheduler), LogLevel::Warning);
}

TEST_F(ShelfLoggerTest, PrefixesCategory) {
    ShelfLogger logger;
    logger.log(LogLevel::Info, LogCategory::Store, "Flushed library");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Store] Flushed library");
}

TEST_F(ShelfLoggerTest, FiltersBelowCategoryLevel) {
    ShelfLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Watcher, "hidden");
    logger.log(LogLevel::Info, LogCategory::Scheduler, "hidden too");
    logger.log(LogLevel::Warning, LogCategory::Scheduler, "shown");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Scheduler] shown");
}

TEST_F(ShelfLoggerTest, OffIsNeverEnabled) {
    ShelfLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Core));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Core));
}

TEST_F(ShelfLoggerTest, SetAllCategoryLevels) {
    ShelfLogger logger;
    logger.setAllCategoryLevels(LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Store));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Reconciler));
}

TEST_F(ShelfLoggerTest, ContextIsAppended) {
    ShelfLogger logger;
    LogContext ctx;
    ctx.collectionId = "Berserk";
    ctx.path = "/srv/manga/Berserk";
    ctx.extra["chapters"] = "42";

    logger.logWithContext(LogLevel::Warning, LogCategory::Watcher, "Refresh failed", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message,
              "[Watcher] Refresh failed {collection=Berserk, path=/srv/manga/Berserk, "
              "chapters=42}");
}

TEST_F(ShelfLoggerTest, EmptyContextAddsNothing) {
    ShelfLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "Started", LogContext{});

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] Started");
}

TEST_F(ShelfLoggerTest, FlushReachesDefaultLogger) {
    ShelfLogger logger;
    EXPECT_TRUE(logger.flush().hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST_F(ShelfLoggerTest, MacrosUseProcessInstance) {
    SHELF_LOG_ERROR(LogCategory::Config, "bad key");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::error);
    EXPECT_EQ(records[0].message, "[Config] bad key");
}

TEST_F(ShelfLoggerTest, ConcurrentLogging) {
    ShelfLogger logger;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger] {
            for (int i = 0; i < kPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Core, "tick");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mockLogger_->records().size(),
              static_cast<std::size_t>(kThreads * kPerThread));
}

// ---------------------------------------------------------------------------
// ConsoleLogger
// ---------------------------------------------------------------------------

TEST(ConsoleLoggerTest, WritesOneLinePerRecord) {
    std::ostringstream out;
    ConsoleLogger console(out);

    ASSERT_TRUE(console.log(log_level::info, std::string("[Core] hello")).is_ok());
    ASSERT_TRUE(console.log(log_level::error, std::string("[Store] boom")).is_ok());

    auto text = out.str();
    auto firstBreak = text.find('\n');
    ASSERT_NE(firstBreak, std::string::npos);
    auto first = text.substr(0, firstBreak);
    auto second = text.substr(firstBreak + 1);

    // 2026-10-18T09:12:44.311Z is 24 characters.
    ASSERT_GT(first.size(), 25u);
    EXPECT_EQ(first[23], 'Z');
    EXPECT_EQ(first.substr(24), " INFO  [Core] hello");
    EXPECT_NE(second.find("ERROR [Store] boom"), std::string::npos);
}

TEST(ConsoleLoggerTest, RespectsLevel) {
    std::ostringstream out;
    ConsoleLogger console(out);
    ASSERT_TRUE(console.set_level(log_level::warning).is_ok());

    EXPECT_FALSE(console.is_enabled(log_level::info));
    ASSERT_TRUE(console.log(log_level::info, std::string("quiet")).is_ok());
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(console.get_level(), log_level::warning);
}
