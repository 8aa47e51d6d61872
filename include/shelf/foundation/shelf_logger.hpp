#pragma once

/// @file shelf_logger.hpp
/// @brief ShelfLogger wrapping kcenon common_system logger interfaces.
///
/// Category-based filtering, structured context and per-category runtime
/// log levels for the indexer components.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "shelf/foundation/shelf_result.hpp"

namespace shelf::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per component.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Startup, shutdown, context wiring
    Watcher    = 1, ///< Notification sources and the directory watcher
    Store      = 2, ///< Persistent key-value store
    Scheduler  = 3, ///< Throttle timers
    Reconciler = 4, ///< Snapshot diffs
    Config     = 5  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Watcher", "Store", "Scheduler", "Reconciler", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse "debug", "info", ... (case-insensitive). Returns nullopt if unknown.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.collectionId = "Berserk";
///   ctx.extra["chapters"] = "42";
///   logger.logWithContext(LogLevel::Info, LogCategory::Watcher,
///                         "Collection refreshed", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> collectionId;
    std::optional<std::string> path;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger facade over kcenon's logger registry.
///
/// Each category resolves to the registry logger named "shelf.<Category>"
/// when one is registered, otherwise to the registry's default logger.
/// PIMPL keeps kcenon headers out of the public API.
///
/// Default levels:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Watcher    | Info          |
/// | Store      | Info          |
/// | Scheduler  | Warning       |
/// | Reconciler | Info          |
/// | Config     | Info          |
class ShelfLogger {
public:
    ShelfLogger();
    ~ShelfLogger();

    ShelfLogger(const ShelfLogger&) = delete;
    ShelfLogger& operator=(const ShelfLogger&) = delete;
    ShelfLogger(ShelfLogger&&) noexcept;
    ShelfLogger& operator=(ShelfLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as {key=val, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one minimum level to every category.
    void setAllCategoryLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    ShelfResult<void> flush();

    /// Process-wide instance used by the SHELF_LOG macros.
    static ShelfLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace shelf::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// Define SHELF_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold (0=Trace ... 6=Off).
#ifndef SHELF_MIN_LOG_LEVEL
    #define SHELF_MIN_LOG_LEVEL 0
#endif

#define SHELF_LOG(level, cat, msg)                                                   \
    do {                                                                             \
        _Pragma("GCC diagnostic push")                                               \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                          \
        if (static_cast<int>(level) >= SHELF_MIN_LOG_LEVEL &&                        \
            ::shelf::foundation::ShelfLogger::instance().isEnabled((level), (cat)))  \
        {                                                                            \
            ::shelf::foundation::ShelfLogger::instance().log((level), (cat), (msg)); \
        }                                                                            \
        _Pragma("GCC diagnostic pop")                                                \
    } while (0)

#define SHELF_LOG_DEBUG(cat, msg) \
    SHELF_LOG(::shelf::foundation::LogLevel::Debug, (cat), (msg))

#define SHELF_LOG_INFO(cat, msg) \
    SHELF_LOG(::shelf::foundation::LogLevel::Info, (cat), (msg))

#define SHELF_LOG_WARN(cat, msg) \
    SHELF_LOG(::shelf::foundation::LogLevel::Warning, (cat), (msg))

#define SHELF_LOG_ERROR(cat, msg) \
    SHELF_LOG(::shelf::foundation::LogLevel::Error, (cat), (msg))
