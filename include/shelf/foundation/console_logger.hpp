#pragma once

/// @file console_logger.hpp
/// @brief kcenon ILogger backend writing timestamped lines to a stream.

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace shelf::foundation {

/// Minimal line-oriented logger registered as the registry default by the
/// daemon. Each record becomes one line:
/// @code
///   2026-10-18T09:12:44.311Z INFO  [Watcher] Started watching: /srv/manga
/// @endcode
class ConsoleLogger : public kcenon::common::interfaces::ILogger {
public:
    /// Writes to std::cerr.
    ConsoleLogger();

    /// Writes to @p out, which must outlive the logger.
    explicit ConsoleLogger(std::ostream& out);

    kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
                                   const std::string& message) override;

    kcenon::common::VoidResult log(
        kcenon::common::interfaces::log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(kcenon::common::interfaces::log_level level) const override;

    kcenon::common::VoidResult set_level(
        kcenon::common::interfaces::log_level level) override;

    kcenon::common::interfaces::log_level get_level() const override;

    kcenon::common::VoidResult flush() override;

private:
    std::ostream& out_;
    std::mutex mutex_;
    std::atomic<kcenon::common::interfaces::log_level> minLevel_{
        kcenon::common::interfaces::log_level::trace};
};

} // namespace shelf::foundation
