#pragma once

/// @file service_runner.hpp
/// @brief Signal handling, shutdown ordering and config loading for the
///        shelf daemon.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "shelf/foundation/config_manager.hpp"
#include "shelf/foundation/shelf_result.hpp"

namespace shelf::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// One instance per process. The handler only stores to a lock-free
/// atomic. Default handlers are restored on destruction, so a signal that
/// arrives during teardown terminates the process.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block until SIGINT or SIGTERM arrives.
    void waitForShutdown() const;

    /// Same as receiving a signal; used by tests and fatal paths.
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Ordered list of named teardown steps.
///
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("library", [&]() { context.stop(); });
///   shutdown.addHook("logger",  [&]() { (void)logger.flush(); });
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    /// Run every hook once, in registration order. A hook that throws is
    /// logged and the remaining hooks still run.
    /// @return Number of hooks that completed without throwing.
    std::size_t execute();

    [[nodiscard]] std::size_t hookCount() const;

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    bool executed_ = false;
};

/// Load YAML configuration into @p config.
///
/// SHELF_CONFIG_PATH, when set, takes precedence over @p defaultPath.
[[nodiscard]] foundation::ShelfResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& defaultPath);

/// Value of `--config <path>`, or an empty path when absent.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

} // namespace shelf::service
