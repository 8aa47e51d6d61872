/// @file service_runner.cpp
/// @brief Daemon entry-point helpers.

#include "shelf/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <thread>

#include "shelf/foundation/shelf_logger.hpp"

namespace shelf::service {

using shelf::foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back({std::move(name), std::move(hook)});
}

std::size_t GracefulShutdown::execute() {
    if (executed_) {
        return 0;
    }
    executed_ = true;

    std::size_t completed = 0;
    for (const auto& hook : hooks_) {
        SHELF_LOG_INFO(LogCategory::Core, "shutdown: " + hook.name);
        try {
            hook.callback();
            ++completed;
        } catch (const std::exception& e) {
            SHELF_LOG_ERROR(LogCategory::Core,
                            "shutdown hook '" + hook.name + "' failed: " + e.what());
        }
    }
    return completed;
}

std::size_t GracefulShutdown::hookCount() const {
    return hooks_.size();
}

// -- Config loading ----------------------------------------------------------

foundation::ShelfResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("SHELF_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace shelf::service
