/// @file main.cpp
/// @brief shelf_watcher entry point.
///
/// Keeps the collection index of a library root up to date and logs every
/// change the reconciler reports until SIGINT/SIGTERM.

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <kcenon/common/interfaces/global_logger_registry.h>

#include "shelf/foundation/config_manager.hpp"
#include "shelf/foundation/console_logger.hpp"
#include "shelf/foundation/shelf_logger.hpp"
#include "shelf/library/library_context.hpp"
#include "shelf/service/library_settings.hpp"
#include "shelf/service/service_runner.hpp"
#include "shelf/version.hpp"

int main(int argc, char* argv[]) {
    using shelf::foundation::LogCategory;

    shelf::service::SignalHandler signals;

    auto consoleLogger = std::make_shared<shelf::foundation::ConsoleLogger>();
    kcenon::common::interfaces::GlobalLoggerRegistry::instance().set_default_logger(
        consoleLogger);
    auto& logger = shelf::foundation::ShelfLogger::instance();

    auto configPath = shelf::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "/etc/shelf/shelf.yaml";
    }

    shelf::foundation::ConfigManager config;
    auto loadResult = shelf::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto logResult = shelf::service::applyLoggingConfig(config, logger);
    if (!logResult) {
        std::cerr << "Invalid logging config: " << logResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto libraryConfig = shelf::service::buildLibraryConfig(config);
    if (!libraryConfig) {
        std::cerr << "Invalid library config: " << libraryConfig.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    shelf::library::LibraryContext context(libraryConfig.value());
    context.updater().onDiff().connect([](const shelf::library::LibraryDiff& diff) {
        for (const auto& id : diff.addedCollections) {
            SHELF_LOG_INFO(LogCategory::Core, "new collection: " + id);
        }
        for (const auto& id : diff.removedCollections) {
            SHELF_LOG_INFO(LogCategory::Core, "collection gone: " + id);
        }
        for (const auto& [id, delta] : diff.changedCollections) {
            SHELF_LOG_INFO(LogCategory::Core,
                           id + ": +" + std::to_string(delta.added.size()) + " / -" +
                               std::to_string(delta.removed.size()) + " chapters");
        }
    });

    auto startResult = context.start();
    if (!startResult) {
        std::cerr << "Failed to start library watcher: "
                  << startResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    SHELF_LOG_INFO(LogCategory::Core,
                   std::string("shelf_watcher ") + std::string(shelf::Version::string) +
                       " watching " + libraryConfig.value().root.string() + " (" +
                       std::string(shelf::library::sourceBackendName(
                           libraryConfig.value().source.backend)) +
                       ", store " + libraryConfig.value().storeFile.string() + ")");

    shelf::service::GracefulShutdown shutdown;
    shutdown.addHook("library", [&context]() { context.stop(); });
    shutdown.addHook("logger", [&logger]() { (void)logger.flush(); });

    while (!signals.shutdownRequested()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        if (signals.shutdownRequested() ||
            context.watcher().state() == shelf::library::WatcherState::Watching) {
            continue;
        }
        SHELF_LOG_ERROR(LogCategory::Core, "notification source lost, restarting watcher");
        if (!context.restartWatcher()) {
            SHELF_LOG_WARN(LogCategory::Core, "retrying watcher restart in 1s");
        }
    }

    SHELF_LOG_INFO(LogCategory::Core, "shutting down");
    shutdown.execute();
    return EXIT_SUCCESS;
}
