/// @file notification_source.cpp
/// @brief Backend selection for notification sources.

#include "shelf/library/notification_source.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "shelf/library/inotify_source.hpp"
#include "shelf/library/polling_source.hpp"

namespace shelf::library {

std::string_view sourceBackendName(SourceBackend backend) noexcept {
    switch (backend) {
        case SourceBackend::Polling: return "polling";
        case SourceBackend::Inotify: return "inotify";
    }
    return "unknown";
}

std::optional<SourceBackend> parseSourceBackend(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "polling") {
        return SourceBackend::Polling;
    }
    if (lower == "inotify") {
        return SourceBackend::Inotify;
    }
    return std::nullopt;
}

std::unique_ptr<INotificationSource> makeNotificationSource(const SourceOptions& options) {
    switch (options.backend) {
        case SourceBackend::Inotify:
            return std::make_unique<InotifySource>();
        case SourceBackend::Polling:
            break;
    }
    PollingConfig config;
    config.interval = options.pollInterval;
    return std::make_unique<PollingSource>(config);
}

} // namespace shelf::library
