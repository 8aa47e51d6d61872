#pragma once

/// @file notification_source.hpp
/// @brief Abstract producer of filesystem notifications for a watched root.

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include "shelf/foundation/shelf_result.hpp"
#include "shelf/library/fs_event.hpp"

namespace shelf::library {

/// Source of FsEvents for one root directory.
///
/// Implementations deliver events on a single background thread owned by
/// the source, in the order they were observed.
class INotificationSource {
public:
    virtual ~INotificationSource() = default;

    /// Start delivering events under @p root to @p handler.
    /// @return NotificationSourceFailed if the root cannot be watched or the
    ///         source is already subscribed.
    virtual foundation::ShelfResult<void> subscribe(const std::filesystem::path& root,
                                                    FsEventHandler handler) = 0;

    /// Stop delivery and join the delivery thread. After return the handler
    /// is never invoked again. Must not be called from the handler.
    virtual void unsubscribe() = 0;

    [[nodiscard]] virtual bool isSubscribed() const = 0;

    /// Short backend name for logs ("polling", "inotify").
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

enum class SourceBackend {
    Polling,
    Inotify,
};

[[nodiscard]] std::string_view sourceBackendName(SourceBackend backend) noexcept;

/// Parse "polling" or "inotify". Returns nullopt for anything else.
[[nodiscard]] std::optional<SourceBackend> parseSourceBackend(std::string_view name);

struct SourceOptions {
    SourceBackend backend = SourceBackend::Polling;

    /// Rescan period for the polling backend.
    std::chrono::milliseconds pollInterval{5000};
};

/// Construct the backend selected by @p options.
[[nodiscard]] std::unique_ptr<INotificationSource> makeNotificationSource(
    const SourceOptions& options);

} // namespace shelf::library
