#pragma once

/// @file fs_event.hpp
/// @brief Raw filesystem notification delivered by a notification source.

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string_view>

namespace shelf::library {

enum class FsEventKind : uint8_t {
    Created,
    Deleted,
    Moved,
    /// The source lost notifications; consumers must rescan.
    Overflow,
};

[[nodiscard]] constexpr std::string_view fsEventKindName(FsEventKind kind) noexcept {
    switch (kind) {
        case FsEventKind::Created:  return "created";
        case FsEventKind::Deleted:  return "deleted";
        case FsEventKind::Moved:    return "moved";
        case FsEventKind::Overflow: return "overflow";
    }
    return "unknown";
}

struct FsEvent {
    FsEventKind kind = FsEventKind::Created;
    bool isDirectory = false;
    std::filesystem::path sourcePath;
    std::filesystem::path destPath;  ///< Set for Moved only.

    bool operator==(const FsEvent&) const = default;
};

/// Sink for notifications; invoked on the source's delivery thread.
using FsEventHandler = std::function<void(const FsEvent&)>;

} // namespace shelf::library
