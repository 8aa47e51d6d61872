#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the library indexer.

#include <cstdint>
#include <string_view>

namespace shelf::foundation {

/// Error codes grouped by subsystem in 256-value ranges (0x100), so the
/// failing subsystem can be read off the numeric value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Watcher (0x0100 - 0x01FF)
    InvalidRoot = 0x0100,
    NotificationSourceFailed = 0x0101,
    ClassificationAmbiguous = 0x0102,
    CollectionUpdateFailed = 0x0103,

    // Persistence (0x0200 - 0x02FF)
    PersistenceLoadFailed = 0x0200,
    PersistenceWriteFailed = 0x0201,

    // Config (0x0300 - 0x03FF)
    ConfigLoadFailed = 0x0300,
    ConfigKeyNotFound = 0x0301,
    ConfigTypeMismatch = 0x0302,

    // Logger (0x0400 - 0x04FF)
    LoggerError = 0x0400,
    LoggerFlushFailed = 0x0401,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (static_cast<uint32_t>(code) & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Watcher";
        case 0x0200: return "Persistence";
        case 0x0300: return "Config";
        case 0x0400: return "Logger";
        default: return "Unknown";
    }
}

/// Short symbolic name, used in log lines.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidRoot: return "InvalidRoot";
        case ErrorCode::NotificationSourceFailed: return "NotificationSourceFailed";
        case ErrorCode::ClassificationAmbiguous: return "ClassificationAmbiguous";
        case ErrorCode::CollectionUpdateFailed: return "CollectionUpdateFailed";
        case ErrorCode::PersistenceLoadFailed: return "PersistenceLoadFailed";
        case ErrorCode::PersistenceWriteFailed: return "PersistenceWriteFailed";
        case ErrorCode::ConfigLoadFailed: return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound: return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch: return "ConfigTypeMismatch";
        case ErrorCode::LoggerError: return "LoggerError";
        case ErrorCode::LoggerFlushFailed: return "LoggerFlushFailed";
    }
    return "Unknown";
}

} // namespace shelf::foundation
