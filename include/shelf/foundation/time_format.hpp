#pragma once

/// @file time_format.hpp
/// @brief ISO 8601 UTC timestamp formatting and parsing.

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace shelf::foundation {

using Timestamp = std::chrono::system_clock::time_point;

/// Format as "YYYY-MM-DDTHH:MM:SS.ffffff" (UTC, microseconds, no zone
/// designator). This is the representation stored in the library file.
[[nodiscard]] std::string formatIsoTimestamp(Timestamp tp);

/// Format as "YYYY-MM-DDTHH:MM:SS.mmmZ" for log lines.
[[nodiscard]] std::string formatLogTimestamp(Timestamp tp);

/// Parse "YYYY-MM-DDTHH:MM:SS[.f{1,9}][Z]" as UTC.
/// Returns nullopt on any malformed input.
[[nodiscard]] std::optional<Timestamp> parseIsoTimestamp(std::string_view text);

/// Current time truncated to microseconds, so a formatted timestamp parses
/// back to the identical value.
[[nodiscard]] Timestamp nowTimestamp();

} // namespace shelf::foundation
