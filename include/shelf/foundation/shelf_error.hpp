#pragma once

/// @file shelf_error.hpp
/// @brief Error type carried by ShelfResult<T>.

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "shelf/foundation/error_code.hpp"

namespace shelf::foundation {

/// Error code plus a human-readable message and, where one is involved,
/// the filesystem path the failure relates to.
class ShelfError {
public:
    ShelfError() = default;

    explicit ShelfError(ErrorCode code)
        : code_(code) {}

    ShelfError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ShelfError(ErrorCode code, std::string message, std::filesystem::path path)
        : code_(code), message_(std::move(message)), path_(std::move(path)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

    /// "<Code>: <message> (<path>)" for log output.
    [[nodiscard]] std::string describe() const {
        std::string out(errorCodeName(code_));
        if (!message_.empty()) {
            out += ": ";
            out += message_;
        }
        if (!path_.empty()) {
            out += " (";
            out += path_.string();
            out += ')';
        }
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::filesystem::path path_;
};

} // namespace shelf::foundation
