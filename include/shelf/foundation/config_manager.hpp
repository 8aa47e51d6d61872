#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with dotted-key typed access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "shelf/foundation/shelf_result.hpp"

namespace shelf::foundation {

/// YAML configuration flattened into dotted keys ("library.root").
///
/// Flattening avoids yaml-cpp's reference semantics leaking out of the
/// manager: every stored node is a deep clone.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    ShelfResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    ShelfResult<void> loadFromString(std::string_view yaml);

    /// Typed lookup by dotted key.
    /// @return The value, ConfigKeyNotFound, or ConfigTypeMismatch.
    template <typename T>
    ShelfResult<T> get(std::string_view key) const;

    /// Typed lookup that falls back to @p fallback when the key is absent.
    /// A present key of the wrong type is still a ConfigTypeMismatch.
    template <typename T>
    ShelfResult<T> getOr(std::string_view key, T fallback) const;

    /// Set or replace a value.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
ShelfResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return ShelfResult<T>::err(
            ShelfError(ErrorCode::ConfigKeyNotFound,
                       std::string("config key not found: ") + std::string(key)));
    }
    try {
        return ShelfResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return ShelfResult<T>::err(
            ShelfError(ErrorCode::ConfigTypeMismatch,
                       std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
ShelfResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return ShelfResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace shelf::foundation
