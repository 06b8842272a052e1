#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed access and change watchers.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "gpk/foundation/game_result.hpp"

namespace gpk::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML configuration flattened into dotted keys ("world.tick_rate").
///
/// Sequences and scalars are stored as leaves; maps are expanded.  Values
/// are read back through yaml-cpp conversions, so a mismatch surfaces as
/// ConfigTypeMismatch rather than an exception.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    GameResult<void> loadFromString(std::string_view yaml);

    /// Typed lookup by dotted key.
    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Typed lookup that falls back to @p fallback on any error.
    template <typename T>
    T getOr(std::string_view key, T fallback) const {
        return get<T>(key).valueOr(std::move(fallback));
    }

    /// Set a value by dotted key and notify watchers of that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when @p key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All keys that start with @p prefix followed by a dot.
    [[nodiscard]] std::vector<std::string> keysUnder(std::string_view prefix) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace gpk::foundation
