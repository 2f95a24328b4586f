#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access and watch support.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "cgc/foundation/client_result.hpp"

namespace cgc::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key access
/// (e.g., "network.ServerAddress"), setting values at runtime, and
/// registering callbacks for change notification.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    ClientResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    ClientResult<void> loadString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    ClientResult<T> get(std::string_view key) const;

    /// Typed value, or @p fallback when the key is absent.
    /// A present key of the wrong type is still an error.
    template <typename T>
    ClientResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key. Notifies any registered watchers for this key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    /// Check if a key exists in the current configuration.
    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Number of flattened leaf entries.
    [[nodiscard]] std::size_t size() const;

private:
    ClientResult<void> replaceWith(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
ClientResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return ClientResult<T>::err(
            ClientError(ErrorCode::ConfigKeyNotFound,
                        "config key not found: " + std::string(key)));
    }
    try {
        return ClientResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return ClientResult<T>::err(
            ClientError(ErrorCode::ConfigTypeMismatch,
                        "type mismatch for key: " + std::string(key)));
    }
}

template <typename T>
ClientResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return ClientResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace cgc::foundation
