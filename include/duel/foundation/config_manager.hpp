#pragma once

/// @file config_manager.hpp
/// @brief YAML-backed configuration with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "duel/foundation/duel_result.hpp"

namespace duel::foundation {

/// YAML configuration flattened into dotted keys.
///
/// A document such as
/// @code
///   duel:
///     player:
///       base_hp: 20
/// @endcode
/// is exposed as the key "duel.player.base_hp". Leaves are cloned out of
/// the parsed tree so no yaml-cpp node outlives its document.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any previous content.
    /// @return Success or ConfigLoadFailed.
    DuelResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    /// @return Success or ConfigLoadFailed.
    DuelResult<void> loadFromString(std::string_view yaml);

    /// Typed lookup by dotted key.
    /// @return The value, ConfigKeyNotFound or ConfigTypeMismatch.
    template <typename T>
    DuelResult<T> get(std::string_view key) const;

    /// Set (or override) a leaf value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Number of leaf keys currently held.
    [[nodiscard]] std::size_t size() const;

private:
    using Entries = std::unordered_map<std::string, YAML::Node>;

    /// Throws YAML::Exception on keys that are not scalars.
    static void flatten(const std::string& prefix, const YAML::Node& node, Entries& out);

    mutable std::mutex mutex_;
    Entries entries_;
};

// --- Template implementations ---

template <typename T>
DuelResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return DuelResult<T>::err(
            DuelError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key),
                      std::string(key)));
    }
    try {
        return DuelResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return DuelResult<T>::err(
            DuelError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key),
                      std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace duel::foundation
