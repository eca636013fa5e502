#pragma once

#include "Platform.hpp"
#include "Types.hpp"

SW_DISABLE_WARNINGS_PUSH
#include <toml++/toml.h>
SW_DISABLE_WARNINGS_POP

#include <filesystem>
#include <limits>
#include <type_traits>

// ============================================================================
// Configuration Loader (TOML)
// Parse scene, coefficient and logging settings for the split-window tool
// ============================================================================

namespace splitwindow {

/// Configuration manager (reads TOML files)
class SW_API Config {
public:
    /// Load a TOML configuration file
    /// @param filePath Path to the .toml file
    /// @return Result containing parsed config or error
    static Result<Config, String> Load(const std::filesystem::path& filePath);

    /// Parse TOML text held in memory
    static Result<Config, String> Parse(StringView text);

    /// Create an empty configuration
    Config() = default;

    /// Check if a key exists in the configuration
    /// @param key Dot-separated key path (e.g., "scene.cwv")
    bool Has(StringView key) const;

    /// Get a value from the configuration (with optional default)
    /// @tparam T Expected value type (i32, u32, f64, String, bool)
    template<typename T>
    T Get(StringView key, const T& defaultValue = T{}) const;

    /// Get a value, failing if the key is missing or has the wrong type.
    /// Not available for String (Result requires distinct value and error types).
    template<typename T>
    Result<T, String> GetRequired(StringView key) const;

    /// Get a nested table as a Config object
    Result<Config, String> GetTable(StringView key) const;

    /// Get an array of values; elements of the wrong type are skipped
    template<typename T>
    Vector<T> GetArray(StringView key) const;

private:
    explicit Config(toml::table&& root);

    toml::table m_Root;

    /// Navigate to a nested node by dot-separated path
    const toml::node* Navigate(StringView key) const;

    template<typename T>
    static Optional<T> Convert(const toml::node& node);
};

// ============================================================================
// Template Implementation
// ============================================================================

template<typename T>
Optional<T> Config::Convert(const toml::node& node) {
    if constexpr (std::is_same_v<T, String>) {
        if (auto val = node.value<std::string>()) {
            return *val;
        }
    } else if constexpr (std::is_same_v<T, i32> || std::is_same_v<T, u32>) {
        // Integers that do not fit the target type are a mismatch, not a wrap
        if (auto val = node.value<int64_t>()) {
            if (*val >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
                *val <= static_cast<int64_t>(std::numeric_limits<T>::max())) {
                return static_cast<T>(*val);
            }
        }
    } else if constexpr (std::is_same_v<T, f64>) {
        if (auto val = node.value<double>()) {
            return *val;
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (auto val = node.value<bool>()) {
            return *val;
        }
    } else {
        static_assert(std::is_same_v<T, void>, "Unsupported config value type");
    }

    return std::nullopt;
}

template<typename T>
T Config::Get(StringView key, const T& defaultValue) const {
    const toml::node* node = Navigate(key);
    if (!node) {
        return defaultValue;
    }

    return Convert<T>(*node).value_or(defaultValue);
}

template<typename T>
Result<T, String> Config::GetRequired(StringView key) const {
    static_assert(!std::is_same_v<T, String>, "Use Has() + Get<String>() for string keys");

    const toml::node* node = Navigate(key);
    if (!node) {
        return typename Result<T, String>::Err("Missing required key: " + String(key));
    }

    if (auto val = Convert<T>(*node)) {
        return *val;
    }

    return typename Result<T, String>::Err("Type mismatch for key: " + String(key));
}

template<typename T>
Vector<T> Config::GetArray(StringView key) const {
    const toml::node* node = Navigate(key);
    Vector<T> result;

    if (!node || !node->is_array()) {
        return result;
    }

    const toml::array* arr = node->as_array();
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        if (auto val = Convert<T>(elem)) {
            result.push_back(*val);
        }
    }

    return result;
}

} // namespace splitwindow
