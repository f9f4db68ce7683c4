#pragma once

/// @file config.h
/// @brief driftwatch configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace driftwatch {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// @brief Configuration manager for loading and accessing configuration
///
/// Keys use dot notation ("monitor.alpha"). Values are stored in a YAML
/// tree so files, environment overrides and programmatic values merge
/// uniformly.
class Config {
public:
    /// @brief Default constructor creates empty configuration
    Config() = default;

    /// @brief Load configuration from a YAML file
    /// @param path Path to the YAML configuration file
    /// @return Loaded configuration, NotFound or InvalidArgument on failure
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    /// @param yaml_content YAML content as a string
    /// @return Loaded configuration or InvalidArgument on parse failure
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load configuration from environment variables with a prefix
    ///
    /// Recognized variables: <prefix>ALPHA, <prefix>NUM_WORKERS,
    /// <prefix>CATEGORICAL_TEST, <prefix>LOG_LEVEL.
    /// @param prefix Environment variable prefix (e.g., "DRIFTWATCH_")
    /// @return Configuration loaded from environment, or an error for a
    ///         numeric variable that does not parse
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "DRIFTWATCH_");

    /// @brief Merge another configuration into this one (other takes precedence)
    /// @param other Configuration to merge
    void Merge(const Config& other);

    /// @brief Get a string value
    std::string GetString(std::string_view key, std::string_view default_value = "") const;

    /// @brief Get an integer value
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;

    /// @brief Get a double value
    double GetDouble(std::string_view key, double default_value = 0.0) const;

    /// @brief Get a boolean value
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Get a list of strings
    /// @return List of strings or empty vector if not found
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief Check if a key exists
    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value
    void Set(std::string_view key, ConfigValue value);

    /// @brief Export configuration to JSON
    nlohmann::json ToJson() const;

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

/// @brief Build the effective configuration: file (optional) overlaid by
///        the environment
/// @param config_path Path to configuration file (optional)
/// @param env_prefix Environment variable prefix
absl::StatusOr<Config> LoadConfig(
    const std::optional<std::filesystem::path>& config_path = std::nullopt,
    std::string_view env_prefix = "DRIFTWATCH_"
);

}  // namespace driftwatch
