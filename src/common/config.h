#pragma once

/// @file config.h
/// @brief driftwatch configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
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
    std::vector<std::string>,
    std::unordered_map<std::string, std::string>
>;

/// @brief YAML-backed configuration with dot-notation access
///
/// Keys such as "chunking.strategy" address nested maps. A key whose value is
/// an explicit YAML null is reported as present by HasKey() but yields no
/// value from the getters; calculators use that to disable threshold bounds.
class Config {
public:
    /// @brief Default constructor creates empty configuration
    Config() = default;

    /// @brief Load configuration from a YAML file
    /// @param path Path to the YAML configuration file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    /// @param yaml_content YAML content as a string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Build a configuration from an existing YAML node
    static Config FromNode(const YAML::Node& node);

    /// @brief Load configuration from environment variables with a prefix
    /// @param prefix Environment variable prefix (e.g., "DRIFTWATCH_")
    static Config LoadFromEnvironment(std::string_view prefix = "DRIFTWATCH_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    /// @brief Get a string value
    std::string GetString(std::string_view key, std::string_view default_value = "") const;

    /// @brief Get an integer value
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;

    /// @brief Get a double value
    double GetDouble(std::string_view key, double default_value = 0.0) const;

    /// @brief Get a double value, or nullopt when absent, null or not numeric
    std::optional<double> GetOptionalDouble(std::string_view key) const;

    /// @brief Get a boolean value
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Get a list of strings
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief Check if a key exists (explicit nulls count as present)
    bool HasKey(std::string_view key) const;

    /// @brief Get the node at a key (invalid/undefined node when absent)
    std::optional<YAML::Node> GetSubNode(std::string_view key) const;

    /// @brief Set a configuration value
    void Set(std::string_view key, ConfigValue value);

    /// @brief Get the underlying YAML node for advanced access
    const YAML::Node& GetNode() const { return root_; }

    /// @brief Export configuration to JSON
    nlohmann::json ToJson() const;

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key, bool allow_null) const;
};

}  // namespace driftwatch
