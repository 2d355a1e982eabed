#include "config.h"

#include <cstdlib>
#include <functional>
#include <string>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

namespace driftwatch {

namespace {

/// @brief Convert a YAML node into JSON, keeping scalar types where possible
nlohmann::json NodeToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();
            int64_t int_value = 0;
            double double_value = 0.0;
            if (text == "true" || text == "false") {
                return text == "true";
            }
            if (absl::SimpleAtoi(text, &int_value)) {
                return int_value;
            }
            if (absl::SimpleAtod(text, &double_value)) {
                return double_value;
            }
            return text;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(NodeToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = NodeToJson(kv.second);
            }
            return object;
        }
    }
    return nullptr;
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::FromNode(const YAML::Node& node) {
    Config config;
    config.root_ = YAML::Clone(node);
    return config;
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = std::string(prefix) + suffix;
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    int64_t number = 0;

    // Chunking settings
    if (auto val = get_env("CHUNKING_STRATEGY")) {
        config.Set("chunking.strategy", *val);
    }
    if (auto val = get_env("CHUNKING_COUNT"); val && absl::SimpleAtoi(*val, &number)) {
        config.Set("chunking.count", number);
    }
    if (auto val = get_env("CHUNKING_SIZE"); val && absl::SimpleAtoi(*val, &number)) {
        config.Set("chunking.size", number);
    }
    if (auto val = get_env("CHUNKING_PERIOD")) {
        config.Set("chunking.period", *val);
    }

    // Method selection (comma separated)
    if (auto val = get_env("METHODS_CONTINUOUS")) {
        std::vector<std::string> methods = absl::StrSplit(*val, ',', absl::SkipEmpty());
        config.Set("methods.continuous", methods);
    }
    if (auto val = get_env("METHODS_CATEGORICAL")) {
        std::vector<std::string> methods = absl::StrSplit(*val, ',', absl::SkipEmpty());
        config.Set("methods.categorical", methods);
    }

    if (auto val = get_env("NUM_WORKERS"); val && absl::SimpleAtoi(*val, &number)) {
        config.Set("num_workers", number);
    }

    // Log level
    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                YAML::Node base_child = base[key];
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key, bool allow_null) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');
    const YAML::Node& root = root_;
    YAML::Node current = root;

    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        // reset() rebinds the handle instead of assigning through it
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        if (!child.IsDefined()) {
            return std::nullopt;
        }
        current.reset(child);
    }

    if (current.IsNull() && !allow_null) {
        return std::nullopt;
    }

    return current;
}

std::optional<YAML::Node> Config::GetSubNode(std::string_view key) const {
    return GetNestedNode(key, false);
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key, false);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key, false);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    return GetOptionalDouble(key).value_or(default_value);
}

std::optional<double> Config::GetOptionalDouble(std::string_view key) const {
    auto node = GetNestedNode(key, false);
    if (node && node->IsScalar()) {
        try {
            return node->as<double>();
        } catch (const YAML::Exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key, false);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key, false);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key, true).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node current = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        YAML::Node child = current[parts[i]];
        current.reset(child);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else if constexpr (std::is_same_v<T, std::unordered_map<std::string, std::string>>) {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& [k, v] : val) {
                map[k] = v;
            }
            current[parts.back()] = map;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

nlohmann::json Config::ToJson() const {
    return NodeToJson(root_);
}

}  // namespace driftwatch
