/// @file calculator_config.cpp
/// @brief YAML configuration loading for the calculators

#include "drift/calculator_config.h"

#include <string>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace driftwatch::drift {

namespace {

/// Value at `key`, `default_value` when absent or null
template <typename T>
absl::StatusOr<T> Read(const Config& config, std::string_view key, T default_value) {
    auto node = config.GetSubNode(key);
    if (!node.has_value()) {
        return default_value;
    }
    try {
        return node->as<T>();
    } catch (const YAML::Exception& e) {
        return ConfigurationError(absl::StrCat("Invalid value for '", std::string(key), "': ", e.what()));
    }
}

absl::StatusOr<size_t> ReadNonNegative(const Config& config, std::string_view key,
                                       int64_t default_value) {
    DRIFTWATCH_ASSIGN_OR_RETURN(int64_t value, Read<int64_t>(config, key, default_value));
    if (value < 0) {
        return ConfigurationError(absl::StrCat("'", std::string(key), "' must not be negative, got ", value));
    }
    return static_cast<size_t>(value);
}

}  // namespace

absl::StatusOr<chunking::ChunkerSpec> ChunkerSpecFromConfig(const Config& config) {
    chunking::ChunkerSpec spec;

    DRIFTWATCH_ASSIGN_OR_RETURN(std::string strategy,
                                Read<std::string>(config, "chunking.strategy", "count"));
    DRIFTWATCH_ASSIGN_OR_RETURN(spec.strategy, chunking::ParseChunkingStrategy(strategy));

    DRIFTWATCH_ASSIGN_OR_RETURN(spec.count, Read<int64_t>(config, "chunking.count", spec.count));
    DRIFTWATCH_ASSIGN_OR_RETURN(spec.size, Read<int64_t>(config, "chunking.size", spec.size));
    DRIFTWATCH_ASSIGN_OR_RETURN(spec.keep_incomplete,
                                Read<bool>(config, "chunking.keep_incomplete", spec.keep_incomplete));
    DRIFTWATCH_ASSIGN_OR_RETURN(spec.period, Read<std::string>(config, "chunking.period", spec.period));
    DRIFTWATCH_ASSIGN_OR_RETURN(spec.minimum_chunk_size,
                                ReadNonNegative(config, "chunking.minimum_chunk_size", 0));

    if (spec.strategy == chunking::ChunkerSpec::Strategy::kSize &&
        !config.HasKey("chunking.size")) {
        return ConfigurationError("Size-based chunking requires 'chunking.size'");
    }
    if (spec.strategy == chunking::ChunkerSpec::Strategy::kPeriod) {
        DRIFTWATCH_RETURN_IF_ERROR(chunking::ParseCalendarPeriod(spec.period).status());
    }
    return spec;
}

absl::StatusOr<std::vector<ColumnSpec>> ColumnSpecsFromConfig(const Config& config) {
    auto node = config.GetSubNode("columns");
    if (!node.has_value() || !node->IsSequence()) {
        return ConfigurationError("'columns' must be a list of {name, type} entries");
    }

    std::vector<ColumnSpec> columns;
    for (const auto& item : *node) {
        if (!item.IsMap() || !item["name"] || !item["type"]) {
            return ConfigurationError("Every column entry needs a 'name' and a 'type'");
        }
        ColumnSpec column;
        try {
            column.name = item["name"].as<std::string>();
            DRIFTWATCH_ASSIGN_OR_RETURN(column.type,
                                        data::ParseFeatureType(item["type"].as<std::string>()));
        } catch (const YAML::Exception& e) {
            return ConfigurationError(absl::StrCat("Invalid column entry: ", e.what()));
        }
        columns.push_back(std::move(column));
    }
    return columns;
}

absl::StatusOr<UnivariateDriftConfig> CalculatorConfigFromYaml(const Config& config) {
    UnivariateDriftConfig out;

    DRIFTWATCH_ASSIGN_OR_RETURN(out.chunking, ChunkerSpecFromConfig(config));
    DRIFTWATCH_ASSIGN_OR_RETURN(out.columns, ColumnSpecsFromConfig(config));

    if (config.HasKey("methods.continuous")) {
        out.continuous_methods = config.GetStringList("methods.continuous");
    }
    if (config.HasKey("methods.categorical")) {
        out.categorical_methods = config.GetStringList("methods.categorical");
    }

    if (auto sizes = config.GetSubNode("methods.minimum_chunk_sizes")) {
        if (!sizes->IsMap()) {
            return ConfigurationError("'methods.minimum_chunk_sizes' must be a map");
        }
        for (const auto& kv : *sizes) {
            const std::string key = kv.first.as<std::string>();
            DRIFTWATCH_ASSIGN_OR_RETURN(
                out.minimum_chunk_size_overrides[key],
                ReadNonNegative(config, absl::StrCat("methods.minimum_chunk_sizes.", key), 0));
        }
    }

    if (auto threshold = config.GetSubNode("thresholds.default")) {
        DRIFTWATCH_ASSIGN_OR_RETURN(ThresholdSpec spec, ThresholdSpecFromYaml(*threshold));
        out.default_threshold = spec;
    }
    if (auto overrides = config.GetSubNode("thresholds.overrides")) {
        if (!overrides->IsMap()) {
            return ConfigurationError("'thresholds.overrides' must be a map of method keys");
        }
        for (const auto& kv : *overrides) {
            const std::string key = kv.first.as<std::string>();
            auto spec = ThresholdSpecFromYaml(kv.second);
            if (!spec.ok()) {
                return ConfigurationError(absl::StrCat("Threshold override '", key, "': ",
                                                       spec.status().message()));
            }
            out.threshold_overrides[key] = *std::move(spec);
        }
    }

    DRIFTWATCH_ASSIGN_OR_RETURN(out.num_workers, ReadNonNegative(config, "num_workers", 1));

    DRIFTWATCH_RETURN_IF_ERROR(UnivariateDriftCalculator(out).Validate());
    return out;
}

absl::StatusOr<UnivariateDriftConfig> LoadCalculatorConfig(const std::filesystem::path& path,
                                                           std::string_view env_prefix) {
    DRIFTWATCH_ASSIGN_OR_RETURN(Config config, Config::LoadFromFile(path));
    config.Merge(Config::LoadFromEnvironment(env_prefix));
    return CalculatorConfigFromYaml(config);
}

LogConfig LogConfigFromConfig(const Config& config) {
    LogConfig log_config;
    log_config.level = ParseLogLevel(config.GetString("logging.level", "info"));
    if (config.HasKey("logging.file")) {
        log_config.enable_file = true;
        log_config.file_path = config.GetString("logging.file", log_config.file_path);
    }
    return log_config;
}

}  // namespace driftwatch::drift
