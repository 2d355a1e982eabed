#pragma once

/// @file calculator_config.h
/// @brief Building calculator configurations from YAML
///
/// Schema:
/// @code
///   logging:
///     level: info
///   chunking:
///     strategy: count        # count | size | period
///     count: 10
///     size: 1000
///     keep_incomplete: true
///     period: D              # H | D | W | M | Q | Y
///     minimum_chunk_size: 0
///   columns:
///     - {name: age, type: continuous}
///     - {name: country, type: categorical}
///   methods:
///     continuous: [kolmogorov_smirnov, jensen_shannon]
///     categorical: [chi2]
///     minimum_chunk_sizes: {kolmogorov_smirnov: 100}
///   thresholds:
///     default: {type: standard_deviation, std_lower_multiplier: 3, std_upper_multiplier: 3}
///     overrides:
///       jensen_shannon: {type: constant, lower: null, upper: 0.1}
///   num_workers: 1
/// @endcode

#include <filesystem>
#include <string_view>

#include <absl/status/statusor.h>

#include "chunking/chunker.h"
#include "common/config.h"
#include "common/logging.h"
#include "drift/univariate_calculator.h"

namespace driftwatch::drift {

/// @brief Read the `chunking` section
absl::StatusOr<chunking::ChunkerSpec> ChunkerSpecFromConfig(const Config& config);

/// @brief Read the `columns` section
absl::StatusOr<std::vector<ColumnSpec>> ColumnSpecsFromConfig(const Config& config);

/// @brief Build and validate a univariate drift configuration
absl::StatusOr<UnivariateDriftConfig> CalculatorConfigFromYaml(const Config& config);

/// @brief Load a YAML file, apply environment overrides and build the
///        calculator configuration
/// @param path YAML configuration file
/// @param env_prefix Prefix of the overriding environment variables
absl::StatusOr<UnivariateDriftConfig> LoadCalculatorConfig(
    const std::filesystem::path& path,
    std::string_view env_prefix = "DRIFTWATCH_");

/// @brief Read the `logging` section
LogConfig LogConfigFromConfig(const Config& config);

}  // namespace driftwatch::drift
