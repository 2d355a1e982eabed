#pragma once

/// @file missing_values_calculator.h
/// @brief Data-quality calculator tracking the missing-value rate per chunk

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "chunking/chunker.h"
#include "common/config.h"
#include "data/observation_table.h"
#include "drift/drift_result.h"
#include "drift/thresholds/threshold.h"

namespace driftwatch::data_quality {

/// @brief Configuration of MissingValuesCalculator
struct MissingValuesConfig {
    std::vector<std::string> column_names;

    /// Report the missing-value rate (true) or the raw count (false)
    bool normalize = true;

    chunking::ChunkerSpec chunking;

    drift::ThresholdSpec threshold = drift::DefaultThresholdSpec();

    /// Method key used in result rows
    std::string_view MetricKey() const {
        return normalize ? "missing_values_rate" : "missing_values_count";
    }

    /// Rates lie in [0, 1], counts in [0, inf)
    drift::DomainLimits Limits() const {
        return normalize ? drift::DomainLimits{.lower = 0.0, .upper = 1.0}
                         : drift::DomainLimits{.lower = 0.0};
    }
};

/// @brief Immutable result of MissingValuesCalculator::Fit
class FittedMissingValuesCalculator {
public:
    FittedMissingValuesCalculator(MissingValuesConfig config,
                                  std::vector<drift::ThresholdBounds> bounds,
                                  drift::DriftResult reference_result)
        : config_(std::move(config)),
          bounds_(std::move(bounds)),
          reference_result_(std::move(reference_result)) {}

    const MissingValuesConfig& Config() const { return config_; }

    /// @brief Bounds per configured column, in column order
    const std::vector<drift::ThresholdBounds>& Bounds() const { return bounds_; }

    const drift::DriftResult& ReferenceResult() const { return reference_result_; }

    nlohmann::json ToJson() const;

private:
    MissingValuesConfig config_;
    std::vector<drift::ThresholdBounds> bounds_;
    drift::DriftResult reference_result_;
};

/// @brief Missing-value rate (or count) per chunk and column
///
/// Thresholds are fit on the reference chunk values and clipped to the
/// metric's domain. Result rows use the same layout as the drift calculator,
/// with the metric key in place of the method key.
class MissingValuesCalculator {
public:
    explicit MissingValuesCalculator(MissingValuesConfig config);

    absl::Status Validate() const;

    /// @brief Fit thresholds on reference data
    absl::StatusOr<std::shared_ptr<const FittedMissingValuesCalculator>> Fit(
        const data::ObservationTable& reference) const;

    /// @brief Evaluate every (chunk, column) pair of a table
    /// @param fitted Result of Fit(); nullptr is a FailedPrecondition
    absl::StatusOr<drift::DriftResult> Calculate(
        const std::shared_ptr<const FittedMissingValuesCalculator>& fitted,
        const data::ObservationTable& table) const;

    const MissingValuesConfig& Config() const { return config_; }

private:
    MissingValuesConfig config_;
};

/// @brief Read the `chunking` and `missing_values` sections
///
/// @code
///   missing_values:
///     columns: [age, country]
///     normalize: true
///     threshold: {type: standard_deviation}
/// @endcode
absl::StatusOr<MissingValuesConfig> MissingValuesConfigFromYaml(const Config& config);

}  // namespace driftwatch::data_quality
