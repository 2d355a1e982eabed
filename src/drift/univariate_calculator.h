#pragma once

/// @file univariate_calculator.h
/// @brief Per-feature drift calculator: fit on reference data, evaluate chunks

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "chunking/chunker.h"
#include "data/observation_table.h"
#include "drift/drift_result.h"
#include "drift/methods/method.h"
#include "drift/thresholds/threshold.h"

namespace driftwatch::drift {

/// @brief A monitored column and its declared feature type
struct ColumnSpec {
    std::string name;
    data::FeatureType type = data::FeatureType::kContinuous;
};

/// @brief Configuration of UnivariateDriftCalculator
struct UnivariateDriftConfig {
    std::vector<ColumnSpec> columns;

    chunking::ChunkerSpec chunking;

    /// Method keys applied to continuous columns, in output order
    std::vector<std::string> continuous_methods = {"jensen_shannon"};

    /// Method keys applied to categorical columns, in output order
    std::vector<std::string> categorical_methods = {"jensen_shannon"};

    /// Threshold for methods without an override (method default when unset)
    std::optional<ThresholdSpec> default_threshold;

    /// Threshold per method key
    std::unordered_map<std::string, ThresholdSpec> threshold_overrides;

    /// Minimum viable chunk size per method key
    std::unordered_map<std::string, size_t> minimum_chunk_size_overrides;

    /// Parallel workers for Calculate (1 = sequential)
    size_t num_workers = 1;
};

/// @brief Fitted state of one (column, method) pair
struct FittedColumnMethod {
    ColumnSpec column;
    std::shared_ptr<const Method> method;
    std::shared_ptr<const FittedMethod> fitted;
    ThresholdSpec threshold_spec;
    ThresholdBounds bounds;
};

/// @brief Immutable result of UnivariateDriftCalculator::Fit
///
/// Holds the configuration it was fit with, fitted method state, threshold
/// bounds and the reference result rows. Shared read-only between threads.
class FittedDriftCalculator {
public:
    FittedDriftCalculator(UnivariateDriftConfig config,
                          std::vector<FittedColumnMethod> entries,
                          DriftResult reference_result)
        : config_(std::move(config)),
          entries_(std::move(entries)),
          reference_result_(std::move(reference_result)) {}

    const UnivariateDriftConfig& Config() const { return config_; }

    /// @brief Fitted pairs ordered by column, then method
    const std::vector<FittedColumnMethod>& Entries() const { return entries_; }

    /// @brief Statistic rows of the reference chunks
    const DriftResult& ReferenceResult() const { return reference_result_; }

    /// @brief Bounds of a (column, method) pair, nullptr when not fitted
    const ThresholdBounds* Bounds(std::string_view column_name, std::string_view method_key) const;

    /// @brief Export thresholds and fitted method state as JSON text
    absl::StatusOr<std::string> SerializeState() const;

    nlohmann::json ToJson() const;

private:
    UnivariateDriftConfig config_;
    std::vector<FittedColumnMethod> entries_;
    DriftResult reference_result_;
};

/// @brief Univariate drift calculator
///
/// The calculator itself is only configuration. Fit() returns a new fitted
/// value on every call; Calculate() reads it without modifying it.
///
/// Example usage:
/// @code
///   UnivariateDriftConfig config;
///   config.columns = {{"age", data::FeatureType::kContinuous}};
///   config.continuous_methods = {"kolmogorov_smirnov"};
///   UnivariateDriftCalculator calculator(config);
///
///   auto fitted = calculator.Fit(reference);
///   auto result = calculator.Calculate(*fitted, analysis);
///   size_t alerts = result->AlertCount("age");
/// @endcode
class UnivariateDriftCalculator {
public:
    explicit UnivariateDriftCalculator(UnivariateDriftConfig config);

    /// @brief Check columns, method keys and thresholds
    absl::Status Validate() const;

    /// @brief Fit methods and thresholds on reference data
    /// @param reference Non-empty reference table containing every configured column
    absl::StatusOr<std::shared_ptr<const FittedDriftCalculator>> Fit(
        const data::ObservationTable& reference) const;

    /// @brief Evaluate every (chunk, column, method) triple of a table
    /// @param fitted Result of Fit(); nullptr is a FailedPrecondition
    /// @param table Non-empty table containing every fitted column
    absl::StatusOr<DriftResult> Calculate(
        const std::shared_ptr<const FittedDriftCalculator>& fitted,
        const data::ObservationTable& table) const;

    const UnivariateDriftConfig& Config() const { return config_; }

private:
    UnivariateDriftConfig config_;
};

/// @brief Check that a table holds every column with the declared type
absl::Status CheckColumns(const data::ObservationTable& table,
                          const std::vector<ColumnSpec>& columns);

}  // namespace driftwatch::drift
