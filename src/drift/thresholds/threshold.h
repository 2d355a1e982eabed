#pragma once

/// @file threshold.h
/// @brief Alert threshold strategies fit on reference statistic values

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace driftwatch::drift {

/// @brief Theoretical value range of a statistic; either side may be open
struct DomainLimits {
    std::optional<double> lower;
    std::optional<double> upper;
};

/// @brief Fitted alert bounds
struct ThresholdBounds {
    std::optional<double> lower;  ///< Disabled when empty
    std::optional<double> upper;  ///< Disabled when empty

    /// Bounds were moved onto the statistic's domain after fitting
    bool lower_clipped = false;
    bool upper_clipped = false;
};

/// @brief Abstract base class for threshold strategies
class Threshold {
public:
    virtual ~Threshold() = default;

    /// @brief Derive bounds from reference statistic values
    /// @param values Per-chunk statistic values of the reference period
    virtual ThresholdBounds Fit(const std::vector<double>& values) const = 0;

    /// @brief Get the threshold name
    virtual std::string Name() const = 0;

    /// @brief Export parameters for diagnostics
    virtual nlohmann::json ToJson() const = 0;
};

/// @brief Fixed bounds, independent of the reference values
class ConstantThreshold : public Threshold {
public:
    ConstantThreshold(std::optional<double> lower, std::optional<double> upper)
        : lower_(lower), upper_(upper) {}

    ThresholdBounds Fit(const std::vector<double>& values) const override;
    std::string Name() const override { return "constant"; }
    nlohmann::json ToJson() const override;

private:
    std::optional<double> lower_;
    std::optional<double> upper_;
};

/// @brief Central tendency used as the StandardDeviationThreshold baseline
enum class Aggregation {
    kMean,
    kMedian
};

/// @brief Bounds at baseline -/+ multiplier * population standard deviation
///
/// Non-finite reference values are ignored. A disabled multiplier disables
/// its bound.
class StandardDeviationThreshold : public Threshold {
public:
    static constexpr double kDefaultMultiplier = 3.0;

    explicit StandardDeviationThreshold(
        std::optional<double> lower_multiplier = kDefaultMultiplier,
        std::optional<double> upper_multiplier = kDefaultMultiplier,
        Aggregation aggregation = Aggregation::kMean)
        : lower_multiplier_(lower_multiplier),
          upper_multiplier_(upper_multiplier),
          aggregation_(aggregation) {}

    ThresholdBounds Fit(const std::vector<double>& values) const override;
    std::string Name() const override { return "standard_deviation"; }
    nlohmann::json ToJson() const override;

private:
    std::optional<double> lower_multiplier_;
    std::optional<double> upper_multiplier_;
    Aggregation aggregation_;
};

/// @brief Move bounds lying outside the domain onto the nearest domain boundary
ThresholdBounds ClipToDomain(ThresholdBounds bounds, const DomainLimits& limits);

/// @brief Fit a threshold and clip the result to a domain
ThresholdBounds FitThreshold(const Threshold& threshold,
                             const std::vector<double>& values,
                             const DomainLimits& limits);

/// @brief Whether a value breaches the bounds; NaN never alerts
bool IsAlert(double value, const ThresholdBounds& bounds);

/// @brief Threshold configuration as read from YAML or built in code
struct ThresholdSpec {
    enum class Type {
        kConstant,
        kStandardDeviation
    };

    Type type = Type::kStandardDeviation;

    // Constant
    std::optional<double> lower;
    std::optional<double> upper;

    // Standard deviation
    std::optional<double> std_lower_multiplier = StandardDeviationThreshold::kDefaultMultiplier;
    std::optional<double> std_upper_multiplier = StandardDeviationThreshold::kDefaultMultiplier;
    Aggregation aggregation = Aggregation::kMean;

    static ThresholdSpec Constant(std::optional<double> lower, std::optional<double> upper);
    static ThresholdSpec StandardDeviation(std::optional<double> lower_multiplier = 3.0,
                                           std::optional<double> upper_multiplier = 3.0,
                                           Aggregation aggregation = Aggregation::kMean);
};

/// @brief Parse a threshold spec from a YAML map
///
/// Accepts `{type: constant, lower, upper}` and `{type: standard_deviation,
/// std_lower_multiplier, std_upper_multiplier, aggregation}`. Missing or null
/// bounds and multipliers are disabled.
absl::StatusOr<ThresholdSpec> ThresholdSpecFromYaml(const YAML::Node& node);

/// @brief Validate a spec and build the threshold
absl::StatusOr<std::unique_ptr<Threshold>> CreateThreshold(const ThresholdSpec& spec);

/// @brief Default threshold: StandardDeviation(3, 3) around the mean
ThresholdSpec DefaultThresholdSpec();

}  // namespace driftwatch::drift
