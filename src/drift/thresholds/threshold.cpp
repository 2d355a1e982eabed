/// @file threshold.cpp
/// @brief Threshold strategy implementations

#include "drift/thresholds/threshold.h"

#include <algorithm>
#include <cmath>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftwatch::drift {

namespace {

nlohmann::json OptionalToJson(const std::optional<double>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

double Mean(const std::vector<double>& values) {
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

double Median(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) {
        return (values[mid - 1] + values[mid]) / 2.0;
    }
    return values[mid];
}

double PopulationStdDev(const std::vector<double>& values) {
    const double mean = Mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

/// Missing key -> `if_missing`; explicit null -> disabled
absl::StatusOr<std::optional<double>> ReadOptionalDouble(const YAML::Node& node,
                                                         const std::string& key,
                                                         std::optional<double> if_missing) {
    const YAML::Node child = node[key];
    if (!child.IsDefined()) {
        return if_missing;
    }
    if (child.IsNull()) {
        return std::optional<double>();
    }
    try {
        return std::optional<double>(child.as<double>());
    } catch (const YAML::Exception& e) {
        return ConfigurationError(absl::StrCat("Threshold field '", key,
                                               "' is not a number: ", e.what()));
    }
}

}  // namespace

// =============================================================================
// ConstantThreshold
// =============================================================================

ThresholdBounds ConstantThreshold::Fit(const std::vector<double>& /*values*/) const {
    return ThresholdBounds{.lower = lower_, .upper = upper_};
}

nlohmann::json ConstantThreshold::ToJson() const {
    return nlohmann::json{
        {"type", Name()},
        {"lower", OptionalToJson(lower_)},
        {"upper", OptionalToJson(upper_)},
    };
}

// =============================================================================
// StandardDeviationThreshold
// =============================================================================

ThresholdBounds StandardDeviationThreshold::Fit(const std::vector<double>& values) const {
    std::vector<double> finite;
    finite.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) {
            finite.push_back(v);
        }
    }

    ThresholdBounds bounds;
    if (finite.empty()) {
        DRIFTWATCH_LOG_WARN("Standard deviation threshold has no finite reference "
                            "values, both bounds disabled");
        return bounds;
    }

    const double baseline = aggregation_ == Aggregation::kMedian ? Median(finite) : Mean(finite);
    const double spread = PopulationStdDev(finite);
    if (spread == 0.0) {
        DRIFTWATCH_LOG_WARN("Reference values have zero variance, threshold bounds "
                            "collapse onto the baseline {}", baseline);
    }

    if (lower_multiplier_.has_value()) {
        bounds.lower = baseline - *lower_multiplier_ * spread;
    }
    if (upper_multiplier_.has_value()) {
        bounds.upper = baseline + *upper_multiplier_ * spread;
    }
    return bounds;
}

nlohmann::json StandardDeviationThreshold::ToJson() const {
    return nlohmann::json{
        {"type", Name()},
        {"std_lower_multiplier", OptionalToJson(lower_multiplier_)},
        {"std_upper_multiplier", OptionalToJson(upper_multiplier_)},
        {"aggregation", aggregation_ == Aggregation::kMedian ? "median" : "mean"},
    };
}

// =============================================================================
// Bounds helpers
// =============================================================================

ThresholdBounds ClipToDomain(ThresholdBounds bounds, const DomainLimits& limits) {
    auto clip = [&limits](std::optional<double>& bound, bool& clipped, const char* side) {
        if (!bound.has_value()) {
            return;
        }
        const double original = *bound;
        if (limits.lower.has_value() && *bound < *limits.lower) {
            bound = limits.lower;
        } else if (limits.upper.has_value() && *bound > *limits.upper) {
            bound = limits.upper;
        }
        if (*bound != original) {
            clipped = true;
            DRIFTWATCH_LOG_DEBUG("Clipped {} threshold {} to domain boundary {}",
                                 side, original, *bound);
        }
    };

    clip(bounds.lower, bounds.lower_clipped, "lower");
    clip(bounds.upper, bounds.upper_clipped, "upper");
    return bounds;
}

ThresholdBounds FitThreshold(const Threshold& threshold,
                             const std::vector<double>& values,
                             const DomainLimits& limits) {
    return ClipToDomain(threshold.Fit(values), limits);
}

bool IsAlert(double value, const ThresholdBounds& bounds) {
    if (std::isnan(value)) {
        return false;
    }
    return (bounds.lower.has_value() && value < *bounds.lower) ||
           (bounds.upper.has_value() && value > *bounds.upper);
}

// =============================================================================
// ThresholdSpec
// =============================================================================

ThresholdSpec ThresholdSpec::Constant(std::optional<double> lower, std::optional<double> upper) {
    ThresholdSpec spec;
    spec.type = Type::kConstant;
    spec.lower = lower;
    spec.upper = upper;
    return spec;
}

ThresholdSpec ThresholdSpec::StandardDeviation(std::optional<double> lower_multiplier,
                                               std::optional<double> upper_multiplier,
                                               Aggregation aggregation) {
    ThresholdSpec spec;
    spec.type = Type::kStandardDeviation;
    spec.std_lower_multiplier = lower_multiplier;
    spec.std_upper_multiplier = upper_multiplier;
    spec.aggregation = aggregation;
    return spec;
}

ThresholdSpec DefaultThresholdSpec() {
    return ThresholdSpec::StandardDeviation();
}

absl::StatusOr<ThresholdSpec> ThresholdSpecFromYaml(const YAML::Node& node) {
    if (!node.IsDefined() || !node.IsMap()) {
        return ConfigurationError("Threshold must be a map with a 'type' field");
    }

    const YAML::Node type_node = node["type"];
    if (!type_node.IsDefined() || !type_node.IsScalar()) {
        return ConfigurationError("Threshold is missing its 'type' field");
    }
    const std::string type = absl::AsciiStrToLower(type_node.Scalar());

    ThresholdSpec spec;
    if (type == "constant") {
        spec.type = ThresholdSpec::Type::kConstant;
        DRIFTWATCH_ASSIGN_OR_RETURN(spec.lower, ReadOptionalDouble(node, "lower", std::nullopt));
        DRIFTWATCH_ASSIGN_OR_RETURN(spec.upper, ReadOptionalDouble(node, "upper", std::nullopt));
        return spec;
    }

    if (type == "standard_deviation" || type == "std") {
        spec.type = ThresholdSpec::Type::kStandardDeviation;
        DRIFTWATCH_ASSIGN_OR_RETURN(
            spec.std_lower_multiplier,
            ReadOptionalDouble(node, "std_lower_multiplier",
                               StandardDeviationThreshold::kDefaultMultiplier));
        DRIFTWATCH_ASSIGN_OR_RETURN(
            spec.std_upper_multiplier,
            ReadOptionalDouble(node, "std_upper_multiplier",
                               StandardDeviationThreshold::kDefaultMultiplier));

        const YAML::Node aggregation = node["aggregation"];
        if (aggregation.IsDefined() && !aggregation.IsNull()) {
            const std::string name = absl::AsciiStrToLower(aggregation.Scalar());
            if (name == "mean") {
                spec.aggregation = Aggregation::kMean;
            } else if (name == "median") {
                spec.aggregation = Aggregation::kMedian;
            } else {
                return ConfigurationError(absl::StrCat(
                    "Unknown threshold aggregation '", name, "', expected mean or median"));
            }
        }
        return spec;
    }

    return ConfigurationError(absl::StrCat(
        "Unknown threshold type '", type, "', expected constant or standard_deviation"));
}

absl::StatusOr<std::unique_ptr<Threshold>> CreateThreshold(const ThresholdSpec& spec) {
    switch (spec.type) {
        case ThresholdSpec::Type::kConstant:
            if (spec.lower.has_value() && spec.upper.has_value() && *spec.lower > *spec.upper) {
                return ConfigurationError(absl::StrCat(
                    "Constant threshold lower bound ", *spec.lower,
                    " exceeds upper bound ", *spec.upper));
            }
            return std::make_unique<ConstantThreshold>(spec.lower, spec.upper);

        case ThresholdSpec::Type::kStandardDeviation:
            if ((spec.std_lower_multiplier.has_value() && *spec.std_lower_multiplier < 0.0) ||
                (spec.std_upper_multiplier.has_value() && *spec.std_upper_multiplier < 0.0)) {
                return ConfigurationError("Standard deviation multipliers must be non-negative");
            }
            return std::make_unique<StandardDeviationThreshold>(
                spec.std_lower_multiplier, spec.std_upper_multiplier, spec.aggregation);
    }
    return ConfigurationError("Unsupported threshold type");
}

}  // namespace driftwatch::drift
