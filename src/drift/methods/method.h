#pragma once

/// @file method.h
/// @brief Interface of distribution-comparison methods

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "data/observation_table.h"
#include "drift/thresholds/threshold.h"

namespace driftwatch::drift {

/// @brief Non-missing values of one column for a reference or chunk slice
using Sample = std::variant<std::vector<double>, std::vector<std::string>>;

/// @brief Output of a method on one sample
struct MethodValue {
    double value = 0.0;
    std::optional<double> p_value;  ///< Set by statistical tests only
};

/// @brief Static description of a method
struct MethodInfo {
    std::string key;            ///< Configuration key, e.g. "jensen_shannon"
    std::string display_name;
    data::FeatureType feature_type = data::FeatureType::kContinuous;
    DomainLimits limits;
    size_t minimum_chunk_size = 0;
    bool computes_p_value = false;
};

/// @brief Reference state produced by Method::Fit
///
/// Immutable once built; calculate calls may run concurrently.
class FittedMethod {
public:
    virtual ~FittedMethod() = default;

    /// @brief Compare a sample against the fitted reference
    /// @param sample Non-missing values of the chunk
    /// @return Statistic value; InvalidArgument for an empty sample
    virtual absl::StatusOr<MethodValue> Calculate(const Sample& sample) const = 0;

    /// @brief Export the fitted state for diagnostics
    virtual nlohmann::json ToJson() const = 0;
};

/// @brief Abstract base class for distribution-comparison methods
class Method {
public:
    explicit Method(MethodInfo info) : info_(std::move(info)) {}
    virtual ~Method() = default;

    /// @brief Learn the reference state
    /// @param reference Non-missing values of the full reference column
    virtual absl::StatusOr<std::shared_ptr<const FittedMethod>> Fit(
        const Sample& reference) const = 0;

    const MethodInfo& Info() const { return info_; }
    const std::string& Key() const { return info_.key; }
    const std::string& DisplayName() const { return info_.display_name; }
    data::FeatureType Type() const { return info_.feature_type; }
    const DomainLimits& Limits() const { return info_.limits; }
    size_t MinimumChunkSize() const { return info_.minimum_chunk_size; }

    /// @brief Override the minimum viable chunk size
    void SetMinimumChunkSize(size_t size) { info_.minimum_chunk_size = size; }

    /// @brief Threshold used when no override is configured
    virtual ThresholdSpec DefaultThreshold() const { return DefaultThresholdSpec(); }

private:
    MethodInfo info_;
};

/// @brief Minimum viable chunk size of the statistical tests
inline constexpr size_t kStatisticalTestMinimumChunkSize = 500;

/// @brief Minimum viable chunk size of the distance methods
inline constexpr size_t kDistanceMinimumChunkSize = 300;

/// @brief Extract the finite continuous values, failing for categorical
///        samples and for samples without finite values
///
/// NaN and infinities are dropped as missing.
absl::StatusOr<std::vector<double>> AsContinuous(const Sample& sample, std::string_view method);

/// @brief Extract non-empty categorical values, failing for continuous samples
absl::StatusOr<const std::vector<std::string>*> AsCategorical(const Sample& sample,
                                                             std::string_view method);

}  // namespace driftwatch::drift
