/// @file continuous_methods.cpp
/// @brief Continuous distribution-comparison methods

#include "drift/methods/continuous_methods.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "common/error.h"
#include "common/logging.h"
#include "drift/methods/binning.h"
#include "drift/methods/statistics.h"

namespace driftwatch::drift {

namespace {

using DistanceFn = double (*)(const std::vector<double>&, const std::vector<double>&);

std::vector<double> Sorted(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    return values;
}

/// ECDF-based state: the sorted reference sample
class FittedEcdfMethod : public FittedMethod {
public:
    FittedEcdfMethod(std::string key, std::vector<double> sorted_reference, bool with_p_value)
        : key_(std::move(key)),
          reference_(std::move(sorted_reference)),
          with_p_value_(with_p_value) {}

    absl::StatusOr<MethodValue> Calculate(const Sample& sample) const override {
        DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<double> values, AsContinuous(sample, key_));
        const std::vector<double> sorted = Sorted(std::move(values));

        MethodValue result;
        if (with_p_value_) {
            result.value = stats::KolmogorovSmirnovStatistic(reference_, sorted);
            result.p_value = stats::KolmogorovSmirnovPValue(
                result.value, reference_.size(), sorted.size());
        } else {
            result.value = stats::WassersteinDistance(reference_, sorted);
        }
        return result;
    }

    nlohmann::json ToJson() const override {
        return nlohmann::json{
            {"method", key_},
            {"reference_size", reference_.size()},
            {"reference_min", reference_.front()},
            {"reference_max", reference_.back()},
        };
    }

private:
    std::string key_;
    std::vector<double> reference_;
    bool with_p_value_;
};

/// Histogram-based state: reference bins and frequencies
class FittedBinnedContinuousMethod : public FittedMethod {
public:
    FittedBinnedContinuousMethod(std::string key, ContinuousBinning binning, DistanceFn distance)
        : key_(std::move(key)), binning_(std::move(binning)), distance_(distance) {}

    absl::StatusOr<MethodValue> Calculate(const Sample& sample) const override {
        DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<double> values, AsContinuous(sample, key_));
        const std::vector<double> frequencies = binning_.Frequencies(values);
        return MethodValue{.value = distance_(binning_.ReferenceFrequencies(), frequencies)};
    }

    nlohmann::json ToJson() const override {
        nlohmann::json j = binning_.ToJson();
        j["method"] = key_;
        return j;
    }

private:
    std::string key_;
    ContinuousBinning binning_;
    DistanceFn distance_;
};

absl::StatusOr<std::shared_ptr<const FittedMethod>> FitBinned(const Method& method,
                                                              const Sample& reference,
                                                              DistanceFn distance) {
    DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<double> values, AsContinuous(reference, method.Key()));
    ContinuousBinning binning = ContinuousBinning::Fit(values);
    DRIFTWATCH_LOG_DEBUG("{}: fitted {} {} bins on {} reference values", method.Key(),
                         binning.BinCount(), binning.IsDiscrete() ? "discrete" : "histogram",
                         values.size());
    return std::make_shared<const FittedBinnedContinuousMethod>(method.Key(), std::move(binning),
                                                                distance);
}

}  // namespace

// =============================================================================
// KolmogorovSmirnovMethod
// =============================================================================

KolmogorovSmirnovMethod::KolmogorovSmirnovMethod()
    : Method(MethodInfo{
          .key = "kolmogorov_smirnov",
          .display_name = "Kolmogorov-Smirnov statistic",
          .feature_type = data::FeatureType::kContinuous,
          .limits = DomainLimits{.lower = 0.0, .upper = 1.0},
          .minimum_chunk_size = kStatisticalTestMinimumChunkSize,
          .computes_p_value = true,
      }) {}

absl::StatusOr<std::shared_ptr<const FittedMethod>> KolmogorovSmirnovMethod::Fit(
    const Sample& reference) const {
    DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<double> values, AsContinuous(reference, Key()));
    return std::make_shared<const FittedEcdfMethod>(Key(), Sorted(std::move(values)), true);
}

// =============================================================================
// ContinuousJensenShannonMethod
// =============================================================================

ContinuousJensenShannonMethod::ContinuousJensenShannonMethod()
    : Method(MethodInfo{
          .key = "jensen_shannon",
          .display_name = "Jensen-Shannon distance",
          .feature_type = data::FeatureType::kContinuous,
          .limits = DomainLimits{.lower = 0.0, .upper = 1.0},
          .minimum_chunk_size = kDistanceMinimumChunkSize,
      }) {}

absl::StatusOr<std::shared_ptr<const FittedMethod>> ContinuousJensenShannonMethod::Fit(
    const Sample& reference) const {
    return FitBinned(*this, reference, &stats::JensenShannonDistance);
}

// =============================================================================
// WassersteinMethod
// =============================================================================

WassersteinMethod::WassersteinMethod()
    : Method(MethodInfo{
          .key = "wasserstein",
          .display_name = "Wasserstein distance",
          .feature_type = data::FeatureType::kContinuous,
          .limits = DomainLimits{.lower = 0.0},
          .minimum_chunk_size = kDistanceMinimumChunkSize,
      }) {}

absl::StatusOr<std::shared_ptr<const FittedMethod>> WassersteinMethod::Fit(
    const Sample& reference) const {
    DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<double> values, AsContinuous(reference, Key()));
    return std::make_shared<const FittedEcdfMethod>(Key(), Sorted(std::move(values)), false);
}

// =============================================================================
// ContinuousHellingerMethod
// =============================================================================

ContinuousHellingerMethod::ContinuousHellingerMethod()
    : Method(MethodInfo{
          .key = "hellinger",
          .display_name = "Hellinger distance",
          .feature_type = data::FeatureType::kContinuous,
          .limits = DomainLimits{.lower = 0.0, .upper = 1.0},
          .minimum_chunk_size = kDistanceMinimumChunkSize,
      }) {}

absl::StatusOr<std::shared_ptr<const FittedMethod>> ContinuousHellingerMethod::Fit(
    const Sample& reference) const {
    return FitBinned(*this, reference, &stats::HellingerDistance);
}

}  // namespace driftwatch::drift
