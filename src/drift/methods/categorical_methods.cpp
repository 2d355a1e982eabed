/// @file categorical_methods.cpp
/// @brief Categorical distribution-comparison methods

#include "drift/methods/categorical_methods.h"

#include <algorithm>
#include <cmath>
#include <map>
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

/// Reference category counts, for methods working on the category union
class FittedCategoryCounts : public FittedMethod {
public:
    enum class Statistic {
        kChiSquared,
        kLInfinity
    };

    FittedCategoryCounts(std::string key, const std::vector<std::string>& reference,
                         Statistic statistic)
        : key_(std::move(key)), total_(reference.size()), statistic_(statistic) {
        for (const auto& [category, count] : CountCategories(reference)) {
            counts_.emplace(category, count);
        }
    }

    absl::StatusOr<MethodValue> Calculate(const Sample& sample) const override {
        DRIFTWATCH_ASSIGN_OR_RETURN(const std::vector<std::string>* values,
                                    AsCategorical(sample, key_));

        // Union of categories, each with (reference, sample) counts
        std::map<std::string, std::pair<size_t, size_t>> table;
        for (const auto& [category, count] : counts_) {
            table[category].first = count;
        }
        for (const auto& [category, count] : CountCategories(*values)) {
            table[category].second = count;
        }

        if (statistic_ == Statistic::kLInfinity) {
            return MethodValue{.value = LInfinity(table, values->size())};
        }
        return ChiSquared(table, values->size());
    }

    nlohmann::json ToJson() const override {
        nlohmann::json counts = nlohmann::json::object();
        for (const auto& [category, count] : counts_) {
            counts[category] = count;
        }
        return nlohmann::json{
            {"method", key_},
            {"reference_size", total_},
            {"reference_counts", counts},
        };
    }

private:
    double LInfinity(const std::map<std::string, std::pair<size_t, size_t>>& table,
                     size_t sample_size) const {
        const double n = static_cast<double>(total_);
        const double m = static_cast<double>(sample_size);
        double distance = 0.0;
        for (const auto& [category, counts] : table) {
            const double diff = static_cast<double>(counts.first) / n -
                                static_cast<double>(counts.second) / m;
            distance = std::max(distance, std::abs(diff));
        }
        return distance;
    }

    MethodValue ChiSquared(const std::map<std::string, std::pair<size_t, size_t>>& table,
                           size_t sample_size) const {
        const double n = static_cast<double>(total_);
        const double m = static_cast<double>(sample_size);
        const double grand_total = n + m;

        double statistic = 0.0;
        for (const auto& [category, counts] : table) {
            const double observed_ref = static_cast<double>(counts.first);
            const double observed_sample = static_cast<double>(counts.second);
            const double column_total = observed_ref + observed_sample;

            const double expected_ref = column_total * n / grand_total;
            const double expected_sample = column_total * m / grand_total;
            statistic += (observed_ref - expected_ref) * (observed_ref - expected_ref) / expected_ref;
            statistic += (observed_sample - expected_sample) *
                         (observed_sample - expected_sample) / expected_sample;
        }

        const double dof = static_cast<double>(table.size()) - 1.0;
        return MethodValue{
            .value = statistic,
            .p_value = stats::ChiSquaredSurvival(statistic, dof),
        };
    }

    std::string key_;
    std::map<std::string, size_t> counts_;
    size_t total_;
    Statistic statistic_;
};

/// Reference categories as bins, novel categories in the overflow bin
class FittedBinnedCategoricalMethod : public FittedMethod {
public:
    FittedBinnedCategoricalMethod(std::string key, CategoricalBinning binning, DistanceFn distance)
        : key_(std::move(key)), binning_(std::move(binning)), distance_(distance) {}

    absl::StatusOr<MethodValue> Calculate(const Sample& sample) const override {
        DRIFTWATCH_ASSIGN_OR_RETURN(const std::vector<std::string>* values,
                                    AsCategorical(sample, key_));
        const std::vector<double> frequencies = binning_.Frequencies(*values);
        return MethodValue{.value = distance_(binning_.ReferenceFrequencies(), frequencies)};
    }

    nlohmann::json ToJson() const override {
        nlohmann::json j = binning_.ToJson();
        j["method"] = key_;
        return j;
    }

private:
    std::string key_;
    CategoricalBinning binning_;
    DistanceFn distance_;
};

absl::StatusOr<std::shared_ptr<const FittedMethod>> FitBinned(const Method& method,
                                                              const Sample& reference,
                                                              DistanceFn distance) {
    DRIFTWATCH_ASSIGN_OR_RETURN(const std::vector<std::string>* values,
                                AsCategorical(reference, method.Key()));
    CategoricalBinning binning = CategoricalBinning::Fit(*values);
    DRIFTWATCH_LOG_DEBUG("{}: fitted {} reference categories", method.Key(),
                         binning.Categories().size());
    return std::make_shared<const FittedBinnedCategoricalMethod>(method.Key(), std::move(binning),
                                                                 distance);
}

}  // namespace

// =============================================================================
// ChiSquaredMethod
// =============================================================================

ChiSquaredMethod::ChiSquaredMethod()
    : Method(MethodInfo{
          .key = "chi2",
          .display_name = "Chi-squared statistic",
          .feature_type = data::FeatureType::kCategorical,
          .limits = DomainLimits{.lower = 0.0},
          .minimum_chunk_size = kStatisticalTestMinimumChunkSize,
          .computes_p_value = true,
      }) {}

absl::StatusOr<std::shared_ptr<const FittedMethod>> ChiSquaredMethod::Fit(
    const Sample& reference) const {
    DRIFTWATCH_ASSIGN_OR_RETURN(const std::vector<std::string>* values,
                                AsCategorical(reference, Key()));
    return std::make_shared<const FittedCategoryCounts>(
        Key(), *values, FittedCategoryCounts::Statistic::kChiSquared);
}

// =============================================================================
// CategoricalJensenShannonMethod
// =============================================================================

CategoricalJensenShannonMethod::CategoricalJensenShannonMethod()
    : Method(MethodInfo{
          .key = "jensen_shannon",
          .display_name = "Jensen-Shannon distance",
          .feature_type = data::FeatureType::kCategorical,
          .limits = DomainLimits{.lower = 0.0, .upper = 1.0},
          .minimum_chunk_size = kDistanceMinimumChunkSize,
      }) {}

absl::StatusOr<std::shared_ptr<const FittedMethod>> CategoricalJensenShannonMethod::Fit(
    const Sample& reference) const {
    return FitBinned(*this, reference, &stats::JensenShannonDistance);
}

// =============================================================================
// CategoricalHellingerMethod
// =============================================================================

CategoricalHellingerMethod::CategoricalHellingerMethod()
    : Method(MethodInfo{
          .key = "hellinger",
          .display_name = "Hellinger distance",
          .feature_type = data::FeatureType::kCategorical,
          .limits = DomainLimits{.lower = 0.0, .upper = 1.0},
          .minimum_chunk_size = kDistanceMinimumChunkSize,
      }) {}

absl::StatusOr<std::shared_ptr<const FittedMethod>> CategoricalHellingerMethod::Fit(
    const Sample& reference) const {
    return FitBinned(*this, reference, &stats::HellingerDistance);
}

// =============================================================================
// LInfinityMethod
// =============================================================================

LInfinityMethod::LInfinityMethod()
    : Method(MethodInfo{
          .key = "l_infinity",
          .display_name = "L-Infinity distance",
          .feature_type = data::FeatureType::kCategorical,
          .limits = DomainLimits{.lower = 0.0, .upper = 1.0},
          .minimum_chunk_size = kDistanceMinimumChunkSize,
      }) {}

absl::StatusOr<std::shared_ptr<const FittedMethod>> LInfinityMethod::Fit(
    const Sample& reference) const {
    DRIFTWATCH_ASSIGN_OR_RETURN(const std::vector<std::string>* values,
                                AsCategorical(reference, Key()));
    return std::make_shared<const FittedCategoryCounts>(
        Key(), *values, FittedCategoryCounts::Statistic::kLInfinity);
}

}  // namespace driftwatch::drift
