#pragma once

/// @file binning.h
/// @brief Reference-fitted binning producing aligned frequency vectors

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace driftwatch::drift {

/// @brief Equal-width histogram edges over [min, max] using Doane's rule
///
/// Matches numpy's histogram_bin_edges(bins='doane'). A constant sample gets
/// the single bin [v - 0.5, v + 0.5]. Samples with two values or fewer, or
/// zero variance, get one bin.
/// @param values Non-empty sample of finite values
std::vector<double> DoaneBinEdges(const std::vector<double>& values);

/// @brief Whether a continuous reference is treated as discrete
///
/// True when it has at most min(50, 10% of its size) distinct values.
bool TreatAsDiscrete(const std::vector<double>& values);

/// @brief Binning of a continuous column fixed on the reference
///
/// Frequency vectors have one entry per bin plus a trailing overflow entry
/// for values falling outside the reference edges (or, in discrete mode, not
/// equal to any reference value). The reference overflow entry is always 0.
class ContinuousBinning {
public:
    /// @param values Reference sample; non-finite values are ignored
    static ContinuousBinning Fit(const std::vector<double>& values);

    /// @brief Relative frequencies of a sample; sums to 1 for non-empty input
    std::vector<double> Frequencies(const std::vector<double>& sample) const;

    const std::vector<double>& ReferenceFrequencies() const { return reference_frequencies_; }

    bool IsDiscrete() const { return discrete_; }

    /// @brief Number of regular bins (without overflow)
    size_t BinCount() const;

    nlohmann::json ToJson() const;

private:
    ContinuousBinning() = default;

    /// @brief Regular bin of a value, or BinCount() for overflow
    size_t BinOf(double value) const;

    bool discrete_ = false;
    std::vector<double> edges_;            ///< Continuous mode
    std::vector<double> distinct_values_;  ///< Discrete mode, sorted
    std::vector<double> reference_frequencies_;
};

/// @brief Binning of a categorical column fixed on the reference
///
/// Reference categories, in sorted order, are the bins; categories first seen
/// after fitting share one trailing overflow bin.
class CategoricalBinning {
public:
    /// @param reference Non-empty reference sample
    static CategoricalBinning Fit(const std::vector<std::string>& reference);

    /// @brief Relative frequencies of a sample; sums to 1 for non-empty input
    std::vector<double> Frequencies(const std::vector<std::string>& sample) const;

    const std::vector<double>& ReferenceFrequencies() const { return reference_frequencies_; }
    const std::vector<std::string>& Categories() const { return categories_; }

    nlohmann::json ToJson() const;

private:
    CategoricalBinning() = default;

    std::vector<std::string> categories_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<double> reference_frequencies_;
};

/// @brief Occurrence count per distinct category
std::unordered_map<std::string, size_t> CountCategories(const std::vector<std::string>& values);

}  // namespace driftwatch::drift
