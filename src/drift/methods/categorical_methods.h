#pragma once

/// @file categorical_methods.h
/// @brief Distribution-comparison methods for categorical features

#include <memory>

#include "drift/methods/method.h"

namespace driftwatch::drift {

/// @brief Chi-squared test of independence between period and category
///
/// Builds the 2 x k contingency table over the union of reference and chunk
/// categories. No continuity correction is applied.
class ChiSquaredMethod : public Method {
public:
    ChiSquaredMethod();

    absl::StatusOr<std::shared_ptr<const FittedMethod>> Fit(
        const Sample& reference) const override;
};

/// @brief Jensen-Shannon distance over reference categories plus one bin
///        shared by unseen categories
class CategoricalJensenShannonMethod : public Method {
public:
    CategoricalJensenShannonMethod();

    absl::StatusOr<std::shared_ptr<const FittedMethod>> Fit(
        const Sample& reference) const override;
};

/// @brief Hellinger distance, binned like CategoricalJensenShannonMethod
class CategoricalHellingerMethod : public Method {
public:
    CategoricalHellingerMethod();

    absl::StatusOr<std::shared_ptr<const FittedMethod>> Fit(
        const Sample& reference) const override;
};

/// @brief Largest difference in relative frequency over all categories
class LInfinityMethod : public Method {
public:
    LInfinityMethod();

    absl::StatusOr<std::shared_ptr<const FittedMethod>> Fit(
        const Sample& reference) const override;
};

}  // namespace driftwatch::drift
