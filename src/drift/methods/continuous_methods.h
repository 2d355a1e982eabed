#pragma once

/// @file continuous_methods.h
/// @brief Distribution-comparison methods for continuous features

#include <memory>

#include "drift/methods/method.h"

namespace driftwatch::drift {

/// @brief Two-sample Kolmogorov-Smirnov test
///
/// Value is the largest distance between the reference and chunk ECDFs, with
/// a p-value from the asymptotic Kolmogorov distribution.
class KolmogorovSmirnovMethod : public Method {
public:
    KolmogorovSmirnovMethod();

    absl::StatusOr<std::shared_ptr<const FittedMethod>> Fit(
        const Sample& reference) const override;
};

/// @brief Jensen-Shannon distance between binned distributions
///
/// Bins are fixed on the reference with Doane's rule, or one bin per distinct
/// value for low-cardinality references.
class ContinuousJensenShannonMethod : public Method {
public:
    ContinuousJensenShannonMethod();

    absl::StatusOr<std::shared_ptr<const FittedMethod>> Fit(
        const Sample& reference) const override;
};

/// @brief First Wasserstein (earth mover's) distance between the ECDFs
class WassersteinMethod : public Method {
public:
    WassersteinMethod();

    absl::StatusOr<std::shared_ptr<const FittedMethod>> Fit(
        const Sample& reference) const override;
};

/// @brief Hellinger distance between binned distributions
class ContinuousHellingerMethod : public Method {
public:
    ContinuousHellingerMethod();

    absl::StatusOr<std::shared_ptr<const FittedMethod>> Fit(
        const Sample& reference) const override;
};

}  // namespace driftwatch::drift
