#pragma once

/// @file statistics.h
/// @brief Distribution distances and test statistics shared by the methods

#include <cstddef>
#include <vector>

namespace driftwatch::drift::stats {

/// @brief Two-sample Kolmogorov-Smirnov statistic
/// @param reference Sorted, non-empty
/// @param sample Sorted, non-empty
/// @return sup |F_reference(x) - F_sample(x)|
double KolmogorovSmirnovStatistic(const std::vector<double>& reference,
                                  const std::vector<double>& sample);

/// @brief Asymptotic Kolmogorov survival function Q(lambda)
///
/// Q(lambda) = 2 * sum_{k>=1} (-1)^(k-1) exp(-2 k^2 lambda^2). Returns 1 where
/// the alternating series does not converge (small lambda).
double KolmogorovSurvival(double lambda);

/// @brief Two-sided p-value of a two-sample KS statistic
///
/// Uses the effective size n*m/(n+m) with the Stephens small-sample
/// correction.
double KolmogorovSmirnovPValue(double statistic, size_t n, size_t m);

/// @brief First Wasserstein distance between two empirical distributions
/// @param reference Sorted, non-empty
/// @param sample Sorted, non-empty
double WassersteinDistance(const std::vector<double>& reference,
                           const std::vector<double>& sample);

/// @brief Upper tail probability of the chi-squared distribution
/// @return 1 when degrees_of_freedom is zero
double ChiSquaredSurvival(double statistic, double degrees_of_freedom);

/// @brief Jensen-Shannon distance (base 2) between two aligned distributions
/// @return sqrt of the divergence, within [0, 1]
double JensenShannonDistance(const std::vector<double>& p, const std::vector<double>& q);

/// @brief Hellinger distance between two aligned distributions, within [0, 1]
double HellingerDistance(const std::vector<double>& p, const std::vector<double>& q);

/// @brief Largest absolute difference between two aligned distributions
double LInfinityDistance(const std::vector<double>& p, const std::vector<double>& q);

}  // namespace driftwatch::drift::stats
