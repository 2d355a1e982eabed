/// @file statistics.cpp
/// @brief Distribution distances and test statistics

#include "drift/methods/statistics.h"

#include <algorithm>
#include <cmath>
#include <iterator>

#include <boost/math/distributions/chi_squared.hpp>

namespace driftwatch::drift::stats {

double KolmogorovSmirnovStatistic(const std::vector<double>& reference,
                                  const std::vector<double>& sample) {
    if (reference.empty() || sample.empty()) {
        return 0.0;
    }

    const double n1 = static_cast<double>(reference.size());
    const double n2 = static_cast<double>(sample.size());

    size_t i = 0, j = 0;
    double d = 0.0;

    // Step both ECDFs past every copy of the next value so ties cancel
    while (i < reference.size() && j < sample.size()) {
        const double x = std::min(reference[i], sample[j]);
        while (i < reference.size() && reference[i] <= x) {
            ++i;
        }
        while (j < sample.size() && sample[j] <= x) {
            ++j;
        }
        const double cdf1 = static_cast<double>(i) / n1;
        const double cdf2 = static_cast<double>(j) / n2;
        d = std::max(d, std::abs(cdf1 - cdf2));
    }

    return d;
}

double KolmogorovSurvival(double lambda) {
    constexpr int kMaxTerms = 100;
    constexpr double kRelativeTolerance = 1e-3;
    constexpr double kAbsoluteTolerance = 1e-8;

    if (lambda <= 0.0) {
        return 1.0;
    }

    const double a2 = -2.0 * lambda * lambda;
    double factor = 2.0;
    double sum = 0.0;
    double previous_term = 0.0;

    for (int k = 1; k <= kMaxTerms; ++k) {
        const double term = factor * std::exp(a2 * k * k);
        sum += term;
        if (std::abs(term) <= kRelativeTolerance * previous_term ||
            std::abs(term) <= kAbsoluteTolerance * sum) {
            return std::clamp(sum, 0.0, 1.0);
        }
        factor = -factor;
        previous_term = std::abs(term);
    }
    return 1.0;
}

double KolmogorovSmirnovPValue(double statistic, size_t n, size_t m) {
    if (n == 0 || m == 0) {
        return 1.0;
    }
    const double effective = static_cast<double>(n) * static_cast<double>(m) /
                             static_cast<double>(n + m);
    const double root = std::sqrt(effective);
    return KolmogorovSurvival((root + 0.12 + 0.11 / root) * statistic);
}

double WassersteinDistance(const std::vector<double>& reference,
                           const std::vector<double>& sample) {
    if (reference.empty() || sample.empty()) {
        return 0.0;
    }

    std::vector<double> all;
    all.reserve(reference.size() + sample.size());
    std::merge(reference.begin(), reference.end(), sample.begin(), sample.end(),
               std::back_inserter(all));

    const double n1 = static_cast<double>(reference.size());
    const double n2 = static_cast<double>(sample.size());

    // Integrate |F_reference - F_sample| over the merged support
    double distance = 0.0;
    size_t i = 0, j = 0;
    for (size_t k = 0; k + 1 < all.size(); ++k) {
        while (i < reference.size() && reference[i] <= all[k]) {
            ++i;
        }
        while (j < sample.size() && sample[j] <= all[k]) {
            ++j;
        }
        const double width = all[k + 1] - all[k];
        if (width > 0.0) {
            distance += std::abs(static_cast<double>(i) / n1 - static_cast<double>(j) / n2) * width;
        }
    }
    return distance;
}

double ChiSquaredSurvival(double statistic, double degrees_of_freedom) {
    if (degrees_of_freedom <= 0.0 || !(statistic > 0.0)) {
        return 1.0;
    }
    if (std::isinf(statistic)) {
        return 0.0;
    }
    const boost::math::chi_squared distribution(degrees_of_freedom);
    return boost::math::cdf(boost::math::complement(distribution, statistic));
}

double JensenShannonDistance(const std::vector<double>& p, const std::vector<double>& q) {
    const size_t size = std::min(p.size(), q.size());
    double divergence = 0.0;
    for (size_t i = 0; i < size; ++i) {
        const double m = 0.5 * (p[i] + q[i]);
        if (p[i] > 0.0) {
            divergence += 0.5 * p[i] * std::log2(p[i] / m);
        }
        if (q[i] > 0.0) {
            divergence += 0.5 * q[i] * std::log2(q[i] / m);
        }
    }
    return std::sqrt(std::clamp(divergence, 0.0, 1.0));
}

double HellingerDistance(const std::vector<double>& p, const std::vector<double>& q) {
    const size_t size = std::min(p.size(), q.size());
    double sum = 0.0;
    for (size_t i = 0; i < size; ++i) {
        const double diff = std::sqrt(p[i]) - std::sqrt(q[i]);
        sum += diff * diff;
    }
    return std::min(std::sqrt(sum) / std::sqrt(2.0), 1.0);
}

double LInfinityDistance(const std::vector<double>& p, const std::vector<double>& q) {
    const size_t size = std::min(p.size(), q.size());
    double distance = 0.0;
    for (size_t i = 0; i < size; ++i) {
        distance = std::max(distance, std::abs(p[i] - q[i]));
    }
    return distance;
}

}  // namespace driftwatch::drift::stats
