/// @file binning.cpp
/// @brief Reference-fitted binning implementation

#include "drift/methods/binning.h"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace driftwatch::drift {

namespace {

constexpr size_t kMaxDiscreteValues = 50;
constexpr double kMaxDiscreteFraction = 0.1;

std::vector<double> Normalize(std::vector<double> counts, size_t total) {
    if (total == 0) {
        return counts;
    }
    for (auto& c : counts) {
        c /= static_cast<double>(total);
    }
    return counts;
}

std::vector<double> FiniteValues(const std::vector<double>& values) {
    std::vector<double> finite;
    finite.reserve(values.size());
    std::copy_if(values.begin(), values.end(), std::back_inserter(finite),
                 [](double v) { return std::isfinite(v); });
    return finite;
}

std::vector<double> SortedDistinct(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

}  // namespace

std::vector<double> DoaneBinEdges(const std::vector<double>& values) {
    if (values.empty()) {
        return {};
    }

    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    double first = *min_it;
    double last = *max_it;
    if (first == last) {
        return {first - 0.5, last + 0.5};
    }

    const double n = static_cast<double>(values.size());
    size_t bins = 1;
    if (values.size() > 2) {
        double mean = 0.0;
        for (double v : values) {
            mean += v;
        }
        mean /= n;

        double variance = 0.0;
        for (double v : values) {
            variance += (v - mean) * (v - mean);
        }
        const double sigma = std::sqrt(variance / n);

        if (sigma > 0.0) {
            double skew = 0.0;
            for (double v : values) {
                const double z = (v - mean) / sigma;
                skew += z * z * z;
            }
            skew /= n;

            const double sg1 = std::sqrt(6.0 * (n - 2.0) / ((n + 1.0) * (n + 3.0)));
            const double width =
                (last - first) / (1.0 + std::log2(n) + std::log2(1.0 + std::abs(skew) / sg1));
            if (width > 0.0) {
                bins = std::max<size_t>(
                    1, static_cast<size_t>(std::ceil((last - first) / width)));
            }
        }
    }

    std::vector<double> edges(bins + 1);
    const double step = (last - first) / static_cast<double>(bins);
    for (size_t i = 0; i < bins; ++i) {
        edges[i] = first + static_cast<double>(i) * step;
    }
    edges[bins] = last;
    return edges;
}

bool TreatAsDiscrete(const std::vector<double>& values) {
    const size_t distinct = SortedDistinct(values).size();
    const double limit = std::min(static_cast<double>(kMaxDiscreteValues),
                                  kMaxDiscreteFraction * static_cast<double>(values.size()));
    return static_cast<double>(distinct) <= limit;
}

// =============================================================================
// ContinuousBinning
// =============================================================================

ContinuousBinning ContinuousBinning::Fit(const std::vector<double>& values) {
    // Infinities would turn the histogram edges into NaN
    const std::vector<double> reference = FiniteValues(values);

    ContinuousBinning binning;
    binning.discrete_ = TreatAsDiscrete(reference);
    if (binning.discrete_) {
        binning.distinct_values_ = SortedDistinct(reference);
    } else {
        binning.edges_ = DoaneBinEdges(reference);
    }
    binning.reference_frequencies_ = binning.Frequencies(reference);
    return binning;
}

size_t ContinuousBinning::BinCount() const {
    if (discrete_) {
        return distinct_values_.size();
    }
    return edges_.empty() ? 0 : edges_.size() - 1;
}

size_t ContinuousBinning::BinOf(double value) const {
    const size_t overflow = BinCount();

    if (discrete_) {
        auto it = std::lower_bound(distinct_values_.begin(), distinct_values_.end(), value);
        if (it == distinct_values_.end() || *it != value) {
            return overflow;
        }
        return static_cast<size_t>(it - distinct_values_.begin());
    }

    if (edges_.size() < 2 || value < edges_.front() || value > edges_.back()) {
        return overflow;
    }
    // Bins are [a, b) except the last, which also holds its upper edge
    if (value == edges_.back()) {
        return overflow - 1;
    }
    auto it = std::upper_bound(edges_.begin(), edges_.end(), value);
    return static_cast<size_t>(it - edges_.begin()) - 1;
}

std::vector<double> ContinuousBinning::Frequencies(const std::vector<double>& sample) const {
    std::vector<double> counts(BinCount() + 1, 0.0);
    for (double v : sample) {
        counts[BinOf(v)] += 1.0;
    }
    return Normalize(std::move(counts), sample.size());
}

nlohmann::json ContinuousBinning::ToJson() const {
    nlohmann::json j;
    j["discrete"] = discrete_;
    if (discrete_) {
        j["values"] = distinct_values_;
    } else {
        j["edges"] = edges_;
    }
    j["reference_frequencies"] = reference_frequencies_;
    return j;
}

// =============================================================================
// CategoricalBinning
// =============================================================================

std::unordered_map<std::string, size_t> CountCategories(const std::vector<std::string>& values) {
    std::unordered_map<std::string, size_t> counts;
    for (const auto& v : values) {
        ++counts[v];
    }
    return counts;
}

CategoricalBinning CategoricalBinning::Fit(const std::vector<std::string>& reference) {
    CategoricalBinning binning;
    for (const auto& [category, count] : CountCategories(reference)) {
        binning.categories_.push_back(category);
    }
    std::sort(binning.categories_.begin(), binning.categories_.end());
    for (size_t i = 0; i < binning.categories_.size(); ++i) {
        binning.index_[binning.categories_[i]] = i;
    }
    binning.reference_frequencies_ = binning.Frequencies(reference);
    return binning;
}

std::vector<double> CategoricalBinning::Frequencies(const std::vector<std::string>& sample) const {
    std::vector<double> counts(categories_.size() + 1, 0.0);
    for (const auto& v : sample) {
        auto it = index_.find(v);
        counts[it == index_.end() ? categories_.size() : it->second] += 1.0;
    }
    return Normalize(std::move(counts), sample.size());
}

nlohmann::json CategoricalBinning::ToJson() const {
    return nlohmann::json{
        {"categories", categories_},
        {"reference_frequencies", reference_frequencies_},
    };
}

}  // namespace driftwatch::drift
