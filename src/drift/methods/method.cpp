/// @file method.cpp
/// @brief Shared helpers of the method interface

#include "drift/methods/method.h"

#include <algorithm>
#include <cmath>
#include <iterator>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace driftwatch::drift {

absl::StatusOr<std::vector<double>> AsContinuous(const Sample& sample, std::string_view method) {
    const auto* values = std::get_if<std::vector<double>>(&sample);
    if (values == nullptr) {
        return FeatureTypeMismatchError(
            absl::StrCat(std::string(method), " expects continuous values, got categorical"));
    }
    std::vector<double> finite;
    finite.reserve(values->size());
    std::copy_if(values->begin(), values->end(), std::back_inserter(finite),
                 [](double v) { return std::isfinite(v); });
    if (finite.empty()) {
        return EmptyDataError(absl::StrCat(std::string(method), " received an empty sample"));
    }
    return finite;
}

absl::StatusOr<const std::vector<std::string>*> AsCategorical(const Sample& sample,
                                                             std::string_view method) {
    const auto* values = std::get_if<std::vector<std::string>>(&sample);
    if (values == nullptr) {
        return FeatureTypeMismatchError(
            absl::StrCat(std::string(method), " expects categorical values, got continuous"));
    }
    if (values->empty()) {
        return EmptyDataError(absl::StrCat(std::string(method), " received an empty sample"));
    }
    return values;
}

}  // namespace driftwatch::drift
