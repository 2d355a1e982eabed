/// @file method_factory.cpp
/// @brief Method registry

#include "drift/methods/method_factory.h"

#include <algorithm>
#include <functional>
#include <map>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "drift/methods/categorical_methods.h"
#include "drift/methods/continuous_methods.h"

namespace driftwatch::drift {

namespace {

using MethodBuilder = std::function<std::unique_ptr<Method>()>;

/// Builders per key, one slot per feature type
struct MethodEntry {
    MethodBuilder continuous;
    MethodBuilder categorical;
};

template <typename T>
MethodBuilder Builder() {
    return []() -> std::unique_ptr<Method> { return std::make_unique<T>(); };
}

const std::map<std::string, MethodEntry, std::less<>>& Registry() {
    static const std::map<std::string, MethodEntry, std::less<>> registry{
        {"kolmogorov_smirnov", {Builder<KolmogorovSmirnovMethod>(), nullptr}},
        {"jensen_shannon",
         {Builder<ContinuousJensenShannonMethod>(), Builder<CategoricalJensenShannonMethod>()}},
        {"wasserstein", {Builder<WassersteinMethod>(), nullptr}},
        {"hellinger",
         {Builder<ContinuousHellingerMethod>(), Builder<CategoricalHellingerMethod>()}},
        {"chi2", {nullptr, Builder<ChiSquaredMethod>()}},
        {"l_infinity", {nullptr, Builder<LInfinityMethod>()}},
    };
    return registry;
}

}  // namespace

absl::StatusOr<std::unique_ptr<Method>> CreateMethod(std::string_view key,
                                                     data::FeatureType type) {
    const auto& registry = Registry();
    auto it = registry.find(key);
    if (it == registry.end()) {
        return ConfigurationError(absl::StrCat(
            "Unknown drift method '", std::string(key), "', expected one of: ",
            absl::StrJoin(KnownMethodKeys(), ", ")));
    }

    const MethodBuilder& builder =
        type == data::FeatureType::kContinuous ? it->second.continuous : it->second.categorical;
    if (!builder) {
        return FeatureTypeMismatchError(absl::StrCat(
            "Method '", std::string(key), "' does not support ", std::string(data::FeatureTypeToString(type)),
            " features"));
    }
    return builder();
}

std::vector<std::string> KnownMethodKeys() {
    std::vector<std::string> keys;
    for (const auto& [key, entry] : Registry()) {
        keys.push_back(key);
    }
    return keys;
}

bool IsKnownMethodKey(std::string_view key) {
    return Registry().find(key) != Registry().end();
}

bool SupportsFeatureType(std::string_view key, data::FeatureType type) {
    auto it = Registry().find(key);
    if (it == Registry().end()) {
        return false;
    }
    return type == data::FeatureType::kContinuous ? static_cast<bool>(it->second.continuous)
                                                  : static_cast<bool>(it->second.categorical);
}

}  // namespace driftwatch::drift
