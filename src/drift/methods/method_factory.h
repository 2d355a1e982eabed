#pragma once

/// @file method_factory.h
/// @brief Lookup of distribution-comparison methods by key and feature type

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "data/observation_table.h"
#include "drift/methods/method.h"

namespace driftwatch::drift {

/// @brief Create a method for a feature type
///
/// Unknown keys are configuration errors (InvalidArgument). A known key that
/// has no variant for the feature type, such as chi2 on a continuous column,
/// is a FailedPrecondition.
absl::StatusOr<std::unique_ptr<Method>> CreateMethod(std::string_view key,
                                                     data::FeatureType type);

/// @brief All method keys, sorted
std::vector<std::string> KnownMethodKeys();

/// @brief Whether a key names any method
bool IsKnownMethodKey(std::string_view key);

/// @brief Whether a method key has a variant for the feature type
bool SupportsFeatureType(std::string_view key, data::FeatureType type);

}  // namespace driftwatch::drift
