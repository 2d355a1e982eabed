#pragma once

/// @file ranking.h
/// @brief Ordering features by drift impact

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "drift/drift_result.h"

namespace driftwatch::drift {

/// @brief Rank of one feature
struct RankedFeature {
    std::string column_name;
    size_t alert_count = 0;
    size_t rank = 0;  ///< 1 for the most drifting feature
};

/// @brief Abstract base class for feature rankings
class Ranker {
public:
    virtual ~Ranker() = default;

    /// @brief Rank the features of a drift result
    /// @param result Calculator output; reference rows are ignored
    /// @param only_drifting Omit features without alerts
    virtual absl::StatusOr<std::vector<RankedFeature>> Rank(const DriftResult& result,
                                                            bool only_drifting = false) const = 0;

    /// @brief Get the ranker name
    virtual std::string Name() const = 0;
};

/// @brief Ranks features by the number of alerting analysis rows, all methods
///        combined; ties keep column order
class AlertCountRanker : public Ranker {
public:
    absl::StatusOr<std::vector<RankedFeature>> Rank(const DriftResult& result,
                                                    bool only_drifting = false) const override;

    std::string Name() const override { return "alert_count"; }
};

/// @brief Rankers by key
class RankerRegistry {
public:
    using Factory = std::function<std::unique_ptr<Ranker>()>;

    /// @brief Create the ranker registered under a key
    /// @param key Ranker key; empty selects alert_count
    static absl::StatusOr<std::unique_ptr<Ranker>> By(std::string_view key = {});

    /// @brief Register or replace a ranker
    static void Register(std::string key, Factory factory);

    /// @brief Registered keys, sorted
    static std::vector<std::string> Keys();
};

}  // namespace driftwatch::drift
