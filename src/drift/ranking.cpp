/// @file ranking.cpp
/// @brief Feature ranking implementation

#include "drift/ranking.h"

#include <algorithm>
#include <map>
#include <mutex>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/logging.h"

namespace driftwatch::drift {

namespace {

struct RegistryState {
    std::mutex mutex;
    std::map<std::string, RankerRegistry::Factory, std::less<>> factories{
        {"alert_count", [] { return std::make_unique<AlertCountRanker>(); }},
    };
};

RegistryState& Registry() {
    static RegistryState state;
    return state;
}

}  // namespace

absl::StatusOr<std::vector<RankedFeature>> AlertCountRanker::Rank(const DriftResult& result,
                                                                  bool only_drifting) const {
    if (result.Empty()) {
        return absl::InvalidArgumentError("Drift result contains no rows to rank");
    }

    const DriftResult analysis = result.Filter(data::Period::kAnalysis);

    std::vector<RankedFeature> ranking;
    for (const auto& column : result.ColumnNames()) {
        ranking.push_back(RankedFeature{
            .column_name = column,
            .alert_count = analysis.AlertCount(column),
        });
    }

    std::stable_sort(ranking.begin(), ranking.end(),
                     [](const RankedFeature& a, const RankedFeature& b) {
                         return a.alert_count > b.alert_count;
                     });
    for (size_t i = 0; i < ranking.size(); ++i) {
        ranking[i].rank = i + 1;
    }

    if (only_drifting) {
        ranking.erase(std::remove_if(ranking.begin(), ranking.end(),
                                     [](const RankedFeature& f) { return f.alert_count == 0; }),
                      ranking.end());
    }

    DRIFTWATCH_LOG_DEBUG("Ranked {} features by alert count", ranking.size());
    return ranking;
}

absl::StatusOr<std::unique_ptr<Ranker>> RankerRegistry::By(std::string_view key) {
    if (key.empty()) {
        return std::make_unique<AlertCountRanker>();
    }

    auto& registry = Registry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    auto it = registry.factories.find(key);
    if (it == registry.factories.end()) {
        std::vector<std::string> keys;
        for (const auto& [name, factory] : registry.factories) {
            keys.push_back(name);
        }
        return absl::InvalidArgumentError(absl::StrCat(
            "Unknown ranking '", std::string(key), "', expected one of: ", absl::StrJoin(keys, ", ")));
    }
    return it->second();
}

void RankerRegistry::Register(std::string key, Factory factory) {
    auto& registry = Registry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    registry.factories[std::move(key)] = std::move(factory);
}

std::vector<std::string> RankerRegistry::Keys() {
    auto& registry = Registry();
    std::lock_guard<std::mutex> lock(registry.mutex);
    std::vector<std::string> keys;
    for (const auto& [name, factory] : registry.factories) {
        keys.push_back(name);
    }
    return keys;
}

}  // namespace driftwatch::drift
