/// @file ranking_test.cpp
/// @brief Tests for feature ranking by alert count

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>

#include "common/thread_pool.h"
#include "drift/ranking.h"

namespace driftwatch::drift {
namespace {

DriftResultRow MakeRow(data::Period period, std::string column, bool alert) {
    DriftResultRow row;
    row.chunk.period = period;
    row.column_name = std::move(column);
    row.method_key = "jensen_shannon";
    row.value = 0.0;
    row.alert = alert;
    return row;
}

DriftResult MakeResult() {
    using data::Period;
    return DriftResult({
        // Reference alerts are not counted
        MakeRow(Period::kReference, "a", false),
        MakeRow(Period::kReference, "b", false),
        MakeRow(Period::kReference, "c", true),
        MakeRow(Period::kReference, "c", true),
        MakeRow(Period::kAnalysis, "a", true),
        MakeRow(Period::kAnalysis, "b", true),
        MakeRow(Period::kAnalysis, "c", false),
        MakeRow(Period::kAnalysis, "a", false),
        MakeRow(Period::kAnalysis, "b", true),
        MakeRow(Period::kAnalysis, "c", false),
        MakeRow(Period::kAnalysis, "b", true),
    });
}

TEST(AlertCountRankerTest, RanksByAnalysisAlerts) {
    AlertCountRanker ranker;
    auto ranking = ranker.Rank(MakeResult());
    ASSERT_TRUE(ranking.ok()) << ranking.status().message();
    ASSERT_EQ(ranking->size(), 3u);

    EXPECT_EQ((*ranking)[0].column_name, "b");
    EXPECT_EQ((*ranking)[0].alert_count, 3u);
    EXPECT_EQ((*ranking)[0].rank, 1u);
    EXPECT_EQ((*ranking)[1].column_name, "a");
    EXPECT_EQ((*ranking)[1].alert_count, 1u);
    EXPECT_EQ((*ranking)[2].column_name, "c");
    EXPECT_EQ((*ranking)[2].alert_count, 0u);
    EXPECT_EQ((*ranking)[2].rank, 3u);
}

TEST(AlertCountRankerTest, OnlyDrifting) {
    AlertCountRanker ranker;
    auto ranking = ranker.Rank(MakeResult(), /*only_drifting=*/true);
    ASSERT_TRUE(ranking.ok());
    ASSERT_EQ(ranking->size(), 2u);
    EXPECT_EQ((*ranking)[1].column_name, "a");
    EXPECT_EQ((*ranking)[1].rank, 2u);
}

TEST(AlertCountRankerTest, TiesKeepColumnOrder) {
    using data::Period;
    DriftResult result({
        MakeRow(Period::kAnalysis, "z", true),
        MakeRow(Period::kAnalysis, "m", true),
        MakeRow(Period::kAnalysis, "a", true),
    });

    auto ranking = AlertCountRanker().Rank(result);
    ASSERT_TRUE(ranking.ok());
    ASSERT_EQ(ranking->size(), 3u);
    EXPECT_EQ((*ranking)[0].column_name, "z");
    EXPECT_EQ((*ranking)[1].column_name, "m");
    EXPECT_EQ((*ranking)[2].column_name, "a");
}

TEST(AlertCountRankerTest, EmptyResultIsInvalid) {
    auto ranking = AlertCountRanker().Rank(DriftResult());
    ASSERT_FALSE(ranking.ok());
    EXPECT_EQ(ranking.status().code(), absl::StatusCode::kInvalidArgument);
}

class ReverseColumnRanker : public Ranker {
public:
    absl::StatusOr<std::vector<RankedFeature>> Rank(const DriftResult& result,
                                                    bool /*only_drifting*/) const override {
        std::vector<RankedFeature> ranking;
        auto columns = result.ColumnNames();
        for (auto it = columns.rbegin(); it != columns.rend(); ++it) {
            ranking.push_back(RankedFeature{.column_name = *it, .rank = ranking.size() + 1});
        }
        return ranking;
    }

    std::string Name() const override { return "reverse"; }
};

TEST(RankerRegistryTest, DefaultAndUnknownKeys) {
    auto by_default = RankerRegistry::By();
    ASSERT_TRUE(by_default.ok());
    EXPECT_EQ((*by_default)->Name(), "alert_count");

    auto by_key = RankerRegistry::By("alert_count");
    ASSERT_TRUE(by_key.ok());
    EXPECT_EQ((*by_key)->Name(), "alert_count");

    auto unknown = RankerRegistry::By("correlation");
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(RankerRegistryTest, RegisterCustomRanker) {
    RankerRegistry::Register("reverse", [] { return std::make_unique<ReverseColumnRanker>(); });

    auto keys = RankerRegistry::Keys();
    EXPECT_NE(std::find(keys.begin(), keys.end(), "reverse"), keys.end());

    auto ranker = RankerRegistry::By("reverse");
    ASSERT_TRUE(ranker.ok());
    auto ranking = (*ranker)->Rank(MakeResult());
    ASSERT_TRUE(ranking.ok());
    EXPECT_EQ(ranking->front().column_name, "c");
}

TEST(RankerRegistryTest, ConcurrentLookupsAndRegistration) {
    ThreadPool pool(4);
    std::atomic<size_t> created{0};
    pool.ParallelFor(64, [&](size_t i) {
        if (i % 8 == 0) {
            RankerRegistry::Register("reverse_" + std::to_string(i),
                                     [] { return std::make_unique<ReverseColumnRanker>(); });
        }
        auto ranker = RankerRegistry::By("alert_count");
        if (ranker.ok() && (*ranker)->Name() == "alert_count") {
            ++created;
        }
    });

    EXPECT_EQ(created.load(), 64u);
    auto keys = RankerRegistry::Keys();
    EXPECT_TRUE(std::is_sorted(keys.begin(), keys.end()));
    EXPECT_NE(std::find(keys.begin(), keys.end(), "reverse_56"), keys.end());
}

}  // namespace
}  // namespace driftwatch::drift
