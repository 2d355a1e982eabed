/// @file categorical_methods_test.cpp
/// @brief Tests for categorical distribution-comparison methods

#include <gtest/gtest.h>

#include <cmath>

#include "drift/methods/categorical_methods.h"

namespace driftwatch::drift {
namespace {

std::vector<std::string> Repeat(const std::vector<std::pair<std::string, int>>& counts) {
    std::vector<std::string> values;
    for (const auto& [category, count] : counts) {
        values.insert(values.end(), count, category);
    }
    return values;
}

MethodValue FitAndCalculate(const Method& method, std::vector<std::string> reference,
                            std::vector<std::string> sample) {
    auto fitted = method.Fit(Sample(std::move(reference)));
    EXPECT_TRUE(fitted.ok()) << fitted.status().message();
    auto value = (*fitted)->Calculate(Sample(std::move(sample)));
    EXPECT_TRUE(value.ok()) << value.status().message();
    return *value;
}

// =============================================================================
// Chi-squared
// =============================================================================

TEST(ChiSquaredMethodTest, Info) {
    ChiSquaredMethod method;
    EXPECT_EQ(method.Key(), "chi2");
    EXPECT_EQ(method.Type(), data::FeatureType::kCategorical);
    EXPECT_EQ(method.MinimumChunkSize(), kStatisticalTestMinimumChunkSize);
    EXPECT_TRUE(method.Info().computes_p_value);
    EXPECT_FALSE(method.Limits().upper.has_value());
}

TEST(ChiSquaredMethodTest, SameProportions) {
    MethodValue value = FitAndCalculate(ChiSquaredMethod(), Repeat({{"a", 50}, {"b", 50}}),
                                        Repeat({{"a", 10}, {"b", 10}}));
    EXPECT_NEAR(value.value, 0.0, 1e-12);
    ASSERT_TRUE(value.p_value.has_value());
    EXPECT_DOUBLE_EQ(*value.p_value, 1.0);
}

TEST(ChiSquaredMethodTest, ContingencyTable) {
    // Expected counts 65/35 per period
    MethodValue value = FitAndCalculate(ChiSquaredMethod(), Repeat({{"a", 50}, {"b", 50}}),
                                        Repeat({{"a", 80}, {"b", 20}}));
    EXPECT_NEAR(value.value, 450.0 / 65.0 + 450.0 / 35.0, 1e-9);
    ASSERT_TRUE(value.p_value.has_value());
    EXPECT_LT(*value.p_value, 1e-3);
}

TEST(ChiSquaredMethodTest, NovelCategoryJoinsTheTable) {
    MethodValue value = FitAndCalculate(ChiSquaredMethod(), Repeat({{"a", 50}, {"b", 50}}),
                                        Repeat({{"a", 50}, {"b", 40}, {"c", 10}}));
    EXPECT_GT(value.value, 0.0);
    ASSERT_TRUE(value.p_value.has_value());
    EXPECT_LT(*value.p_value, 0.05);
}

TEST(ChiSquaredMethodTest, SingleCategoryHasNoDegreesOfFreedom) {
    MethodValue value = FitAndCalculate(ChiSquaredMethod(), Repeat({{"a", 10}}),
                                        Repeat({{"a", 5}}));
    EXPECT_NEAR(value.value, 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(*value.p_value, 1.0);
}

// =============================================================================
// L-Infinity
// =============================================================================

TEST(LInfinityMethodTest, LargestProportionChange) {
    LInfinityMethod method;
    EXPECT_EQ(method.Key(), "l_infinity");
    EXPECT_EQ(method.Limits().upper, 1.0);

    MethodValue value = FitAndCalculate(method, Repeat({{"a", 50}, {"b", 50}}),
                                        Repeat({{"a", 80}, {"b", 20}}));
    EXPECT_NEAR(value.value, 0.3, 1e-12);
    EXPECT_FALSE(value.p_value.has_value());
}

TEST(LInfinityMethodTest, OnlyNovelCategories) {
    MethodValue value = FitAndCalculate(LInfinityMethod(), Repeat({{"a", 5}, {"b", 5}}),
                                        Repeat({{"c", 4}}));
    EXPECT_DOUBLE_EQ(value.value, 1.0);
}

// =============================================================================
// Binned methods
// =============================================================================

TEST(CategoricalJensenShannonMethodTest, NovelCategoryInOverflow) {
    CategoricalJensenShannonMethod method;
    EXPECT_EQ(method.Key(), "jensen_shannon");
    EXPECT_EQ(method.Type(), data::FeatureType::kCategorical);

    MethodValue value = FitAndCalculate(method, Repeat({{"a", 50}, {"b", 50}}),
                                        Repeat({{"a", 50}, {"c", 50}}));
    EXPECT_NEAR(value.value, std::sqrt(0.5), 1e-12);
}

TEST(CategoricalJensenShannonMethodTest, IdenticalDistribution) {
    MethodValue value = FitAndCalculate(CategoricalJensenShannonMethod(),
                                        Repeat({{"a", 30}, {"b", 70}}),
                                        Repeat({{"b", 7}, {"a", 3}}));
    EXPECT_NEAR(value.value, 0.0, 1e-12);
}

TEST(CategoricalHellingerMethodTest, NovelCategoryInOverflow) {
    MethodValue value = FitAndCalculate(CategoricalHellingerMethod(),
                                        Repeat({{"a", 50}, {"b", 50}}),
                                        Repeat({{"a", 50}, {"c", 50}}));
    EXPECT_NEAR(value.value, std::sqrt(0.5), 1e-12);
}

TEST(CategoricalBinnedMethodTest, SingleNovelCategoryIsBoundedByItsMass) {
    const auto reference = Repeat({{"a", 50}, {"b", 50}});
    const auto sample = Repeat({{"a", 50}, {"b", 50}, {"z", 1}});
    const double overflow_mass = 1.0 / 101.0;

    for (const double distance :
         {FitAndCalculate(CategoricalJensenShannonMethod(), reference, sample).value,
          FitAndCalculate(CategoricalHellingerMethod(), reference, sample).value}) {
        EXPECT_GT(distance, 0.0);
        EXPECT_LE(distance * distance, overflow_mass);
    }
}

// =============================================================================
// Errors
// =============================================================================

TEST(CategoricalMethodErrorsTest, ContinuousSampleIsTypeMismatch) {
    ChiSquaredMethod method;
    auto fitted = method.Fit(Sample(std::vector<double>{1.0, 2.0}));
    ASSERT_FALSE(fitted.ok());
    EXPECT_EQ(fitted.status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST(CategoricalMethodErrorsTest, EmptySample) {
    CategoricalHellingerMethod method;
    auto fitted = method.Fit(Sample(Repeat({{"a", 3}})));
    ASSERT_TRUE(fitted.ok());

    auto value = (*fitted)->Calculate(Sample(std::vector<std::string>{}));
    ASSERT_FALSE(value.ok());
    EXPECT_EQ(value.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(CategoricalMethodErrorsTest, FittedStateToJson) {
    ChiSquaredMethod method;
    auto fitted = method.Fit(Sample(Repeat({{"a", 2}, {"b", 1}})));
    ASSERT_TRUE(fitted.ok());

    auto json = (*fitted)->ToJson();
    EXPECT_EQ(json["reference_size"], 3);
    EXPECT_EQ(json["reference_counts"]["a"], 2);
}

}  // namespace
}  // namespace driftwatch::drift
