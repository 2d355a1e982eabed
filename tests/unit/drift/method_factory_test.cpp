/// @file method_factory_test.cpp
/// @brief Tests for method lookup by key and feature type

#include <gtest/gtest.h>

#include "drift/methods/method_factory.h"

namespace driftwatch::drift {
namespace {

using data::FeatureType;

TEST(MethodFactoryTest, CreatesContinuousMethods) {
    for (const char* key : {"kolmogorov_smirnov", "jensen_shannon", "wasserstein", "hellinger"}) {
        auto method = CreateMethod(key, FeatureType::kContinuous);
        ASSERT_TRUE(method.ok()) << key << ": " << method.status().message();
        EXPECT_EQ((*method)->Key(), key);
        EXPECT_EQ((*method)->Type(), FeatureType::kContinuous);
    }
}

TEST(MethodFactoryTest, CreatesCategoricalMethods) {
    for (const char* key : {"chi2", "jensen_shannon", "hellinger", "l_infinity"}) {
        auto method = CreateMethod(key, FeatureType::kCategorical);
        ASSERT_TRUE(method.ok()) << key << ": " << method.status().message();
        EXPECT_EQ((*method)->Key(), key);
        EXPECT_EQ((*method)->Type(), FeatureType::kCategorical);
    }
}

TEST(MethodFactoryTest, UnknownKeyIsConfigurationError) {
    auto method = CreateMethod("psi", FeatureType::kContinuous);
    ASSERT_FALSE(method.ok());
    EXPECT_EQ(method.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_FALSE(IsKnownMethodKey("psi"));
}

TEST(MethodFactoryTest, UnsupportedFeatureType) {
    auto chi2 = CreateMethod("chi2", FeatureType::kContinuous);
    ASSERT_FALSE(chi2.ok());
    EXPECT_EQ(chi2.status().code(), absl::StatusCode::kFailedPrecondition);

    auto ks = CreateMethod("kolmogorov_smirnov", FeatureType::kCategorical);
    ASSERT_FALSE(ks.ok());
    EXPECT_EQ(ks.status().code(), absl::StatusCode::kFailedPrecondition);

    EXPECT_TRUE(SupportsFeatureType("hellinger", FeatureType::kCategorical));
    EXPECT_FALSE(SupportsFeatureType("wasserstein", FeatureType::kCategorical));
    EXPECT_FALSE(SupportsFeatureType("psi", FeatureType::kContinuous));
}

TEST(MethodFactoryTest, KnownKeysAreSorted) {
    EXPECT_EQ(KnownMethodKeys(),
              (std::vector<std::string>{"chi2", "hellinger", "jensen_shannon",
                                        "kolmogorov_smirnov", "l_infinity", "wasserstein"}));
}

TEST(MethodFactoryTest, CreatedMethodsAreIndependent) {
    auto first = CreateMethod("jensen_shannon", FeatureType::kContinuous);
    auto second = CreateMethod("jensen_shannon", FeatureType::kContinuous);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    (*first)->SetMinimumChunkSize(10);
    EXPECT_EQ((*first)->MinimumChunkSize(), 10u);
    EXPECT_EQ((*second)->MinimumChunkSize(), kDistanceMinimumChunkSize);
}

}  // namespace
}  // namespace driftwatch::drift
