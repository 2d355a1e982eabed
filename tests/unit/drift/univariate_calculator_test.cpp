/// @file univariate_calculator_test.cpp
/// @brief Tests for the univariate drift calculator

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

#include <spdlog/sinks/ringbuffer_sink.h>

#include "common/logging.h"
#include "drift/univariate_calculator.h"

namespace driftwatch::drift {
namespace {

using data::FeatureType;
using data::ObservationTable;
using data::Period;

std::vector<double> Uniform(size_t rows, double low, double high, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(low, high);
    std::vector<double> values(rows);
    for (auto& v : values) {
        v = dist(rng);
    }
    return values;
}

data::CategoricalValues Alternating(size_t rows, const std::vector<std::string>& categories) {
    data::CategoricalValues values;
    values.reserve(rows);
    for (size_t i = 0; i < rows; ++i) {
        values.push_back(categories[i % categories.size()]);
    }
    return values;
}

ObservationTable MakeTable(std::vector<double> x, data::CategoricalValues c) {
    ObservationTable table;
    EXPECT_TRUE(table.AddContinuousColumn("x", std::move(x)).ok());
    EXPECT_TRUE(table.AddCategoricalColumn("c", std::move(c)).ok());
    return table;
}

class UnivariateDriftCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.columns = {{"x", FeatureType::kContinuous}, {"c", FeatureType::kCategorical}};
        config_.chunking.count = 10;
        config_.continuous_methods = {"kolmogorov_smirnov", "wasserstein"};
        config_.categorical_methods = {"chi2", "l_infinity"};

        reference_ = MakeTable(Uniform(1000, 0.0, 10.0, 42), Alternating(1000, {"a", "b"}));
    }

    UnivariateDriftConfig config_;
    ObservationTable reference_;
};

// =============================================================================
// Validation and errors
// =============================================================================

TEST_F(UnivariateDriftCalculatorTest, ValidConfiguration) {
    EXPECT_TRUE(UnivariateDriftCalculator(config_).Validate().ok());
}

TEST_F(UnivariateDriftCalculatorTest, RejectsEmptyColumns) {
    config_.columns.clear();
    EXPECT_EQ(UnivariateDriftCalculator(config_).Validate().code(),
              absl::StatusCode::kInvalidArgument);
}

TEST_F(UnivariateDriftCalculatorTest, RejectsUnknownMethod) {
    config_.continuous_methods = {"kolmogorov_smirnov", "psi"};
    EXPECT_EQ(UnivariateDriftCalculator(config_).Validate().code(),
              absl::StatusCode::kInvalidArgument);
}

TEST_F(UnivariateDriftCalculatorTest, RejectsMethodForWrongFeatureType) {
    config_.continuous_methods = {"chi2"};
    EXPECT_EQ(UnivariateDriftCalculator(config_).Validate().code(),
              absl::StatusCode::kFailedPrecondition);
}

TEST_F(UnivariateDriftCalculatorTest, RejectsDuplicateColumnsAndWorkers) {
    auto duplicate = config_;
    duplicate.columns.push_back({"x", FeatureType::kContinuous});
    EXPECT_FALSE(UnivariateDriftCalculator(duplicate).Validate().ok());

    auto no_workers = config_;
    no_workers.num_workers = 0;
    EXPECT_FALSE(UnivariateDriftCalculator(no_workers).Validate().ok());
}

TEST_F(UnivariateDriftCalculatorTest, RejectsInvalidOverrides) {
    auto unknown = config_;
    unknown.threshold_overrides["psi"] = ThresholdSpec::Constant(0.0, 1.0);
    EXPECT_FALSE(UnivariateDriftCalculator(unknown).Validate().ok());

    auto inverted = config_;
    inverted.threshold_overrides["wasserstein"] = ThresholdSpec::Constant(2.0, 1.0);
    EXPECT_FALSE(UnivariateDriftCalculator(inverted).Validate().ok());

    auto chunking = config_;
    chunking.chunking.count = 0;
    EXPECT_FALSE(UnivariateDriftCalculator(chunking).Validate().ok());
}

TEST_F(UnivariateDriftCalculatorTest, CalculateBeforeFit) {
    UnivariateDriftCalculator calculator(config_);
    auto result = calculator.Calculate(nullptr, reference_);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST_F(UnivariateDriftCalculatorTest, EmptyReference) {
    UnivariateDriftCalculator calculator(config_);
    auto fitted = calculator.Fit(ObservationTable{});
    ASSERT_FALSE(fitted.ok());
    EXPECT_EQ(fitted.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(UnivariateDriftCalculatorTest, EmptyAnalysis) {
    UnivariateDriftCalculator calculator(config_);
    auto fitted = calculator.Fit(reference_);
    ASSERT_TRUE(fitted.ok()) << fitted.status().message();

    auto result = calculator.Calculate(*fitted, ObservationTable{});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(UnivariateDriftCalculatorTest, MissingColumn) {
    config_.columns.push_back({"income", FeatureType::kContinuous});
    auto fitted = UnivariateDriftCalculator(config_).Fit(reference_);
    ASSERT_FALSE(fitted.ok());
    EXPECT_EQ(fitted.status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST_F(UnivariateDriftCalculatorTest, DeclaredTypeMismatch) {
    config_.columns = {{"x", FeatureType::kCategorical}};
    auto fitted = UnivariateDriftCalculator(config_).Fit(reference_);
    ASSERT_FALSE(fitted.ok());
    EXPECT_EQ(fitted.status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST_F(UnivariateDriftCalculatorTest, ReferenceColumnWithoutValues) {
    ObservationTable reference;
    ASSERT_TRUE(reference.AddContinuousColumn(
        "x", std::vector<double>(20, std::numeric_limits<double>::quiet_NaN())).ok());
    config_.columns = {{"x", FeatureType::kContinuous}};

    auto fitted = UnivariateDriftCalculator(config_).Fit(reference);
    ASSERT_FALSE(fitted.ok());
    EXPECT_EQ(fitted.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(fitted.status().message().find("'x'"), std::string::npos);
}

// =============================================================================
// Fit
// =============================================================================

TEST_F(UnivariateDriftCalculatorTest, FitProducesReferenceRows) {
    auto fitted = UnivariateDriftCalculator(config_).Fit(reference_);
    ASSERT_TRUE(fitted.ok()) << fitted.status().message();

    const auto& entries = (*fitted)->Entries();
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].column.name, "x");
    EXPECT_EQ(entries[0].method->Key(), "kolmogorov_smirnov");
    EXPECT_EQ(entries[3].column.name, "c");
    EXPECT_EQ(entries[3].method->Key(), "l_infinity");

    const DriftResult& reference = (*fitted)->ReferenceResult();
    EXPECT_EQ(reference.Size(), 40u);
    for (const auto& row : reference.Rows()) {
        EXPECT_EQ(row.chunk.period, Period::kReference);
        EXPECT_FALSE(std::isnan(row.value));
    }
}

TEST_F(UnivariateDriftCalculatorTest, ConstantThresholdIsClippedToDomain) {
    config_.threshold_overrides["kolmogorov_smirnov"] = ThresholdSpec::Constant(-1.0, 2.0);
    auto fitted = UnivariateDriftCalculator(config_).Fit(reference_);
    ASSERT_TRUE(fitted.ok());

    const ThresholdBounds* bounds = (*fitted)->Bounds("x", "kolmogorov_smirnov");
    ASSERT_NE(bounds, nullptr);
    EXPECT_EQ(bounds->lower, 0.0);
    EXPECT_EQ(bounds->upper, 1.0);
    EXPECT_TRUE(bounds->lower_clipped);
    EXPECT_TRUE(bounds->upper_clipped);

    EXPECT_EQ((*fitted)->Bounds("x", "chi2"), nullptr);
    EXPECT_EQ((*fitted)->Bounds("income", "wasserstein"), nullptr);
}

TEST_F(UnivariateDriftCalculatorTest, DefaultThresholdApplies) {
    config_.default_threshold = ThresholdSpec::Constant(std::nullopt, 0.5);
    config_.threshold_overrides["wasserstein"] = ThresholdSpec::Constant(std::nullopt, 7.0);
    auto fitted = UnivariateDriftCalculator(config_).Fit(reference_);
    ASSERT_TRUE(fitted.ok());

    EXPECT_EQ((*fitted)->Bounds("x", "kolmogorov_smirnov")->upper, 0.5);
    EXPECT_EQ((*fitted)->Bounds("x", "wasserstein")->upper, 7.0);
    EXPECT_EQ((*fitted)->Bounds("c", "chi2")->upper, 0.5);
}

TEST_F(UnivariateDriftCalculatorTest, SerializeState) {
    auto fitted = UnivariateDriftCalculator(config_).Fit(reference_);
    ASSERT_TRUE(fitted.ok());

    auto state = (*fitted)->SerializeState();
    ASSERT_TRUE(state.ok()) << state.status().message();

    auto json = nlohmann::json::parse(*state);
    ASSERT_EQ(json["entries"].size(), 4u);
    EXPECT_EQ(json["entries"][0]["column"], "x");
    EXPECT_EQ(json["entries"][0]["method"], "kolmogorov_smirnov");
    EXPECT_EQ(json["entries"][0]["threshold"]["type"], "standard_deviation");
    EXPECT_EQ(json["entries"][2]["fitted"]["reference_counts"]["a"], 500);
    EXPECT_EQ(json["chunking"]["count"], 10);
    EXPECT_EQ(json["reference_chunks"].size(), 10u);
}

// =============================================================================
// Calculate
// =============================================================================

TEST_F(UnivariateDriftCalculatorTest, RowsOrderedByChunkColumnMethod) {
    UnivariateDriftCalculator calculator(config_);
    auto fitted = calculator.Fit(reference_);
    ASSERT_TRUE(fitted.ok());

    auto analysis = MakeTable(Uniform(500, 0.0, 10.0, 7), Alternating(500, {"a", "b"}));
    config_.chunking.count = 5;
    auto result = calculator.Calculate(*fitted, analysis);
    ASSERT_TRUE(result.ok()) << result.status().message();

    // The fitted configuration (ten chunks) wins over later edits
    ASSERT_EQ(result->Size(), 40u);

    const std::vector<std::pair<std::string, std::string>> expected = {
        {"x", "kolmogorov_smirnov"}, {"x", "wasserstein"}, {"c", "chi2"}, {"c", "l_infinity"}};
    for (size_t i = 0; i < result->Size(); ++i) {
        const auto& row = result->Rows()[i];
        EXPECT_EQ(row.chunk.chunk_index, i / 4);
        EXPECT_EQ(row.chunk.period, Period::kAnalysis);
        EXPECT_EQ(row.column_name, expected[i % 4].first);
        EXPECT_EQ(row.method_key, expected[i % 4].second);
    }
    EXPECT_TRUE(result->Rows()[0].p_value.has_value());
    EXPECT_FALSE(result->Rows()[1].p_value.has_value());
}

TEST_F(UnivariateDriftCalculatorTest, SmallChunksAreLowConfidence) {
    UnivariateDriftCalculator calculator(config_);
    auto fitted = calculator.Fit(reference_);
    ASSERT_TRUE(fitted.ok());

    auto result = calculator.Calculate(*fitted, reference_);
    ASSERT_TRUE(result.ok());
    for (const auto& row : result->Rows()) {
        // 100-row chunks are below both the 500 and 300 row minimums
        EXPECT_TRUE(row.low_confidence);
        EXPECT_FALSE(row.warnings.empty());
    }
}

TEST_F(UnivariateDriftCalculatorTest, SmallChunksAreLoggedAsWarnings) {
    auto logger = GetLogger();
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256);
    sink->set_pattern("%l %v");
    logger->sinks().push_back(sink);

    UnivariateDriftCalculator calculator(config_);
    auto fitted = calculator.Fit(reference_);
    ASSERT_TRUE(fitted.ok());
    auto result = calculator.Calculate(*fitted, reference_);

    auto& sinks = logger->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
    ASSERT_TRUE(result.ok());

    size_t below_minimum = 0;
    for (const auto& line : sink->last_formatted()) {
        if (line.find("below the minimum") != std::string::npos) {
            EXPECT_EQ(line.rfind("warning", 0), 0u) << line;
            ++below_minimum;
        }
    }
    // One line per chunk and method pair that produced a low-confidence row
    EXPECT_EQ(below_minimum, result->Rows().size());
}

TEST_F(UnivariateDriftCalculatorTest, MinimumChunkSizeOverride) {
    config_.minimum_chunk_size_overrides["kolmogorov_smirnov"] = 50;
    UnivariateDriftCalculator calculator(config_);
    auto fitted = calculator.Fit(reference_);
    ASSERT_TRUE(fitted.ok());

    auto result = calculator.Calculate(*fitted, reference_);
    ASSERT_TRUE(result.ok());
    for (const auto& row : result->Filter(std::nullopt, {}, {"kolmogorov_smirnov"}).Rows()) {
        EXPECT_FALSE(row.low_confidence);
        EXPECT_TRUE(row.warnings.empty());
    }
    for (const auto& row : result->Filter(std::nullopt, {}, {"wasserstein"}).Rows()) {
        EXPECT_TRUE(row.low_confidence);
    }
}

TEST_F(UnivariateDriftCalculatorTest, ChunkWithoutValuesIsNaN) {
    UnivariateDriftCalculator calculator(config_);
    auto fitted = calculator.Fit(reference_);
    ASSERT_TRUE(fitted.ok());

    std::vector<double> x = Uniform(1000, 0.0, 10.0, 3);
    for (size_t i = 0; i < 100; ++i) {
        x[i] = std::numeric_limits<double>::quiet_NaN();
    }
    auto analysis = MakeTable(std::move(x), Alternating(1000, {"a", "b"}));

    auto result = calculator.Calculate(*fitted, analysis);
    ASSERT_TRUE(result.ok()) << result.status().message();

    const auto& first = result->Rows()[0];
    EXPECT_EQ(first.column_name, "x");
    EXPECT_TRUE(std::isnan(first.value));
    EXPECT_FALSE(first.p_value.has_value());
    EXPECT_FALSE(first.alert);
    EXPECT_TRUE(first.low_confidence);

    // Categorical rows of the same chunk are unaffected
    EXPECT_FALSE(std::isnan(result->Rows()[2].value));
}

TEST_F(UnivariateDriftCalculatorTest, DetectsCategoricalShift) {
    config_.categorical_methods = {"l_infinity"};
    config_.continuous_methods = {"wasserstein"};
    UnivariateDriftCalculator calculator(config_);
    auto fitted = calculator.Fit(reference_);
    ASSERT_TRUE(fitted.ok());

    // Every reference chunk is exactly half a, half b: bounds collapse to 0
    const ThresholdBounds* bounds = (*fitted)->Bounds("c", "l_infinity");
    ASSERT_NE(bounds, nullptr);
    EXPECT_NEAR(*bounds->upper, 0.0, 1e-12);

    auto analysis = MakeTable(Uniform(1000, 0.0, 10.0, 5), Alternating(1000, {"a", "b", "c"}));
    auto result = calculator.Calculate(*fitted, analysis);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->AlertCount("c", "l_infinity"), 10u);
}

TEST_F(UnivariateDriftCalculatorTest, ParallelMatchesSequential) {
    auto analysis = MakeTable(Uniform(1000, 2.0, 12.0, 9), Alternating(1000, {"b", "a", "a"}));

    UnivariateDriftCalculator sequential(config_);
    auto sequential_fitted = sequential.Fit(reference_);
    ASSERT_TRUE(sequential_fitted.ok());
    auto expected = sequential.Calculate(*sequential_fitted, analysis);
    ASSERT_TRUE(expected.ok());

    config_.num_workers = 4;
    UnivariateDriftCalculator parallel(config_);
    auto parallel_fitted = parallel.Fit(reference_);
    ASSERT_TRUE(parallel_fitted.ok());
    auto actual = parallel.Calculate(*parallel_fitted, analysis);
    ASSERT_TRUE(actual.ok());

    ASSERT_EQ(actual->Size(), expected->Size());
    for (size_t i = 0; i < actual->Size(); ++i) {
        const auto& a = actual->Rows()[i];
        const auto& e = expected->Rows()[i];
        EXPECT_EQ(a.chunk.key, e.chunk.key);
        EXPECT_EQ(a.column_name, e.column_name);
        EXPECT_EQ(a.method_key, e.method_key);
        EXPECT_DOUBLE_EQ(a.value, e.value);
        EXPECT_EQ(a.alert, e.alert);
    }
}

TEST_F(UnivariateDriftCalculatorTest, FittedValueIsReusable) {
    UnivariateDriftCalculator calculator(config_);
    auto fitted = calculator.Fit(reference_);
    ASSERT_TRUE(fitted.ok());

    auto first = calculator.Calculate(*fitted, reference_);
    auto second = calculator.Calculate(*fitted, reference_);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    ASSERT_EQ(first->Size(), second->Size());
    for (size_t i = 0; i < first->Size(); ++i) {
        EXPECT_DOUBLE_EQ(first->Rows()[i].value, second->Rows()[i].value);
    }
}

// =============================================================================
// CheckColumns
// =============================================================================

TEST(CheckColumnsTest, ReportsMissingAndMismatchedColumns) {
    ObservationTable table;
    ASSERT_TRUE(table.AddContinuousColumn("x", {1.0}).ok());

    EXPECT_TRUE(CheckColumns(table, {{"x", FeatureType::kContinuous}}).ok());
    EXPECT_EQ(CheckColumns(table, {{"y", FeatureType::kContinuous}}).code(),
              absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(CheckColumns(table, {{"x", FeatureType::kCategorical}}).code(),
              absl::StatusCode::kFailedPrecondition);
}

}  // namespace
}  // namespace driftwatch::drift
