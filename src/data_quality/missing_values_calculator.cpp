/// @file missing_values_calculator.cpp
/// @brief Missing-values calculator implementation

#include "data_quality/missing_values_calculator.h"

#include <unordered_set>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "drift/calculator_config.h"

namespace driftwatch::data_quality {

namespace {

absl::Status CheckColumnsPresent(const data::ObservationTable& table,
                                 const std::vector<std::string>& column_names) {
    for (const auto& name : column_names) {
        if (table.FindColumn(name) == nullptr) {
            return MakeError(ErrorCode::kFailedPrecondition,
                             absl::StrCat("Column '", name, "' not found in data"));
        }
    }
    return absl::OkStatus();
}

/// Rows for every (chunk, column) pair, chunk-major, without thresholds
std::vector<drift::DriftResultRow> Evaluate(const data::ObservationTable& table,
                                            const std::vector<chunking::Chunk>& chunks,
                                            const MissingValuesConfig& config) {
    std::vector<drift::DriftResultRow> rows;
    rows.reserve(chunks.size() * config.column_names.size());
    for (const auto& chunk : chunks) {
        for (const auto& name : config.column_names) {
            const data::Column* column = table.FindColumn(name);
            const size_t missing = column->CountMissing(chunk.start_index, chunk.end_index + 1);

            drift::DriftResultRow row;
            row.chunk = chunk;
            row.column_name = name;
            row.method_key = std::string(config.MetricKey());
            row.value = config.normalize
                            ? static_cast<double>(missing) / static_cast<double>(chunk.Size())
                            : static_cast<double>(missing);
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

void ApplyThresholds(std::vector<drift::DriftResultRow>& rows,
                     const std::vector<drift::ThresholdBounds>& bounds) {
    for (size_t i = 0; i < rows.size(); ++i) {
        rows[i].threshold = bounds[i % bounds.size()];
        rows[i].alert = drift::IsAlert(rows[i].value, rows[i].threshold);
    }
}

}  // namespace

nlohmann::json FittedMissingValuesCalculator::ToJson() const {
    nlohmann::json columns = nlohmann::json::array();
    for (size_t i = 0; i < config_.column_names.size(); ++i) {
        const auto& b = bounds_[i];
        columns.push_back(nlohmann::json{
            {"column", config_.column_names[i]},
            {"lower_threshold", b.lower.has_value() ? nlohmann::json(*b.lower) : nlohmann::json(nullptr)},
            {"upper_threshold", b.upper.has_value() ? nlohmann::json(*b.upper) : nlohmann::json(nullptr)},
        });
    }
    return nlohmann::json{
        {"metric", std::string(config_.MetricKey())},
        {"columns", columns},
        {"reference_chunks", reference_result_.ChunkKeys()},
    };
}

MissingValuesCalculator::MissingValuesCalculator(MissingValuesConfig config)
    : config_(std::move(config)) {}

absl::Status MissingValuesCalculator::Validate() const {
    if (config_.column_names.empty()) {
        return ConfigurationError("No columns configured for missing-value calculation");
    }
    std::unordered_set<std::string> names;
    for (const auto& name : config_.column_names) {
        if (!names.insert(name).second) {
            return ConfigurationError(absl::StrCat("Column '", name, "' configured twice"));
        }
    }
    DRIFTWATCH_RETURN_IF_ERROR(drift::CreateThreshold(config_.threshold).status());
    return chunking::CreateChunker(config_.chunking).status();
}

absl::StatusOr<std::shared_ptr<const FittedMissingValuesCalculator>> MissingValuesCalculator::Fit(
    const data::ObservationTable& reference) const {

    DRIFTWATCH_RETURN_IF_ERROR(Validate());
    if (reference.Empty()) {
        return EmptyDataError("Reference data is empty");
    }
    DRIFTWATCH_RETURN_IF_ERROR(CheckColumnsPresent(reference, config_.column_names));

    DRIFTWATCH_ASSIGN_OR_RETURN(std::unique_ptr<chunking::Chunker> chunker,
                                chunking::CreateChunker(config_.chunking));
    DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<chunking::Chunk> chunks,
                                chunker->Split(reference, data::Period::kReference));
    DRIFTWATCH_ASSIGN_OR_RETURN(std::unique_ptr<drift::Threshold> threshold,
                                drift::CreateThreshold(config_.threshold));

    std::vector<drift::DriftResultRow> rows = Evaluate(reference, chunks, config_);

    const size_t num_columns = config_.column_names.size();
    std::vector<drift::ThresholdBounds> bounds;
    bounds.reserve(num_columns);
    for (size_t c = 0; c < num_columns; ++c) {
        std::vector<double> values;
        values.reserve(chunks.size());
        for (size_t k = 0; k < chunks.size(); ++k) {
            values.push_back(rows[k * num_columns + c].value);
        }
        bounds.push_back(drift::FitThreshold(*threshold, values, config_.Limits()));
    }
    ApplyThresholds(rows, bounds);

    DRIFTWATCH_LOG_INFO("Fitted missing-values calculator: {} columns, {} reference chunks",
                        num_columns, chunks.size());

    return std::make_shared<const FittedMissingValuesCalculator>(
        config_, std::move(bounds), drift::DriftResult(std::move(rows)));
}

absl::StatusOr<drift::DriftResult> MissingValuesCalculator::Calculate(
    const std::shared_ptr<const FittedMissingValuesCalculator>& fitted,
    const data::ObservationTable& table) const {

    if (fitted == nullptr) {
        return NotFittedError("Calculate called before Fit; fit the calculator on reference data");
    }
    if (table.Empty()) {
        return EmptyDataError("Data to calculate missing values on is empty");
    }

    const MissingValuesConfig& config = fitted->Config();
    DRIFTWATCH_RETURN_IF_ERROR(CheckColumnsPresent(table, config.column_names));

    DRIFTWATCH_ASSIGN_OR_RETURN(std::unique_ptr<chunking::Chunker> chunker,
                                chunking::CreateChunker(config.chunking));
    DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<chunking::Chunk> chunks,
                                chunker->Split(table, data::Period::kAnalysis));

    std::vector<drift::DriftResultRow> rows = Evaluate(table, chunks, config);
    ApplyThresholds(rows, fitted->Bounds());

    drift::DriftResult result(std::move(rows));
    DRIFTWATCH_LOG_INFO("Calculated missing values on {} rows in {} chunks: {} alerts",
                        table.RowCount(), chunks.size(), result.AlertCount());
    return result;
}

absl::StatusOr<MissingValuesConfig> MissingValuesConfigFromYaml(const Config& config) {
    MissingValuesConfig out;
    DRIFTWATCH_ASSIGN_OR_RETURN(out.chunking, drift::ChunkerSpecFromConfig(config));

    out.column_names = config.GetStringList("missing_values.columns");
    out.normalize = config.GetBool("missing_values.normalize", true);

    if (auto threshold = config.GetSubNode("missing_values.threshold")) {
        DRIFTWATCH_ASSIGN_OR_RETURN(out.threshold, drift::ThresholdSpecFromYaml(*threshold));
    }

    DRIFTWATCH_RETURN_IF_ERROR(MissingValuesCalculator(out).Validate());
    return out;
}

}  // namespace driftwatch::data_quality
