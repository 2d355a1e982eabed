/// @file univariate_calculator.cpp
/// @brief Univariate drift calculator implementation

#include "drift/univariate_calculator.h"

#include <algorithm>
#include <unordered_set>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/thread_pool.h"
#include "drift/methods/method_factory.h"

namespace driftwatch::drift {

namespace {

const std::vector<std::string>& MethodKeysFor(const UnivariateDriftConfig& config,
                                              data::FeatureType type) {
    return type == data::FeatureType::kContinuous ? config.continuous_methods
                                                  : config.categorical_methods;
}

/// Create (column, method) pairs in column order, then method order
absl::StatusOr<std::vector<FittedColumnMethod>> BuildEntries(const UnivariateDriftConfig& config) {
    std::vector<FittedColumnMethod> entries;
    for (const auto& column : config.columns) {
        for (const auto& key : MethodKeysFor(config, column.type)) {
            DRIFTWATCH_ASSIGN_OR_RETURN(std::unique_ptr<Method> method,
                                        CreateMethod(key, column.type));

            auto size_override = config.minimum_chunk_size_overrides.find(key);
            if (size_override != config.minimum_chunk_size_overrides.end()) {
                method->SetMinimumChunkSize(size_override->second);
            }

            FittedColumnMethod entry;
            entry.column = column;
            auto threshold_override = config.threshold_overrides.find(key);
            if (threshold_override != config.threshold_overrides.end()) {
                entry.threshold_spec = threshold_override->second;
            } else if (config.default_threshold.has_value()) {
                entry.threshold_spec = *config.default_threshold;
            } else {
                entry.threshold_spec = method->DefaultThreshold();
            }
            entry.method = std::move(method);
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

Sample SliceOf(const data::ObservationTable& table, const data::Column& column,
               size_t begin, size_t end) {
    if (column.Type() == data::FeatureType::kContinuous) {
        return Sample(table.ContinuousSlice(column, begin, end));
    }
    return Sample(table.CategoricalSlice(column, begin, end));
}

bool IsEmpty(const Sample& sample) {
    return std::visit([](const auto& values) { return values.empty(); }, sample);
}

absl::StatusOr<DriftResultRow> EvaluateChunk(const data::ObservationTable& table,
                                             const chunking::Chunk& chunk,
                                             const FittedColumnMethod& entry) {
    DriftResultRow row;
    row.chunk = chunk;
    row.column_name = entry.column.name;
    row.method_key = entry.method->Key();

    const size_t minimum = entry.method->MinimumChunkSize();
    if (minimum > 0 && chunk.Size() < minimum) {
        row.low_confidence = true;
        row.warnings.push_back(absl::StrCat("Chunk has ", chunk.Size(),
                                            " rows, below the minimum of ", minimum,
                                            " for ", entry.method->DisplayName()));
        DRIFTWATCH_LOG_WARN("Chunk {}: {} rows, below the minimum of {} for {} on column '{}'",
                            chunk.key, chunk.Size(), minimum, entry.method->Key(),
                            entry.column.name);
    }

    const data::Column* column = table.FindColumn(entry.column.name);
    if (column == nullptr) {
        return MakeError(ErrorCode::kFailedPrecondition,
                         absl::StrCat("Column '", entry.column.name, "' not found"));
    }

    const Sample sample = SliceOf(table, *column, chunk.start_index, chunk.end_index);
    if (IsEmpty(sample)) {
        row.low_confidence = true;
        row.warnings.push_back(absl::StrCat("Column '", entry.column.name,
                                            "' has no non-missing values in this chunk"));
        DRIFTWATCH_LOG_WARN("Chunk {}: column '{}' has no non-missing values, {} set to NaN",
                            chunk.key, entry.column.name, entry.method->Key());
        return row;
    }

    DRIFTWATCH_ASSIGN_OR_RETURN(MethodValue value, entry.fitted->Calculate(sample));
    row.value = value.value;
    row.p_value = value.p_value;

    DRIFTWATCH_LOG_TRACE("Chunk {} column '{}' {}: {}", chunk.key, entry.column.name,
                         entry.method->Key(), row.value);
    return row;
}

/// Rows for every (chunk, entry) pair, chunk-major
absl::StatusOr<std::vector<DriftResultRow>> EvaluateChunks(
    const data::ObservationTable& table,
    const std::vector<chunking::Chunk>& chunks,
    const std::vector<FittedColumnMethod>& entries,
    size_t num_workers) {

    const size_t count = chunks.size() * entries.size();
    std::vector<absl::StatusOr<DriftResultRow>> slots(
        count, absl::StatusOr<DriftResultRow>(absl::UnknownError("Not evaluated")));

    auto evaluate = [&](size_t i) {
        slots[i] = EvaluateChunk(table, chunks[i / entries.size()], entries[i % entries.size()]);
    };

    if (num_workers > 1 && count > 1) {
        ThreadPool pool(std::min(num_workers, count));
        pool.ParallelFor(count, evaluate);
    } else {
        for (size_t i = 0; i < count; ++i) {
            evaluate(i);
        }
    }

    std::vector<DriftResultRow> rows;
    rows.reserve(count);
    for (auto& slot : slots) {
        if (!slot.ok()) {
            return slot.status();
        }
        rows.push_back(*std::move(slot));
    }
    return rows;
}

void ApplyThresholds(std::vector<DriftResultRow>& rows,
                     const std::vector<FittedColumnMethod>& entries) {
    for (size_t i = 0; i < rows.size(); ++i) {
        const ThresholdBounds& bounds = entries[i % entries.size()].bounds;
        rows[i].threshold = bounds;
        rows[i].alert = IsAlert(rows[i].value, bounds);
    }
}

nlohmann::json OptionalToJson(const std::optional<double>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

absl::Status CheckColumns(const data::ObservationTable& table,
                          const std::vector<ColumnSpec>& columns) {
    for (const auto& spec : columns) {
        const data::Column* column = table.FindColumn(spec.name);
        if (column == nullptr) {
            return MakeError(ErrorCode::kFailedPrecondition,
                             absl::StrCat("Column '", spec.name, "' not found in data"));
        }
        if (column->Type() != spec.type) {
            return FeatureTypeMismatchError(absl::StrCat(
                "Column '", spec.name, "' is declared ", std::string(data::FeatureTypeToString(spec.type)),
                " but holds ", std::string(data::FeatureTypeToString(column->Type())), " values"));
        }
    }
    return absl::OkStatus();
}

// =============================================================================
// FittedDriftCalculator
// =============================================================================

const ThresholdBounds* FittedDriftCalculator::Bounds(std::string_view column_name,
                                                     std::string_view method_key) const {
    for (const auto& entry : entries_) {
        if (entry.column.name == column_name && entry.method->Key() == method_key) {
            return &entry.bounds;
        }
    }
    return nullptr;
}

nlohmann::json FittedDriftCalculator::ToJson() const {
    nlohmann::json state;

    nlohmann::json columns = nlohmann::json::array();
    for (const auto& column : config_.columns) {
        columns.push_back(nlohmann::json{
            {"name", column.name},
            {"type", std::string(data::FeatureTypeToString(column.type))},
        });
    }
    state["columns"] = columns;

    state["chunking"] = {
        {"strategy", std::string(chunking::ChunkingStrategyToString(config_.chunking.strategy))},
        {"count", config_.chunking.count},
        {"size", config_.chunking.size},
        {"keep_incomplete", config_.chunking.keep_incomplete},
        {"period", config_.chunking.period},
        {"minimum_chunk_size", config_.chunking.minimum_chunk_size},
    };

    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : entries_) {
        auto created = CreateThreshold(entry.threshold_spec);
        nlohmann::json j;
        j["column"] = entry.column.name;
        j["method"] = entry.method->Key();
        j["minimum_chunk_size"] = entry.method->MinimumChunkSize();
        j["threshold"] = created.ok() ? (*created)->ToJson() : nlohmann::json(nullptr);
        j["lower_threshold"] = OptionalToJson(entry.bounds.lower);
        j["upper_threshold"] = OptionalToJson(entry.bounds.upper);
        j["lower_clipped"] = entry.bounds.lower_clipped;
        j["upper_clipped"] = entry.bounds.upper_clipped;
        j["fitted"] = entry.fitted->ToJson();
        entries.push_back(std::move(j));
    }
    state["entries"] = entries;
    state["reference_chunks"] = reference_result_.ChunkKeys();
    return state;
}

absl::StatusOr<std::string> FittedDriftCalculator::SerializeState() const {
    try {
        return ToJson().dump(2);
    } catch (const nlohmann::json::exception& e) {
        return absl::InternalError(absl::StrCat("Failed to serialize fitted state: ", e.what()));
    }
}

// =============================================================================
// UnivariateDriftCalculator
// =============================================================================

UnivariateDriftCalculator::UnivariateDriftCalculator(UnivariateDriftConfig config)
    : config_(std::move(config)) {}

absl::Status UnivariateDriftCalculator::Validate() const {
    if (config_.columns.empty()) {
        return ConfigurationError("No columns configured for drift calculation");
    }
    if (config_.num_workers == 0) {
        return ConfigurationError("num_workers must be at least 1");
    }

    std::unordered_set<std::string> names;
    for (const auto& column : config_.columns) {
        if (!names.insert(column.name).second) {
            return ConfigurationError(absl::StrCat("Column '", column.name, "' configured twice"));
        }
        const auto& keys = MethodKeysFor(config_, column.type);
        if (keys.empty()) {
            return ConfigurationError(absl::StrCat(
                "No methods configured for ", std::string(data::FeatureTypeToString(column.type)),
                " column '", column.name, "'"));
        }
        for (const auto& key : keys) {
            if (!IsKnownMethodKey(key)) {
                return ConfigurationError(absl::StrCat("Unknown drift method '", key, "'"));
            }
            if (!SupportsFeatureType(key, column.type)) {
                return FeatureTypeMismatchError(absl::StrCat(
                    "Method '", key, "' does not support ", std::string(data::FeatureTypeToString(column.type)),
                    " column '", column.name, "'"));
            }
        }
    }

    for (const auto& [key, spec] : config_.threshold_overrides) {
        if (!IsKnownMethodKey(key)) {
            return ConfigurationError(absl::StrCat("Threshold override for unknown method '",
                                                   key, "'"));
        }
        DRIFTWATCH_RETURN_IF_ERROR(CreateThreshold(spec).status());
    }
    if (config_.default_threshold.has_value()) {
        DRIFTWATCH_RETURN_IF_ERROR(CreateThreshold(*config_.default_threshold).status());
    }
    for (const auto& [key, size] : config_.minimum_chunk_size_overrides) {
        if (!IsKnownMethodKey(key)) {
            return ConfigurationError(absl::StrCat("Minimum chunk size override for unknown method '",
                                                   key, "'"));
        }
    }

    return chunking::CreateChunker(config_.chunking).status();
}

absl::StatusOr<std::shared_ptr<const FittedDriftCalculator>> UnivariateDriftCalculator::Fit(
    const data::ObservationTable& reference) const {

    DRIFTWATCH_RETURN_IF_ERROR(Validate());
    if (reference.Empty()) {
        return EmptyDataError("Reference data is empty");
    }
    DRIFTWATCH_RETURN_IF_ERROR(CheckColumns(reference, config_.columns));

    DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<FittedColumnMethod> entries, BuildEntries(config_));
    DRIFTWATCH_ASSIGN_OR_RETURN(std::unique_ptr<chunking::Chunker> chunker,
                                chunking::CreateChunker(config_.chunking));
    DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<chunking::Chunk> chunks,
                                chunker->Split(reference, data::Period::kReference));

    // Methods learn from the full reference column, not per chunk
    for (auto& entry : entries) {
        const data::Column* column = reference.FindColumn(entry.column.name);
        const Sample sample = SliceOf(reference, *column, 0, reference.RowCount() - 1);
        auto fitted = entry.method->Fit(sample);
        if (!fitted.ok()) {
            return absl::Status(fitted.status().code(),
                                absl::StrCat("Column '", entry.column.name, "': ",
                                             fitted.status().message()));
        }
        entry.fitted = *std::move(fitted);
    }

    DRIFTWATCH_ASSIGN_OR_RETURN(
        std::vector<DriftResultRow> rows,
        EvaluateChunks(reference, chunks, entries, config_.num_workers));

    for (size_t e = 0; e < entries.size(); ++e) {
        std::vector<double> values;
        values.reserve(chunks.size());
        for (size_t c = 0; c < chunks.size(); ++c) {
            values.push_back(rows[c * entries.size() + e].value);
        }
        DRIFTWATCH_ASSIGN_OR_RETURN(std::unique_ptr<Threshold> threshold,
                                    CreateThreshold(entries[e].threshold_spec));
        entries[e].bounds = FitThreshold(*threshold, values, entries[e].method->Limits());
        DRIFTWATCH_LOG_DEBUG("Column '{}' {}: {} threshold fitted on {} reference chunks",
                             entries[e].column.name, entries[e].method->Key(),
                             threshold->Name(), values.size());
    }
    ApplyThresholds(rows, entries);

    DRIFTWATCH_LOG_INFO("Fitted univariate drift calculator: {} columns, {} column/method pairs, "
                        "{} reference rows in {} chunks",
                        config_.columns.size(), entries.size(), reference.RowCount(),
                        chunks.size());

    return std::make_shared<const FittedDriftCalculator>(config_, std::move(entries),
                                                         DriftResult(std::move(rows)));
}

absl::StatusOr<DriftResult> UnivariateDriftCalculator::Calculate(
    const std::shared_ptr<const FittedDriftCalculator>& fitted,
    const data::ObservationTable& table) const {

    if (fitted == nullptr) {
        return NotFittedError("Calculate called before Fit; fit the calculator on reference data");
    }
    if (table.Empty()) {
        return EmptyDataError("Data to calculate drift on is empty");
    }

    const UnivariateDriftConfig& config = fitted->Config();
    DRIFTWATCH_RETURN_IF_ERROR(CheckColumns(table, config.columns));

    DRIFTWATCH_ASSIGN_OR_RETURN(std::unique_ptr<chunking::Chunker> chunker,
                                chunking::CreateChunker(config.chunking));
    DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<chunking::Chunk> chunks,
                                chunker->Split(table, data::Period::kAnalysis));

    DRIFTWATCH_ASSIGN_OR_RETURN(
        std::vector<DriftResultRow> rows,
        EvaluateChunks(table, chunks, fitted->Entries(), config.num_workers));
    ApplyThresholds(rows, fitted->Entries());

    DriftResult result(std::move(rows));
    DRIFTWATCH_LOG_INFO("Calculated univariate drift on {} rows in {} chunks: {} alerts",
                        table.RowCount(), chunks.size(), result.AlertCount());
    return result;
}

}  // namespace driftwatch::drift
