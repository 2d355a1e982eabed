/// @file drift_result.cpp
/// @brief Drift result implementation

#include "drift/drift_result.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include <absl/time/time.h>

namespace driftwatch::drift {

namespace {

bool Contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

template <typename Getter>
std::vector<std::string> DistinctInOrder(const std::vector<DriftResultRow>& rows, Getter get) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& row : rows) {
        const std::string& value = get(row);
        if (seen.insert(value).second) {
            out.push_back(value);
        }
    }
    return out;
}

nlohmann::json OptionalToJson(const std::optional<double>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json DateToJson(const std::optional<data::Timestamp>& date) {
    if (!date.has_value()) {
        return nullptr;
    }
    return absl::FormatTime("%Y-%m-%dT%H:%M:%E6SZ", absl::FromChrono(*date),
                            absl::UTCTimeZone());
}

}  // namespace

DriftResult DriftResult::Filter(std::optional<data::Period> period,
                                const std::vector<std::string>& column_names,
                                const std::vector<std::string>& method_keys) const {
    std::vector<DriftResultRow> rows;
    for (const auto& row : rows_) {
        if (period.has_value() && row.chunk.period != *period) {
            continue;
        }
        if (!column_names.empty() && !Contains(column_names, row.column_name)) {
            continue;
        }
        if (!method_keys.empty() && !Contains(method_keys, row.method_key)) {
            continue;
        }
        rows.push_back(row);
    }
    return DriftResult(std::move(rows));
}

size_t DriftResult::AlertCount(std::string_view column_name, std::string_view method_key) const {
    return static_cast<size_t>(std::count_if(rows_.begin(), rows_.end(), [&](const auto& row) {
        return row.alert &&
               (column_name.empty() || row.column_name == column_name) &&
               (method_key.empty() || row.method_key == method_key);
    }));
}

std::vector<std::string> DriftResult::ColumnNames() const {
    return DistinctInOrder(rows_, [](const DriftResultRow& row) -> const std::string& {
        return row.column_name;
    });
}

std::vector<std::string> DriftResult::MethodKeys() const {
    return DistinctInOrder(rows_, [](const DriftResultRow& row) -> const std::string& {
        return row.method_key;
    });
}

std::vector<std::string> DriftResult::ChunkKeys() const {
    return DistinctInOrder(rows_, [](const DriftResultRow& row) -> const std::string& {
        return row.chunk.key;
    });
}

DriftResult DriftResult::WithReference(const DriftResult& reference) const {
    std::vector<DriftResultRow> rows;
    rows.reserve(reference.rows_.size() + rows_.size());
    rows.insert(rows.end(), reference.rows_.begin(), reference.rows_.end());
    rows.insert(rows.end(), rows_.begin(), rows_.end());
    return DriftResult(std::move(rows));
}

nlohmann::json DriftResult::ToJson() const {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : rows_) {
        nlohmann::json j;
        j["chunk_key"] = row.chunk.key;
        j["chunk_index"] = row.chunk.chunk_index;
        j["start_index"] = row.chunk.start_index;
        j["end_index"] = row.chunk.end_index;
        j["start_date"] = DateToJson(row.chunk.start_date);
        j["end_date"] = DateToJson(row.chunk.end_date);
        j["period"] = std::string(data::PeriodToString(row.chunk.period));
        j["column"] = row.column_name;
        j["method"] = row.method_key;
        j["value"] = std::isnan(row.value) ? nlohmann::json(nullptr) : nlohmann::json(row.value);
        j["p_value"] = OptionalToJson(row.p_value);
        j["lower_threshold"] = OptionalToJson(row.threshold.lower);
        j["upper_threshold"] = OptionalToJson(row.threshold.upper);
        j["alert"] = row.alert;
        j["low_confidence"] = row.low_confidence;
        j["warnings"] = row.warnings;
        rows.push_back(std::move(j));
    }
    return rows;
}

}  // namespace driftwatch::drift
