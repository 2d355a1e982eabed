/// @file observation_table.cpp
/// @brief Observation table implementation

#include "data/observation_table.h"

#include <algorithm>
#include <cmath>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace driftwatch::data {

std::string_view FeatureTypeToString(FeatureType type) {
    switch (type) {
        case FeatureType::kContinuous:
            return "continuous";
        case FeatureType::kCategorical:
            return "categorical";
        default:
            return "unknown";
    }
}

absl::StatusOr<FeatureType> ParseFeatureType(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(std::string(name));
    if (lowered == "continuous") {
        return FeatureType::kContinuous;
    }
    if (lowered == "categorical") {
        return FeatureType::kCategorical;
    }
    return ConfigurationError(absl::StrCat("Unknown feature type '", std::string(name),
                                           "', expected 'continuous' or 'categorical'"));
}

std::string_view PeriodToString(Period period) {
    switch (period) {
        case Period::kReference:
            return "reference";
        case Period::kAnalysis:
            return "analysis";
        default:
            return "unknown";
    }
}

size_t Column::Size() const {
    return std::visit([](const auto& v) { return v.size(); }, values);
}

size_t Column::CountMissing(size_t begin, size_t end) const {
    end = std::min(end, Size());
    size_t missing = 0;
    if (const auto* continuous = std::get_if<ContinuousValues>(&values)) {
        for (size_t i = begin; i < end; ++i) {
            if (!std::isfinite((*continuous)[i])) {
                ++missing;
            }
        }
    } else {
        const auto& categorical = std::get<CategoricalValues>(values);
        for (size_t i = begin; i < end; ++i) {
            if (!categorical[i].has_value()) {
                ++missing;
            }
        }
    }
    return missing;
}

absl::Status ObservationTable::CheckLength(size_t length, std::string_view what) {
    if (!has_shape_) {
        row_count_ = length;
        has_shape_ = true;
        return absl::OkStatus();
    }
    if (length != row_count_) {
        return absl::InvalidArgumentError(absl::StrCat(
            std::string(what), " has ", length, " rows but the table has ", row_count_));
    }
    return absl::OkStatus();
}

absl::Status ObservationTable::AddContinuousColumn(std::string name, ContinuousValues values) {
    if (column_index_.count(name) > 0) {
        return absl::InvalidArgumentError(absl::StrCat("Duplicate column '", name, "'"));
    }
    DRIFTWATCH_RETURN_IF_ERROR(CheckLength(values.size(), absl::StrCat("Column '", name, "'")));
    column_index_[name] = columns_.size();
    columns_.push_back(Column{std::move(name), std::move(values)});
    return absl::OkStatus();
}

absl::Status ObservationTable::AddCategoricalColumn(std::string name, CategoricalValues values) {
    if (column_index_.count(name) > 0) {
        return absl::InvalidArgumentError(absl::StrCat("Duplicate column '", name, "'"));
    }
    DRIFTWATCH_RETURN_IF_ERROR(CheckLength(values.size(), absl::StrCat("Column '", name, "'")));
    column_index_[name] = columns_.size();
    columns_.push_back(Column{std::move(name), std::move(values)});
    return absl::OkStatus();
}

absl::Status ObservationTable::SetTimestamps(std::vector<Timestamp> timestamps) {
    DRIFTWATCH_RETURN_IF_ERROR(CheckLength(timestamps.size(), "Timestamp column"));
    timestamps_ = std::move(timestamps);
    has_timestamps_ = true;
    return absl::OkStatus();
}

absl::Status ObservationTable::SetPeriods(std::vector<Period> periods) {
    DRIFTWATCH_RETURN_IF_ERROR(CheckLength(periods.size(), "Period column"));
    periods_ = std::move(periods);
    return absl::OkStatus();
}

void ObservationTable::SetPeriod(Period period) {
    periods_.assign(row_count_, period);
}

const Column* ObservationTable::FindColumn(std::string_view name) const {
    auto it = column_index_.find(std::string(name));
    if (it == column_index_.end()) {
        return nullptr;
    }
    return &columns_[it->second];
}

std::vector<double> ObservationTable::ContinuousSlice(
    const Column& column, size_t begin, size_t end) const {
    std::vector<double> out;
    const auto* values = std::get_if<ContinuousValues>(&column.values);
    if (values == nullptr || values->empty() || begin > end) {
        return out;
    }
    end = std::min(end, values->size() - 1);
    out.reserve(end - begin + 1);
    for (size_t i = begin; i <= end; ++i) {
        if (std::isfinite((*values)[i])) {
            out.push_back((*values)[i]);
        }
    }
    return out;
}

std::vector<std::string> ObservationTable::CategoricalSlice(
    const Column& column, size_t begin, size_t end) const {
    std::vector<std::string> out;
    const auto* values = std::get_if<CategoricalValues>(&column.values);
    if (values == nullptr || values->empty() || begin > end) {
        return out;
    }
    end = std::min(end, values->size() - 1);
    out.reserve(end - begin + 1);
    for (size_t i = begin; i <= end; ++i) {
        if ((*values)[i].has_value()) {
            out.push_back(*(*values)[i]);
        }
    }
    return out;
}

bool ObservationTable::TimestampsSorted() const {
    return std::is_sorted(timestamps_.begin(), timestamps_.end());
}

absl::StatusOr<ObservationTable> ObservationTable::Concat(const ObservationTable& first,
                                                          const ObservationTable& second,
                                                          Period default_first,
                                                          Period default_second) {
    if (first.columns_.size() != second.columns_.size()) {
        return absl::InvalidArgumentError("Cannot concatenate tables with different column counts");
    }
    if (first.HasTimestamps() != second.HasTimestamps()) {
        return absl::InvalidArgumentError(
            "Cannot concatenate a table with timestamps and a table without");
    }

    ObservationTable out;
    for (const auto& column : first.columns_) {
        const Column* other = second.FindColumn(column.name);
        if (other == nullptr) {
            return absl::InvalidArgumentError(
                absl::StrCat("Column '", column.name, "' missing from second table"));
        }
        if (other->Type() != column.Type()) {
            return FeatureTypeMismatchError(
                absl::StrCat("Column '", column.name, "' has different types in both tables"));
        }
        if (column.Type() == FeatureType::kContinuous) {
            ContinuousValues merged = std::get<ContinuousValues>(column.values);
            const auto& tail = std::get<ContinuousValues>(other->values);
            merged.insert(merged.end(), tail.begin(), tail.end());
            DRIFTWATCH_RETURN_IF_ERROR(out.AddContinuousColumn(column.name, std::move(merged)));
        } else {
            CategoricalValues merged = std::get<CategoricalValues>(column.values);
            const auto& tail = std::get<CategoricalValues>(other->values);
            merged.insert(merged.end(), tail.begin(), tail.end());
            DRIFTWATCH_RETURN_IF_ERROR(out.AddCategoricalColumn(column.name, std::move(merged)));
        }
    }

    if (first.HasTimestamps()) {
        std::vector<Timestamp> timestamps = first.timestamps_;
        timestamps.insert(timestamps.end(), second.timestamps_.begin(), second.timestamps_.end());
        DRIFTWATCH_RETURN_IF_ERROR(out.SetTimestamps(std::move(timestamps)));
    }

    std::vector<Period> periods;
    periods.reserve(first.row_count_ + second.row_count_);
    if (first.HasPeriods()) {
        periods = first.periods_;
    } else {
        periods.assign(first.row_count_, default_first);
    }
    if (second.HasPeriods()) {
        periods.insert(periods.end(), second.periods_.begin(), second.periods_.end());
    } else {
        periods.insert(periods.end(), second.row_count_, default_second);
    }
    DRIFTWATCH_RETURN_IF_ERROR(out.SetPeriods(std::move(periods)));

    return out;
}

}  // namespace driftwatch::data
