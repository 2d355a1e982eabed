#pragma once

/// @file observation_table.h
/// @brief Column-oriented, ordered table of model inputs to monitor

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace driftwatch::data {

using Timestamp = std::chrono::system_clock::time_point;

/// @brief Kind of values stored in a feature column
enum class FeatureType {
    kContinuous,
    kCategorical
};

/// @brief Convert feature type to string
std::string_view FeatureTypeToString(FeatureType type);

/// @brief Parse "continuous" / "categorical"
absl::StatusOr<FeatureType> ParseFeatureType(std::string_view name);

/// @brief Data period a row belongs to
enum class Period {
    kReference,
    kAnalysis
};

/// @brief Convert period to string
std::string_view PeriodToString(Period period);

/// Continuous values, NaN or an infinity marks a missing value
using ContinuousValues = std::vector<double>;

/// Categorical values, nullopt marks a missing value
using CategoricalValues = std::vector<std::optional<std::string>>;

/// @brief A named feature column
struct Column {
    std::string name;
    std::variant<ContinuousValues, CategoricalValues> values;

    FeatureType Type() const {
        return std::holds_alternative<ContinuousValues>(values)
                   ? FeatureType::kContinuous
                   : FeatureType::kCategorical;
    }

    size_t Size() const;

    /// @brief Number of missing values in rows [begin, end)
    size_t CountMissing(size_t begin, size_t end) const;
};

/// @brief Ordered observation table
///
/// Rows are addressed by position; chunkers never reorder them. Every column,
/// the timestamp vector and the period vector (when present) have the same
/// length.
class ObservationTable {
public:
    ObservationTable() = default;

    /// @brief Add a continuous column; fails on duplicate names or length mismatch
    absl::Status AddContinuousColumn(std::string name, ContinuousValues values);

    /// @brief Add a categorical column; fails on duplicate names or length mismatch
    absl::Status AddCategoricalColumn(std::string name, CategoricalValues values);

    /// @brief Attach per-row timestamps
    absl::Status SetTimestamps(std::vector<Timestamp> timestamps);

    /// @brief Attach per-row period labels
    absl::Status SetPeriods(std::vector<Period> periods);

    /// @brief Label every row with the same period
    void SetPeriod(Period period);

    size_t RowCount() const { return row_count_; }
    bool Empty() const { return row_count_ == 0; }

    bool HasTimestamps() const { return has_timestamps_; }
    bool HasPeriods() const { return !periods_.empty(); }

    const std::vector<Timestamp>& Timestamps() const { return timestamps_; }
    const std::vector<Period>& Periods() const { return periods_; }
    const std::vector<Column>& Columns() const { return columns_; }

    /// @brief Find a column by name
    const Column* FindColumn(std::string_view name) const;

    /// @brief Non-missing continuous values in rows [begin, end]
    std::vector<double> ContinuousSlice(const Column& column, size_t begin, size_t end) const;

    /// @brief Non-missing categorical values in rows [begin, end]
    std::vector<std::string> CategoricalSlice(const Column& column, size_t begin, size_t end) const;

    /// @brief Whether timestamps are non-decreasing
    bool TimestampsSorted() const;

    /// @brief Append the rows of two tables with identical schemas
    ///
    /// Rows without period labels take `default_first` / `default_second`.
    static absl::StatusOr<ObservationTable> Concat(const ObservationTable& first,
                                                   const ObservationTable& second,
                                                   Period default_first = Period::kReference,
                                                   Period default_second = Period::kAnalysis);

private:
    absl::Status CheckLength(size_t length, std::string_view what);

    std::vector<Column> columns_;
    std::unordered_map<std::string, size_t> column_index_;
    std::vector<Timestamp> timestamps_;
    std::vector<Period> periods_;
    size_t row_count_ = 0;
    bool has_shape_ = false;
    bool has_timestamps_ = false;
};

}  // namespace driftwatch::data
