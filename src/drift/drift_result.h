#pragma once

/// @file drift_result.h
/// @brief Per-chunk statistic rows produced by the calculators

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunking/chunk.h"
#include "drift/thresholds/threshold.h"

namespace driftwatch::drift {

/// @brief Statistic of one (chunk, column, method) triple
struct DriftResultRow {
    chunking::Chunk chunk;
    std::string column_name;
    std::string method_key;

    double value = std::numeric_limits<double>::quiet_NaN();
    std::optional<double> p_value;

    ThresholdBounds threshold;
    bool alert = false;

    /// Chunk too small or without usable values; value is unreliable
    bool low_confidence = false;
    std::vector<std::string> warnings;
};

/// @brief Ordered result rows
///
/// Rows are ordered by chunk index, then column order, then method order.
class DriftResult {
public:
    DriftResult() = default;
    explicit DriftResult(std::vector<DriftResultRow> rows) : rows_(std::move(rows)) {}

    const std::vector<DriftResultRow>& Rows() const { return rows_; }
    size_t Size() const { return rows_.size(); }
    bool Empty() const { return rows_.empty(); }

    /// @brief Keep rows matching every given criterion
    /// @param period Only rows of chunks in this period (all when empty)
    /// @param column_names Only these columns (all when empty)
    /// @param method_keys Only these methods (all when empty)
    DriftResult Filter(std::optional<data::Period> period,
                       const std::vector<std::string>& column_names = {},
                       const std::vector<std::string>& method_keys = {}) const;

    /// @brief Number of alerting rows, optionally restricted to a column/method
    size_t AlertCount(std::string_view column_name = {}, std::string_view method_key = {}) const;

    /// @brief Distinct column names in order of first appearance
    std::vector<std::string> ColumnNames() const;

    /// @brief Distinct method keys in order of first appearance
    std::vector<std::string> MethodKeys() const;

    /// @brief Distinct chunk keys in order of first appearance
    std::vector<std::string> ChunkKeys() const;

    /// @brief Reference rows followed by the rows of this result
    DriftResult WithReference(const DriftResult& reference) const;

    /// @brief Export rows for reporting
    nlohmann::json ToJson() const;

private:
    std::vector<DriftResultRow> rows_;
};

}  // namespace driftwatch::drift
