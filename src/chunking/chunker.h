#pragma once

/// @file chunker.h
/// @brief Strategies splitting an observation table into contiguous chunks

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "chunking/chunk.h"
#include "data/observation_table.h"

namespace driftwatch::chunking {

/// @brief Abstract base class for chunkers
///
/// Split() is shared by all strategies: it validates the configuration, asks
/// the strategy for row ranges and turns them into Chunk descriptors with
/// sequence indices, partition labels and dates. Ranges never overlap and
/// never skip rows; only a size-based chunker configured to drop its
/// incomplete trailing chunk leaves rows uncovered, and only at the end.
class Chunker {
public:
    /// @param minimum_chunk_size Chunks smaller than this log a warning (0 disables)
    explicit Chunker(size_t minimum_chunk_size = 0)
        : minimum_chunk_size_(minimum_chunk_size) {}
    virtual ~Chunker() = default;

    /// @brief Split a table into chunks
    /// @param table Rows to split, in their stored order
    /// @param default_period Label for chunks of a table without period labels
    /// @return Ordered chunks; empty for an empty table
    absl::StatusOr<std::vector<Chunk>> Split(
        const data::ObservationTable& table,
        data::Period default_period = data::Period::kAnalysis) const;

    /// @brief Check the chunker configuration
    virtual absl::Status Validate() const = 0;

    /// @brief Get the chunker name
    virtual std::string Name() const = 0;

    size_t MinimumChunkSize() const { return minimum_chunk_size_; }

protected:
    /// @brief Row range proposed by a strategy
    struct Range {
        size_t start = 0;
        size_t end = 0;  ///< Inclusive
        std::string key;  ///< Empty to use the default "[start:end]" key
        std::optional<data::Timestamp> start_date;
        std::optional<data::Timestamp> end_date;
    };

    /// @brief Compute row ranges for a non-empty table
    virtual absl::StatusOr<std::vector<Range>> SplitRows(
        const data::ObservationTable& table) const = 0;

private:
    size_t minimum_chunk_size_;
};

/// @brief Splits the rows into a fixed number of nearly-equal chunks
///
/// The first (rows mod count) chunks receive one extra row. Tables with fewer
/// rows than chunks get one chunk per row.
class CountBasedChunker : public Chunker {
public:
    static constexpr int64_t kDefaultChunkCount = 10;

    explicit CountBasedChunker(int64_t chunk_count = kDefaultChunkCount,
                               size_t minimum_chunk_size = 0);

    absl::Status Validate() const override;
    std::string Name() const override { return "CountBasedChunker"; }

    int64_t ChunkCount() const { return chunk_count_; }

protected:
    absl::StatusOr<std::vector<Range>> SplitRows(
        const data::ObservationTable& table) const override;

private:
    int64_t chunk_count_;
};

/// @brief Splits the rows into chunks of a fixed number of rows
class SizeBasedChunker : public Chunker {
public:
    explicit SizeBasedChunker(int64_t chunk_size,
                              bool keep_incomplete = true,
                              size_t minimum_chunk_size = 0);

    absl::Status Validate() const override;
    std::string Name() const override { return "SizeBasedChunker"; }

    int64_t ChunkSize() const { return chunk_size_; }
    bool KeepIncomplete() const { return keep_incomplete_; }

protected:
    absl::StatusOr<std::vector<Range>> SplitRows(
        const data::ObservationTable& table) const override;

private:
    int64_t chunk_size_;
    bool keep_incomplete_;
};

/// @brief Calendar periods supported by PeriodBasedChunker
enum class CalendarPeriod {
    kHour,
    kDay,
    kWeek,     ///< ISO week, Monday 00:00 UTC to Sunday 23:59:59
    kMonth,
    kQuarter,
    kYear
};

/// @brief Parse a period alias ("H", "D", "W", "M", "Q", "Y" or
///        "hourly", "daily", "weekly", "monthly", "quarterly", "yearly")
absl::StatusOr<CalendarPeriod> ParseCalendarPeriod(std::string_view name);

/// @brief Convert a calendar period to its single-letter alias
std::string_view CalendarPeriodToString(CalendarPeriod period);

/// @brief Start of the period containing a timestamp (UTC grid)
data::Timestamp PeriodStart(CalendarPeriod period, data::Timestamp timestamp);

/// @brief Start of the period following the one starting at `period_start`
data::Timestamp NextPeriodStart(CalendarPeriod period, data::Timestamp period_start);

/// @brief Human-readable label of the period starting at `period_start`
std::string PeriodLabel(CalendarPeriod period, data::Timestamp period_start);

/// @brief Groups rows by the calendar period containing their timestamp
///
/// Chunk dates come from the period grid, not from observed extrema, so a
/// sparse period still spans exactly one full period. Periods without rows
/// produce no chunk. Timestamps must be non-decreasing.
class PeriodBasedChunker : public Chunker {
public:
    explicit PeriodBasedChunker(CalendarPeriod period = CalendarPeriod::kDay,
                                size_t minimum_chunk_size = 0);

    absl::Status Validate() const override { return absl::OkStatus(); }
    std::string Name() const override { return "PeriodBasedChunker"; }

    CalendarPeriod GetPeriod() const { return period_; }

protected:
    absl::StatusOr<std::vector<Range>> SplitRows(
        const data::ObservationTable& table) const override;

private:
    CalendarPeriod period_;
};

/// @brief Chunking configuration as read from YAML or built in code
struct ChunkerSpec {
    enum class Strategy {
        kCount,
        kSize,
        kPeriod
    };

    Strategy strategy = Strategy::kCount;
    int64_t count = CountBasedChunker::kDefaultChunkCount;
    int64_t size = 0;
    bool keep_incomplete = true;
    std::string period = "D";
    size_t minimum_chunk_size = 0;
};

/// @brief Parse "count" / "size" / "period"
absl::StatusOr<ChunkerSpec::Strategy> ParseChunkingStrategy(std::string_view name);

/// @brief Convert a chunking strategy to its configuration name
std::string_view ChunkingStrategyToString(ChunkerSpec::Strategy strategy);

/// @brief Create and validate a chunker from a specification
absl::StatusOr<std::unique_ptr<Chunker>> CreateChunker(const ChunkerSpec& spec);

/// @brief Default chunker: ten count-based chunks
std::unique_ptr<Chunker> CreateDefaultChunker();

}  // namespace driftwatch::chunking
