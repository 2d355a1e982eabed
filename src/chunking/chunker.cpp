/// @file chunker.cpp
/// @brief Chunker implementations

#include "chunking/chunker.h"

#include <algorithm>
#include <chrono>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "common/error.h"
#include "common/logging.h"

namespace driftwatch::chunking {

namespace chrono = std::chrono;

// =============================================================================
// Chunker (shared split logic)
// =============================================================================

absl::StatusOr<std::vector<Chunk>> Chunker::Split(const data::ObservationTable& table,
                                                  data::Period default_period) const {
    DRIFTWATCH_RETURN_IF_ERROR(Validate());

    std::vector<Chunk> chunks;
    if (table.Empty()) {
        DRIFTWATCH_LOG_DEBUG("{}: empty table, no chunks produced", Name());
        return chunks;
    }

    DRIFTWATCH_ASSIGN_OR_RETURN(std::vector<Range> ranges, SplitRows(table));

    const auto& timestamps = table.Timestamps();
    const auto& periods = table.Periods();
    chunks.reserve(ranges.size());

    size_t expected_start = 0;
    size_t undersized = 0;
    for (auto& range : ranges) {
        if (range.start != expected_start || range.end < range.start ||
            range.end >= table.RowCount()) {
            return absl::InternalError(absl::StrCat(
                Name(), " produced an invalid row range [", range.start, ":", range.end,
                "], expected it to start at row ", expected_start));
        }
        expected_start = range.end + 1;

        Chunk chunk;
        chunk.key = range.key.empty()
                        ? absl::StrCat("[", range.start, ":", range.end, "]")
                        : std::move(range.key);
        chunk.chunk_index = chunks.size();
        chunk.start_index = range.start;
        chunk.end_index = range.end;

        if (range.start_date.has_value()) {
            chunk.start_date = range.start_date;
            chunk.end_date = range.end_date;
        } else if (table.HasTimestamps()) {
            auto first = timestamps.begin() + static_cast<std::ptrdiff_t>(range.start);
            auto last = timestamps.begin() + static_cast<std::ptrdiff_t>(range.end) + 1;
            auto [min_it, max_it] = std::minmax_element(first, last);
            chunk.start_date = *min_it;
            chunk.end_date = *max_it;
        }

        if (table.HasPeriods()) {
            size_t reference_rows = 0;
            for (size_t i = range.start; i <= range.end; ++i) {
                if (periods[i] == data::Period::kReference) {
                    ++reference_rows;
                }
            }
            if (reference_rows == chunk.Size()) {
                chunk.period = data::Period::kReference;
            } else if (reference_rows == 0) {
                chunk.period = data::Period::kAnalysis;
            } else {
                chunk.period = data::Period::kAnalysis;
                chunk.is_transition = true;
            }
        } else {
            chunk.period = default_period;
        }

        if (minimum_chunk_size_ > 0 && chunk.Size() < minimum_chunk_size_) {
            ++undersized;
            DRIFTWATCH_LOG_WARN("{}: chunk {} has {} rows, below the minimum of {}",
                                Name(), chunk.key, chunk.Size(), minimum_chunk_size_);
        }

        chunks.push_back(std::move(chunk));
    }

    DRIFTWATCH_LOG_DEBUG("{}: split {} rows into {} chunks ({} undersized)",
                         Name(), table.RowCount(), chunks.size(), undersized);
    return chunks;
}

// =============================================================================
// CountBasedChunker
// =============================================================================

CountBasedChunker::CountBasedChunker(int64_t chunk_count, size_t minimum_chunk_size)
    : Chunker(minimum_chunk_size), chunk_count_(chunk_count) {}

absl::Status CountBasedChunker::Validate() const {
    if (chunk_count_ <= 0) {
        return ConfigurationError(absl::StrCat(
            "Chunk count must be positive, got ", chunk_count_));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::vector<Chunker::Range>> CountBasedChunker::SplitRows(
    const data::ObservationTable& table) const {

    if (table.HasTimestamps() && !table.TimestampsSorted()) {
        DRIFTWATCH_LOG_WARN("CountBasedChunker: timestamps are not sorted, "
                            "chunking by row position");
    }

    const size_t rows = table.RowCount();
    size_t count = static_cast<size_t>(chunk_count_);
    if (rows < count) {
        DRIFTWATCH_LOG_WARN("CountBasedChunker: {} rows cannot fill {} chunks, "
                            "using {} single-row chunks", rows, count, rows);
        count = rows;
    }

    const size_t base = rows / count;
    const size_t extra = rows % count;

    std::vector<Range> ranges;
    ranges.reserve(count);
    size_t start = 0;
    for (size_t i = 0; i < count; ++i) {
        const size_t size = base + (i < extra ? 1 : 0);
        ranges.push_back(Range{.start = start, .end = start + size - 1});
        start += size;
    }
    return ranges;
}

// =============================================================================
// SizeBasedChunker
// =============================================================================

SizeBasedChunker::SizeBasedChunker(int64_t chunk_size, bool keep_incomplete,
                                   size_t minimum_chunk_size)
    : Chunker(minimum_chunk_size),
      chunk_size_(chunk_size),
      keep_incomplete_(keep_incomplete) {}

absl::Status SizeBasedChunker::Validate() const {
    if (chunk_size_ <= 0) {
        return ConfigurationError(absl::StrCat(
            "Chunk size must be positive, got ", chunk_size_));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::vector<Chunker::Range>> SizeBasedChunker::SplitRows(
    const data::ObservationTable& table) const {

    if (table.HasTimestamps() && !table.TimestampsSorted()) {
        DRIFTWATCH_LOG_WARN("SizeBasedChunker: timestamps are not sorted, "
                            "chunking by row position");
    }

    const size_t rows = table.RowCount();
    const size_t size = static_cast<size_t>(chunk_size_);

    std::vector<Range> ranges;
    ranges.reserve(rows / size + 1);
    size_t start = 0;
    while (start + size <= rows) {
        ranges.push_back(Range{.start = start, .end = start + size - 1});
        start += size;
    }

    if (start < rows) {
        if (keep_incomplete_) {
            ranges.push_back(Range{.start = start, .end = rows - 1});
        } else {
            DRIFTWATCH_LOG_INFO("SizeBasedChunker: dropping {} trailing rows of an "
                                "incomplete chunk", rows - start);
        }
    }
    return ranges;
}

// =============================================================================
// Calendar period helpers
// =============================================================================

absl::StatusOr<CalendarPeriod> ParseCalendarPeriod(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(std::string(name));
    if (lowered == "h" || lowered == "hour" || lowered == "hourly") {
        return CalendarPeriod::kHour;
    }
    if (lowered == "d" || lowered == "day" || lowered == "daily") {
        return CalendarPeriod::kDay;
    }
    if (lowered == "w" || lowered == "week" || lowered == "weekly") {
        return CalendarPeriod::kWeek;
    }
    if (lowered == "m" || lowered == "month" || lowered == "monthly") {
        return CalendarPeriod::kMonth;
    }
    if (lowered == "q" || lowered == "quarter" || lowered == "quarterly") {
        return CalendarPeriod::kQuarter;
    }
    if (lowered == "y" || lowered == "year" || lowered == "yearly") {
        return CalendarPeriod::kYear;
    }
    return ConfigurationError(absl::StrCat("Unknown chunk period '", std::string(name), "'"));
}

std::string_view CalendarPeriodToString(CalendarPeriod period) {
    switch (period) {
        case CalendarPeriod::kHour:
            return "H";
        case CalendarPeriod::kDay:
            return "D";
        case CalendarPeriod::kWeek:
            return "W";
        case CalendarPeriod::kMonth:
            return "M";
        case CalendarPeriod::kQuarter:
            return "Q";
        case CalendarPeriod::kYear:
            return "Y";
        default:
            return "?";
    }
}

data::Timestamp PeriodStart(CalendarPeriod period, data::Timestamp timestamp) {
    const chrono::sys_days day = chrono::floor<chrono::days>(timestamp);
    const chrono::year_month_day ymd{day};

    switch (period) {
        case CalendarPeriod::kHour:
            return chrono::floor<chrono::hours>(timestamp);
        case CalendarPeriod::kDay:
            return day;
        case CalendarPeriod::kWeek: {
            // c_encoding: Sunday == 0
            const unsigned offset = (chrono::weekday{day}.c_encoding() + 6) % 7;
            return day - chrono::days{static_cast<int>(offset)};
        }
        case CalendarPeriod::kMonth:
            return chrono::sys_days{ymd.year() / ymd.month() / 1};
        case CalendarPeriod::kQuarter: {
            const unsigned month = static_cast<unsigned>(ymd.month());
            const unsigned first_month = ((month - 1) / 3) * 3 + 1;
            return chrono::sys_days{ymd.year() / chrono::month{first_month} / 1};
        }
        case CalendarPeriod::kYear:
        default:
            return chrono::sys_days{ymd.year() / chrono::January / 1};
    }
}

data::Timestamp NextPeriodStart(CalendarPeriod period, data::Timestamp period_start) {
    const chrono::sys_days day = chrono::floor<chrono::days>(period_start);
    const chrono::year_month_day ymd{day};
    const chrono::year_month year_month{ymd.year(), ymd.month()};

    switch (period) {
        case CalendarPeriod::kHour:
            return period_start + chrono::hours{1};
        case CalendarPeriod::kDay:
            return period_start + chrono::days{1};
        case CalendarPeriod::kWeek:
            return period_start + chrono::days{7};
        case CalendarPeriod::kMonth:
            return chrono::sys_days{(year_month + chrono::months{1}) / 1};
        case CalendarPeriod::kQuarter:
            return chrono::sys_days{(year_month + chrono::months{3}) / 1};
        case CalendarPeriod::kYear:
        default:
            return chrono::sys_days{(ymd.year() + chrono::years{1}) / chrono::January / 1};
    }
}

std::string PeriodLabel(CalendarPeriod period, data::Timestamp period_start) {
    const chrono::sys_days day = chrono::floor<chrono::days>(period_start);
    const chrono::year_month_day ymd{day};
    const int year = static_cast<int>(ymd.year());
    const unsigned month = static_cast<unsigned>(ymd.month());
    const unsigned day_of_month = static_cast<unsigned>(ymd.day());

    switch (period) {
        case CalendarPeriod::kHour: {
            const auto hour = chrono::duration_cast<chrono::hours>(period_start - day).count();
            return absl::StrFormat("%04d-%02u-%02uT%02d", year, month, day_of_month,
                                   static_cast<int>(hour));
        }
        case CalendarPeriod::kDay:
            return absl::StrFormat("%04d-%02u-%02u", year, month, day_of_month);
        case CalendarPeriod::kWeek: {
            // ISO weeks belong to the year containing their Thursday
            const chrono::sys_days thursday = day + chrono::days{3};
            const chrono::year iso_year = chrono::year_month_day{thursday}.year();
            const chrono::sys_days jan_first{iso_year / chrono::January / 1};
            const auto week = (thursday - jan_first).count() / 7 + 1;
            return absl::StrFormat("%04d-W%02d", static_cast<int>(iso_year),
                                   static_cast<int>(week));
        }
        case CalendarPeriod::kMonth:
            return absl::StrFormat("%04d-%02u", year, month);
        case CalendarPeriod::kQuarter:
            return absl::StrFormat("%04d-Q%u", year, (month - 1) / 3 + 1);
        case CalendarPeriod::kYear:
        default:
            return absl::StrFormat("%04d", year);
    }
}

// =============================================================================
// PeriodBasedChunker
// =============================================================================

PeriodBasedChunker::PeriodBasedChunker(CalendarPeriod period, size_t minimum_chunk_size)
    : Chunker(minimum_chunk_size), period_(period) {}

absl::StatusOr<std::vector<Chunker::Range>> PeriodBasedChunker::SplitRows(
    const data::ObservationTable& table) const {

    if (!table.HasTimestamps()) {
        return absl::InvalidArgumentError(
            "PeriodBasedChunker requires a table with timestamps");
    }
    if (!table.TimestampsSorted()) {
        return absl::InvalidArgumentError(
            "PeriodBasedChunker requires non-decreasing timestamps; "
            "sort the observations before chunking");
    }

    const auto& timestamps = table.Timestamps();
    std::vector<Range> ranges;

    size_t start = 0;
    while (start < timestamps.size()) {
        const data::Timestamp period_start = PeriodStart(period_, timestamps[start]);
        const data::Timestamp next_start = NextPeriodStart(period_, period_start);

        size_t end = start;
        while (end + 1 < timestamps.size() && timestamps[end + 1] < next_start) {
            ++end;
        }

        ranges.push_back(Range{
            .start = start,
            .end = end,
            .key = PeriodLabel(period_, period_start),
            .start_date = period_start,
            .end_date = next_start - chrono::microseconds{1},
        });
        start = end + 1;
    }
    return ranges;
}

// =============================================================================
// Factory Functions
// =============================================================================

absl::StatusOr<ChunkerSpec::Strategy> ParseChunkingStrategy(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(std::string(name));
    if (lowered == "count" || lowered == "count_based") {
        return ChunkerSpec::Strategy::kCount;
    }
    if (lowered == "size" || lowered == "size_based") {
        return ChunkerSpec::Strategy::kSize;
    }
    if (lowered == "period" || lowered == "period_based") {
        return ChunkerSpec::Strategy::kPeriod;
    }
    return ConfigurationError(absl::StrCat("Unknown chunking strategy '", std::string(name),
                                           "', expected one of count, size, period"));
}

std::string_view ChunkingStrategyToString(ChunkerSpec::Strategy strategy) {
    switch (strategy) {
        case ChunkerSpec::Strategy::kCount:
            return "count";
        case ChunkerSpec::Strategy::kSize:
            return "size";
        case ChunkerSpec::Strategy::kPeriod:
            return "period";
        default:
            return "unknown";
    }
}

absl::StatusOr<std::unique_ptr<Chunker>> CreateChunker(const ChunkerSpec& spec) {
    std::unique_ptr<Chunker> chunker;
    switch (spec.strategy) {
        case ChunkerSpec::Strategy::kCount:
            chunker = std::make_unique<CountBasedChunker>(spec.count, spec.minimum_chunk_size);
            break;
        case ChunkerSpec::Strategy::kSize:
            chunker = std::make_unique<SizeBasedChunker>(
                spec.size, spec.keep_incomplete, spec.minimum_chunk_size);
            break;
        case ChunkerSpec::Strategy::kPeriod: {
            DRIFTWATCH_ASSIGN_OR_RETURN(CalendarPeriod period, ParseCalendarPeriod(spec.period));
            chunker = std::make_unique<PeriodBasedChunker>(period, spec.minimum_chunk_size);
            break;
        }
    }
    if (chunker == nullptr) {
        return ConfigurationError("Unsupported chunking strategy");
    }
    DRIFTWATCH_RETURN_IF_ERROR(chunker->Validate());
    return chunker;
}

std::unique_ptr<Chunker> CreateDefaultChunker() {
    return std::make_unique<CountBasedChunker>();
}

}  // namespace driftwatch::chunking
