#pragma once

/// @file chunk.h
/// @brief Immutable descriptor of a contiguous window of observations

#include <cstddef>
#include <optional>
#include <string>

#include "data/observation_table.h"

namespace driftwatch::chunking {

/// @brief A contiguous, inclusive row range of an observation table
///
/// Chunks do not own data; statistics read the rows back from the table the
/// chunk was produced from.
struct Chunk {
    std::string key;            ///< "[start:end]" or a calendar period label
    size_t chunk_index = 0;     ///< Position in the chunk sequence
    size_t start_index = 0;     ///< First row (inclusive)
    size_t end_index = 0;       ///< Last row (inclusive)

    std::optional<data::Timestamp> start_date;
    std::optional<data::Timestamp> end_date;

    data::Period period = data::Period::kAnalysis;

    /// Rows of the chunk carry both reference and analysis labels
    bool is_transition = false;

    size_t Size() const { return end_index - start_index + 1; }
};

}  // namespace driftwatch::chunking
