#pragma once

#include "atx/core/config.hpp"
#include "atx/core/result.hpp"
#include "atx/transfer/types.hpp"

#include <cstdint>
#include <vector>

namespace atx::transfer {

/**
 * @brief Groups files into quota-bounded sequences
 *
 * Regular files are packed first, preview files second, each in one greedy
 * pass that preserves input order. A file at or above max_sequence_bytes is
 * isolated into its own sequence. Sequence ids run 1..N over the regular
 * sequences and continue N+1..M over the preview ones.
 *
 * Fails with TooManyParts before building anything when a file needs more
 * parts than a single file or a single sequence may carry, and with NoFiles
 * on empty input. The same input always yields the same partitioning.
 */
Result<std::vector<Sequence>> plan_sequences(const std::vector<FileInfo>& files,
                                             const core::TransferLimits& limits);

struct PlanSummary {
    std::size_t total_files = 0;
    std::size_t regular_files = 0;
    std::size_t preview_files = 0;
    std::size_t zero_byte_files = 0;
    std::uint64_t total_bytes = 0;
    std::size_t total_parts = 0;
    std::size_t sequences = 0;
    std::size_t regular_sequences = 0;
    std::size_t preview_sequences = 0;
};

PlanSummary summarize(const std::vector<Sequence>& sequences);

} // namespace atx::transfer
