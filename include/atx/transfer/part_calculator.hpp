#pragma once

#include "atx/core/config.hpp"
#include "atx/transfer/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace atx::transfer {

/// Small chunk for files up to the threshold, large chunk above it.
std::uint64_t chunk_size_for(std::uint64_t size, const core::TransferLimits& limits);

/// Number of parts calculate_parts() would emit, without building them.
std::size_t part_count_for(std::uint64_t size, const core::TransferLimits& limits);

/**
 * @brief Splits [0, size) into contiguous 1-based parts
 *
 * A zero-byte file yields no parts. The last part may be shorter than the
 * chunk size. Never fails; callers check the count against their caps.
 */
std::vector<Part> calculate_parts(const std::string& key,
                                  std::uint64_t size,
                                  const core::TransferLimits& limits);

} // namespace atx::transfer
