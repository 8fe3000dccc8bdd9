#include "atx/transfer/part_calculator.hpp"

#include <algorithm>

namespace atx::transfer {

std::uint64_t chunk_size_for(std::uint64_t size, const core::TransferLimits& limits) {
    return size <= limits.small_chunk_threshold ? limits.small_chunk_size : limits.large_chunk_size;
}

std::size_t part_count_for(std::uint64_t size, const core::TransferLimits& limits) {
    if (size == 0) {
        return 0;
    }
    const std::uint64_t chunk = chunk_size_for(size, limits);
    if (chunk == 0) {
        return 0;
    }
    return static_cast<std::size_t>((size + chunk - 1) / chunk);
}

std::vector<Part> calculate_parts(const std::string& key,
                                  std::uint64_t size,
                                  const core::TransferLimits& limits) {
    std::vector<Part> parts;
    const std::uint64_t chunk = chunk_size_for(size, limits);
    if (size == 0 || chunk == 0) {
        return parts;
    }

    parts.reserve(part_count_for(size, limits));
    std::uint32_t number = 1;
    for (std::uint64_t offset = 0; offset < size; offset += chunk) {
        Part part;
        part.file_key = key;
        part.part_number = number++;
        part.start_byte = offset;
        part.end_byte = std::min(offset + chunk, size);
        part.length = part.end_byte - part.start_byte;
        parts.push_back(std::move(part));
    }
    return parts;
}

} // namespace atx::transfer
