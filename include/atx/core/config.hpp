#pragma once

#include "atx/core/result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace atx::core {

inline constexpr std::uint64_t kKiB = 1024ULL;
inline constexpr std::uint64_t kMiB = 1024ULL * kKiB;
inline constexpr std::uint64_t kGiB = 1024ULL * kMiB;

/**
 * @brief Server-imposed quotas and chunking rules used while planning uploads
 */
struct TransferLimits {
    std::uint64_t small_chunk_size = 150 * kMiB;
    std::uint64_t large_chunk_size = 1 * kGiB;
    std::uint64_t small_chunk_threshold = 15 * kGiB; ///< Files up to this size use small chunks
    std::uint64_t max_sequence_bytes = 3 * kGiB;
    std::size_t max_files_per_sequence = 1000;
    std::size_t max_parts_per_sequence = 10000;
    std::size_t max_parts_per_file = 10000;
    std::uint64_t max_preview_file_size = 5 * kMiB;
    std::vector<std::string> allowed_preview_extensions{".png", ".jpg", ".jpeg", ".svg", ".gif"};
};

/**
 * @brief Exponential backoff parameters
 *
 * Attempt n (0-based) waits min(base_delay * multiplier^n, max_delay), scaled
 * by a random factor in [0.5, 1.0] when jitter is enabled.
 */
struct RetryPolicy {
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{30000};
    bool jitter = true;
};

struct TransferConfig {
    std::size_t max_parallel_uploads = 10;
    std::size_t max_parallel_downloads = 5;
    RetryPolicy upload_retry{};
    RetryPolicy download_retry{};
    std::chrono::seconds request_timeout{3600};
    bool force_skip = false; ///< Skip units that exhausted their retries without prompting
    TransferLimits limits{};
};

struct ApiConfig {
    std::string base_url;
    std::string access_token;
    std::chrono::seconds connect_timeout{30};
};

struct LoggingConfig {
    std::string level = "info";
    std::optional<std::filesystem::path> file;
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

struct ClientConfig {
    ApiConfig api;
    TransferConfig transfer;
    LoggingConfig logging;
};

/// Parses a profile document; every field is optional and falls back to the defaults above.
Result<ClientConfig> parse_config(const nlohmann::json& document);

/// Reads and parses a JSON profile from disk.
Result<ClientConfig> load_config(const std::filesystem::path& path);

Result<void> validate(const TransferConfig& config);
Result<void> validate(const ClientConfig& config);

} // namespace atx::core
