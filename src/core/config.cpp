#include "atx/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace atx::core {
namespace {

using json = nlohmann::json;

std::chrono::milliseconds read_millis(const json& node, const char* key, std::chrono::milliseconds fallback) {
    if (!node.contains(key)) {
        return fallback;
    }
    return std::chrono::milliseconds(node.at(key).get<std::int64_t>());
}

RetryPolicy read_retry(const json& node, RetryPolicy policy) {
    policy.max_retries = node.value("max_retries", policy.max_retries);
    policy.base_delay = read_millis(node, "base_delay_ms", policy.base_delay);
    policy.multiplier = node.value("multiplier", policy.multiplier);
    policy.max_delay = read_millis(node, "max_delay_ms", policy.max_delay);
    policy.jitter = node.value("jitter", policy.jitter);
    return policy;
}

TransferLimits read_limits(const json& node, TransferLimits limits) {
    limits.small_chunk_size = node.value("small_chunk_size", limits.small_chunk_size);
    limits.large_chunk_size = node.value("large_chunk_size", limits.large_chunk_size);
    limits.small_chunk_threshold = node.value("small_chunk_threshold", limits.small_chunk_threshold);
    limits.max_sequence_bytes = node.value("max_sequence_bytes", limits.max_sequence_bytes);
    limits.max_files_per_sequence = node.value("max_files_per_sequence", limits.max_files_per_sequence);
    limits.max_parts_per_sequence = node.value("max_parts_per_sequence", limits.max_parts_per_sequence);
    limits.max_parts_per_file = node.value("max_parts_per_file", limits.max_parts_per_file);
    limits.max_preview_file_size = node.value("max_preview_file_size", limits.max_preview_file_size);
    if (node.contains("allowed_preview_extensions")) {
        limits.allowed_preview_extensions = node.at("allowed_preview_extensions").get<std::vector<std::string>>();
    }
    return limits;
}

} // namespace

Result<ClientConfig> parse_config(const json& document) {
    if (!document.is_object()) {
        return Err<ClientConfig>(ErrorCode::InvalidConfig, "Configuration root must be a JSON object");
    }

    ClientConfig config;
    try {
        if (document.contains("api")) {
            const auto& api = document.at("api");
            config.api.base_url = api.value("base_url", config.api.base_url);
            config.api.access_token = api.value("access_token", config.api.access_token);
            config.api.connect_timeout = std::chrono::seconds(
                api.value("connect_timeout_s", static_cast<std::int64_t>(config.api.connect_timeout.count())));
        }

        if (document.contains("transfer")) {
            const auto& transfer = document.at("transfer");
            auto& out = config.transfer;
            out.max_parallel_uploads = transfer.value("max_parallel_uploads", out.max_parallel_uploads);
            out.max_parallel_downloads = transfer.value("max_parallel_downloads", out.max_parallel_downloads);
            out.force_skip = transfer.value("force_skip", out.force_skip);
            out.request_timeout = std::chrono::seconds(
                transfer.value("request_timeout_s", static_cast<std::int64_t>(out.request_timeout.count())));
            if (transfer.contains("upload_retry")) {
                out.upload_retry = read_retry(transfer.at("upload_retry"), out.upload_retry);
            }
            if (transfer.contains("download_retry")) {
                out.download_retry = read_retry(transfer.at("download_retry"), out.download_retry);
            }
            if (transfer.contains("limits")) {
                out.limits = read_limits(transfer.at("limits"), out.limits);
            }
        }

        if (document.contains("logging")) {
            const auto& logging = document.at("logging");
            config.logging.level = logging.value("level", config.logging.level);
            config.logging.pattern = logging.value("pattern", config.logging.pattern);
            if (logging.contains("file")) {
                config.logging.file = std::filesystem::path(logging.at("file").get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        return Err<ClientConfig>(ErrorCode::InvalidConfig, std::string("Malformed configuration: ") + e.what());
    }

    auto valid = validate(config);
    if (valid.is_error()) {
        return Err<ClientConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<ClientConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<ClientConfig>(ErrorCode::InvalidConfig, "Failed to open configuration file: " + path.string());
    }

    json document;
    try {
        input >> document;
    } catch (const json::parse_error& e) {
        return Err<ClientConfig>(ErrorCode::InvalidConfig,
                                 "Failed to parse " + path.string() + ": " + e.what());
    }
    return parse_config(document);
}

Result<void> validate(const TransferConfig& config) {
    const auto fail = [](const std::string& message) {
        return Err<void>(ErrorCode::InvalidConfig, message);
    };

    if (config.max_parallel_uploads == 0 || config.max_parallel_downloads == 0) {
        return fail("Parallel transfer limits must be at least 1");
    }
    const auto& limits = config.limits;
    if (limits.small_chunk_size == 0 || limits.large_chunk_size == 0) {
        return fail("Chunk sizes must be greater than zero");
    }
    if (limits.small_chunk_size > limits.small_chunk_threshold) {
        return fail("small_chunk_size must not exceed small_chunk_threshold");
    }
    if (limits.max_sequence_bytes == 0 || limits.max_files_per_sequence == 0 ||
        limits.max_parts_per_sequence == 0 || limits.max_parts_per_file == 0) {
        return fail("Sequence and part caps must be greater than zero");
    }
    for (const auto* policy : {&config.upload_retry, &config.download_retry}) {
        if (policy->multiplier < 1.0) {
            return fail("Retry multiplier must be >= 1.0");
        }
        if (policy->base_delay.count() < 0 || policy->max_delay < policy->base_delay) {
            return fail("Retry delays must satisfy 0 <= base_delay <= max_delay");
        }
    }
    return Ok();
}

Result<void> validate(const ClientConfig& config) {
    return validate(config.transfer);
}

} // namespace atx::core
