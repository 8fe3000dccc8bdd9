#pragma once

#include "atx/core/config.hpp"
#include "atx/core/result.hpp"
#include "atx/events/event_bus.hpp"
#include "atx/net/api_client.hpp"
#include "atx/net/transfer_client.hpp"
#include "atx/transfer/progress.hpp"
#include "atx/transfer/retry.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace atx::transfer {

/// A remote key picked for download, with its listed size when known
struct RemoteFile {
    std::string key;
    std::optional<std::uint64_t> size;
};

struct DownloadRequest {
    std::string key;
    std::filesystem::path local_path;
    std::string url;
    std::optional<std::uint64_t> expected_size;
};

struct DownloadedFile {
    std::string key;
    std::filesystem::path local_path;
    std::uint64_t bytes = 0;
    std::uint32_t attempts = 0;
};

struct FailedDownload {
    std::string key;
    std::filesystem::path local_path;
    std::string error;
    std::uint32_t attempts = 0;
};

struct DownloadResult {
    bool overall_success = false;
    std::size_t total_files = 0;
    std::vector<DownloadedFile> successful;
    std::vector<FailedDownload> failed;
    std::uint64_t total_bytes = 0;
    double duration_seconds = 0.0;
    double average_speed = 0.0;
};

/**
 * @brief Streams whole files from presigned GET targets to disk
 *
 * At most max_parallel_downloads files are in flight. Parent directories are
 * created on demand. A failed attempt removes the partial file before the
 * retry. Results keep the order of the requests.
 */
class DownloadOrchestrator {
public:
    DownloadOrchestrator(net::TransferClient& client,
                         core::TransferConfig config,
                         events::EventBus& bus,
                         Sleeper sleeper = thread_sleeper());

    DownloadResult run(const std::vector<DownloadRequest>& requests, ProgressCallback on_progress = {});

private:
    Result<std::uint64_t> download_once(const DownloadRequest& request, TransferProgress& progress);

    net::TransferClient& client_;
    core::TransferConfig config_;
    events::EventBus& bus_;
    Sleeper sleeper_;
};

/**
 * @brief Maps remote keys to local destinations and presigned URLs
 *
 * A key lands at root/<key>, or at root/<file name> when flatten is set.
 * Flattening two keys onto the same name, a key that escapes root, or a
 * failed target lookup fails the whole resolution. A known size becomes the
 * request's expected_size.
 */
Result<std::vector<DownloadRequest>> resolve_remote_files(net::AssetApi& api,
                                                          const std::vector<RemoteFile>& files,
                                                          const std::filesystem::path& destination_root,
                                                          bool flatten);

/// Same for bare keys with unknown sizes
Result<std::vector<DownloadRequest>> resolve_download_targets(net::AssetApi& api,
                                                              const std::vector<std::string>& keys,
                                                              const std::filesystem::path& destination_root,
                                                              bool flatten);

} // namespace atx::transfer
