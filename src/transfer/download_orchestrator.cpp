#include "atx/transfer/download_orchestrator.hpp"

#include "atx/concurrency/semaphore.hpp"
#include "atx/concurrency/worker_pool.hpp"
#include "atx/events/events.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <map>
#include <system_error>

namespace fs = std::filesystem;

namespace atx::transfer {
namespace {

using Clock = std::chrono::steady_clock;

struct Outcome {
    bool done = false;
    std::uint64_t bytes = 0;
    std::uint32_t attempts = 0;
    std::string error;
};

class DoneOnExit {
public:
    explicit DoneOnExit(concurrency::WaitGroup& group) : group_(group) {}
    ~DoneOnExit() { group_.done(); }

    DoneOnExit(const DoneOnExit&) = delete;
    DoneOnExit& operator=(const DoneOnExit&) = delete;

private:
    concurrency::WaitGroup& group_;
};

void remove_partial(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("[DownloadCleanup] could not remove partial file {}: {}", path.string(), ec.message());
    }
}

} // namespace

DownloadOrchestrator::DownloadOrchestrator(net::TransferClient& client,
                                           core::TransferConfig config,
                                           events::EventBus& bus,
                                           Sleeper sleeper)
    : client_(client), config_(std::move(config)), bus_(bus), sleeper_(std::move(sleeper)) {}

Result<std::uint64_t> DownloadOrchestrator::download_once(const DownloadRequest& request,
                                                          TransferProgress& progress) {
    std::error_code ec;
    const auto parent = request.local_path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return Err<std::uint64_t>(ErrorCode::Io,
                "cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream out(request.local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err<std::uint64_t>(ErrorCode::Io, "cannot open " + request.local_path.string() + " for writing");
    }

    auto written = client_.get_to_stream(request.url, out, [&](std::uint64_t total) {
        progress.file_bytes(request.key, total);
    });
    out.close();
    if (written.is_error()) {
        remove_partial(request.local_path);
        return written;
    }
    if (!out) {
        remove_partial(request.local_path);
        return Err<std::uint64_t>(ErrorCode::Io, "failed to flush " + request.local_path.string());
    }
    if (request.expected_size && *request.expected_size != written.value()) {
        remove_partial(request.local_path);
        return Err<std::uint64_t>(ErrorCode::Io,
            "size mismatch: expected " + std::to_string(*request.expected_size) +
            " bytes, received " + std::to_string(written.value()));
    }
    return written;
}

DownloadResult DownloadOrchestrator::run(const std::vector<DownloadRequest>& requests,
                                         ProgressCallback on_progress) {
    const auto started = Clock::now();
    TransferProgress progress(std::move(on_progress));
    for (const auto& request : requests) {
        progress.register_file(request.key, request.expected_size.value_or(0), 0);
    }

    concurrency::CountingSemaphore semaphore(config_.max_parallel_downloads);
    concurrency::WorkerPool pool(config_.max_parallel_downloads);
    concurrency::WaitGroup pending;
    std::vector<Outcome> outcomes(requests.size());

    spdlog::info("[DownloadStarted] files={} parallel={}", requests.size(), config_.max_parallel_downloads);

    pending.add(requests.size());
    for (std::size_t i = 0; i < requests.size(); ++i) {
        pool.submit([this, &request = requests[i], &outcome = outcomes[i], &semaphore, &progress, &pending]() {
            DoneOnExit done(pending);
            concurrency::SemaphoreGuard slot(semaphore);
            progress.transfer_started();
            const auto file_started = Clock::now();

            auto result = retry_with_backoff(
                config_.download_retry,
                [&](std::uint32_t attempt) {
                    outcome.attempts = attempt + 1;
                    return download_once(request, progress);
                },
                sleeper_,
                [&](std::uint32_t attempt, const Error& error, std::chrono::milliseconds delay) {
                    bus_.emit(events::PartRetryEvent{0, request.key, 0, attempt + 1, error.describe(), delay});
                });

            if (result.is_ok()) {
                outcome.done = true;
                outcome.bytes = result.value();
                progress.file_bytes(request.key, outcome.bytes);
                progress.file_completed(request.key);
                bus_.emit(events::DownloadCompletedEvent{
                    request.key, request.local_path, outcome.bytes, outcome.attempts,
                    std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - file_started)});
            } else {
                outcome.error = result.error().describe();
                progress.file_failed(request.key, outcome.error);
                bus_.emit(events::DownloadFailedEvent{request.key, request.local_path, outcome.attempts,
                                                      outcome.error});
            }
            progress.transfer_finished();
        });
    }
    pending.wait();
    pool.join();

    DownloadResult result;
    result.total_files = requests.size();
    for (std::size_t i = 0; i < requests.size(); ++i) {
        const auto& request = requests[i];
        const auto& outcome = outcomes[i];
        if (outcome.done) {
            result.successful.push_back({request.key, request.local_path, outcome.bytes, outcome.attempts});
            result.total_bytes += outcome.bytes;
        } else {
            const std::string error = outcome.error.empty() ? "download did not complete" : outcome.error;
            result.failed.push_back({request.key, request.local_path, error, outcome.attempts});
        }
    }
    result.overall_success = result.failed.empty();
    result.duration_seconds = std::chrono::duration<double>(Clock::now() - started).count();
    result.average_speed = result.duration_seconds > 0.0
        ? static_cast<double>(result.total_bytes) / result.duration_seconds
        : 0.0;

    spdlog::info("[DownloadFinished] success={} files={} succeeded={} failed={} bytes={}",
                 result.overall_success, result.total_files, result.successful.size(),
                 result.failed.size(), result.total_bytes);
    return result;
}

Result<std::vector<DownloadRequest>> resolve_remote_files(net::AssetApi& api,
                                                          const std::vector<RemoteFile>& files,
                                                          const fs::path& destination_root,
                                                          bool flatten) {
    if (files.empty()) {
        return Err<std::vector<DownloadRequest>>(ErrorCode::NoFiles, "no files to download");
    }

    std::vector<DownloadRequest> requests;
    std::map<std::string, std::string> claimed_names;

    for (const auto& file : files) {
        const std::string& key = file.key;
        const auto first = key.find_first_not_of('/');
        if (first == std::string::npos) {
            return Err<std::vector<DownloadRequest>>(ErrorCode::InvalidFile, "'" + key + "' does not name a file");
        }
        const auto relative = fs::path(key.substr(first)).lexically_normal();
        if (relative.empty() || relative.filename().empty()) {
            return Err<std::vector<DownloadRequest>>(ErrorCode::InvalidFile, "'" + key + "' does not name a file");
        }
        for (const auto& component : relative) {
            if (component == "..") {
                return Err<std::vector<DownloadRequest>>(ErrorCode::InvalidFile,
                    "'" + key + "' points outside the destination directory");
            }
        }

        fs::path local_path;
        if (flatten) {
            const std::string name = relative.filename().string();
            const auto [it, inserted] = claimed_names.emplace(name, key);
            if (!inserted) {
                return Err<std::vector<DownloadRequest>>(ErrorCode::InvalidFile,
                    "'" + key + "' and '" + it->second + "' both flatten to '" + name + "'");
            }
            local_path = destination_root / name;
        } else {
            local_path = destination_root / relative;
        }

        auto target = api.get_download_target(key);
        if (target.is_error()) {
            return Err<std::vector<DownloadRequest>>(target.error());
        }
        requests.push_back({key, local_path, target.value().url, file.size});
    }
    return Ok(std::move(requests));
}

Result<std::vector<DownloadRequest>> resolve_download_targets(net::AssetApi& api,
                                                              const std::vector<std::string>& keys,
                                                              const fs::path& destination_root,
                                                              bool flatten) {
    std::vector<RemoteFile> files;
    files.reserve(keys.size());
    for (const auto& key : keys) {
        files.push_back({key, std::nullopt});
    }
    return resolve_remote_files(api, files, destination_root, flatten);
}

} // namespace atx::transfer
