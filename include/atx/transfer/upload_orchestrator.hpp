#pragma once

#include "atx/concurrency/semaphore.hpp"
#include "atx/concurrency/worker_pool.hpp"
#include "atx/core/config.hpp"
#include "atx/core/result.hpp"
#include "atx/events/event_bus.hpp"
#include "atx/net/api_client.hpp"
#include "atx/net/transfer_client.hpp"
#include "atx/transfer/progress.hpp"
#include "atx/transfer/retry.hpp"
#include "atx/transfer/sequence_session.hpp"
#include "atx/transfer/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace atx::transfer {

/**
 * @brief Holds preview finalize calls back until every regular sequence has
 *        issued (or given up on) its own finalize call
 *
 * Only the issuing order is enforced; a preview call may still complete
 * before a regular call that was issued earlier.
 */
class FinalizeGate {
public:
    explicit FinalizeGate(std::size_t regular_sequences);

    FinalizeGate(const FinalizeGate&) = delete;
    FinalizeGate& operator=(const FinalizeGate&) = delete;

    /// Each regular sequence calls this exactly once.
    void regular_dispatched();

    void wait_for_regular();

    [[nodiscard]] std::size_t pending() const;

private:
    std::size_t remaining_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

struct FailedFile {
    std::string key;
    std::uint32_t sequence_id = 0;
    std::string error;
};

struct SequenceResult {
    std::uint32_t sequence_id = 0;
    SequenceKind kind = SequenceKind::Regular;
    SequenceState state = SequenceState::Planned;
    std::string session_id;
    std::vector<std::string> successful_files;
    std::vector<FailedFile> failed_files;
    std::optional<Error> error; ///< Sequence-level failure (initialize or finalize call)
    std::optional<net::CompleteUploadResponse> finalize_response;
    std::size_t total_parts = 0;
    std::size_t successful_parts = 0;
    std::size_t failed_parts = 0;
};

struct UploadResult {
    bool overall_success = false;
    std::size_t total_files = 0;
    std::size_t successful_files = 0;
    std::size_t failed_files = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t transferred_bytes = 0;
    double duration_seconds = 0.0;
    double average_speed = 0.0; ///< Bytes per second over the whole run
    std::vector<SequenceResult> sequences;
    std::vector<FailedFile> failed;
    bool asynchronous_processing = false;
    bool large_file_async = false;
};

/**
 * @brief Drives planned sequences through initialize, transfer and finalize
 *
 * Every sequence gets its own driver thread so initialize calls overlap.
 * Part uploads from all sequences share one worker pool and one semaphore
 * sized to max_parallel_uploads. A part is retried with backoff until
 * max_retries + 1 attempts are spent; a failed part fails its file, never
 * its siblings. Partial failure is reported in the result, not raised.
 */
class UploadOrchestrator {
public:
    UploadOrchestrator(net::AssetApi& api,
                       net::TransferClient& client,
                       core::TransferConfig config,
                       events::EventBus& bus,
                       UploadType upload_type = UploadType::AssetFile,
                       Sleeper sleeper = thread_sleeper());

    UploadResult run(const std::vector<Sequence>& sequences, ProgressCallback on_progress = {});

private:
    struct RunContext {
        TransferProgress& progress;
        concurrency::CountingSemaphore& semaphore;
        concurrency::WorkerPool& pool;
        FinalizeGate& gate;
    };

    SequenceResult drive_sequence(const Sequence& sequence, RunContext& context);

    // Result for a driver that threw; every file of the sequence is reported failed
    SequenceResult abandon_sequence(const Sequence& sequence, RunContext& context, const std::string& reason);

    void transfer_part(PartTransferState& state, const std::filesystem::path& local_path, RunContext& context);

    net::AssetApi& api_;
    net::TransferClient& client_;
    core::TransferConfig config_;
    events::EventBus& bus_;
    UploadType upload_type_;
    Sleeper sleeper_;
};

/// Reads [offset, offset + length) of a local file.
Result<std::vector<char>> read_byte_range(const std::filesystem::path& path,
                                          std::uint64_t offset,
                                          std::uint64_t length);

} // namespace atx::transfer
