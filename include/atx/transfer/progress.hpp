#pragma once

#include "atx/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace atx::transfer {

struct FileProgress {
    FileStatus status = FileStatus::Pending;
    std::uint64_t bytes_completed = 0;
    std::uint64_t bytes_total = 0;
    std::size_t parts_completed = 0;
    std::size_t parts_total = 0;
    std::string error;
};

/**
 * @brief Point-in-time copy of the aggregate progress
 */
struct ProgressSnapshot {
    std::size_t total_files = 0;
    std::uint64_t total_bytes = 0;
    std::size_t total_parts = 0;

    std::uint64_t completed_bytes = 0;
    std::size_t completed_parts = 0;
    std::size_t failed_parts = 0;
    std::size_t completed_files = 0;
    std::size_t failed_files = 0;
    std::size_t active_transfers = 0;

    std::map<std::string, FileProgress> files;
    double elapsed_seconds = 0.0;

    /// completed_bytes / total_bytes in [0, 1]; 1 when there is nothing to move
    [[nodiscard]] double fraction() const noexcept;
    /// Average bytes per second since the run started
    [[nodiscard]] double throughput() const noexcept;
    /// Remaining bytes / throughput; empty until at least one byte completed
    [[nodiscard]] std::optional<double> eta_seconds() const noexcept;
};

class TransferProgress;

using ProgressCallback = std::function<void(const TransferProgress&)>;

/**
 * @brief Shared progress accumulator for one orchestrator run
 *
 * Every worker reports into the same instance. The callback, when set, runs
 * after each update on the updating thread, outside the state lock; it
 * usually takes a snapshot() and decides for itself whether to render.
 * Callback invocations are serialized, so snapshots taken inside the
 * callback arrive in order and completed_bytes never goes backwards between
 * two of them. The callback must not report progress itself.
 *
 * THREAD SAFETY: every member is safe to call concurrently.
 * completed_bytes never decreases.
 */
class TransferProgress {
public:
    explicit TransferProgress(ProgressCallback callback = {});

    TransferProgress(const TransferProgress&) = delete;
    TransferProgress& operator=(const TransferProgress&) = delete;

    void register_file(const std::string& key, std::uint64_t bytes_total, std::size_t parts_total);

    void transfer_started();
    void transfer_finished();

    void part_started(const std::string& key);
    void part_completed(const std::string& key, std::uint64_t bytes);
    void part_failed(const std::string& key);

    /**
     * @brief Streaming update for whole-file transfers
     *
     * absolute_bytes is the byte count written so far by the current attempt.
     * Only movement past the best value seen counts, so a retried download
     * does not move the counters backwards. An unknown total grows to match.
     */
    void file_bytes(const std::string& key, std::uint64_t absolute_bytes);

    void file_completed(const std::string& key);
    void file_failed(const std::string& key, const std::string& error);

    [[nodiscard]] ProgressSnapshot snapshot() const;

    /// True once every registered file is completed or failed.
    [[nodiscard]] bool settled() const;

private:
    template<typename Fn>
    void update(Fn&& mutate);

    FileProgress& file_locked(const std::string& key);

    ProgressCallback callback_;
    std::mutex callback_mutex_;
    mutable std::mutex mutex_;
    ProgressSnapshot state_;
    std::chrono::steady_clock::time_point started_at_;
};

/**
 * @brief Admits at most one render per interval
 *
 * Forced calls (the final frame) always pass.
 */
class ProgressThrottle {
public:
    explicit ProgressThrottle(std::chrono::milliseconds interval);

    [[nodiscard]] bool should_render(bool force = false);

private:
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::optional<std::chrono::steady_clock::time_point> last_render_;
};

} // namespace atx::transfer
