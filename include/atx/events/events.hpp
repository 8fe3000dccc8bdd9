/**
 * @file events.hpp
 * @brief Events emitted while uploads and downloads run
 *
 * NAMING CONVENTION:
 * - Events are past-tense: PartTransferredEvent, SequenceFailedEvent
 */

#pragma once

#include "atx/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace atx::events {

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief Initialize call succeeded and part targets are known
 *
 * WHO EMITS: UploadOrchestrator sequence driver
 */
struct SequenceInitializedEvent {
    std::uint32_t sequence_id = 0;
    transfer::SequenceKind kind = transfer::SequenceKind::Regular;
    std::string session_id;
    std::size_t files = 0;
    std::size_t parts = 0;
    std::uint64_t bytes = 0;
};

/**
 * @brief Sequence failed as a whole (initialize or finalize call)
 *
 * stage is "initialize" or "finalize".
 */
struct SequenceFailedEvent {
    std::uint32_t sequence_id = 0;
    std::string stage;
    std::string error;
    std::size_t files_affected = 0;
};

struct PartTransferredEvent {
    std::uint32_t sequence_id = 0;
    std::string file_key;
    std::uint32_t part_number = 0;
    std::uint64_t bytes = 0;
    std::uint32_t attempts = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief A transfer unit failed and will be tried again after delay
 *
 * part_number is 0 for whole-file downloads.
 */
struct PartRetryEvent {
    std::uint32_t sequence_id = 0;
    std::string file_key;
    std::uint32_t part_number = 0;
    std::uint32_t attempt = 0; ///< 1-based number of the attempt that failed
    std::string error;
    std::chrono::milliseconds delay{0};
};

/// Part exhausted its retries and is permanently failed.
struct PartFailedEvent {
    std::uint32_t sequence_id = 0;
    std::string file_key;
    std::uint32_t part_number = 0;
    std::uint32_t attempts = 0;
    std::string error;
    bool skipped = false; ///< force_skip was set
};

struct SequenceFinalizedEvent {
    std::uint32_t sequence_id = 0;
    transfer::SequenceKind kind = transfer::SequenceKind::Regular;
    std::string session_id;
    std::size_t successful_files = 0;
    std::size_t failed_files = 0;
    bool asynchronous = false;
};

// ════════════════════════════════════════════════════════
// Download Events
// ════════════════════════════════════════════════════════

struct DownloadCompletedEvent {
    std::string key;
    std::filesystem::path local_path;
    std::uint64_t bytes = 0;
    std::uint32_t attempts = 0;
    std::chrono::milliseconds duration{0};
};

struct DownloadFailedEvent {
    std::string key;
    std::filesystem::path local_path;
    std::uint32_t attempts = 0;
    std::string error;
};

} // namespace atx::events
