#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atx::transfer {

/// Key marker identifying a preview file ("model.glb.previewFile.png")
inline constexpr std::string_view kPreviewMarker = ".previewFile.";

bool is_preview_key(std::string_view key) noexcept;

enum class UploadType {
    AssetFile,
    AssetPreview
};

std::string_view upload_type_name(UploadType type) noexcept;

/**
 * @brief A local file selected for upload
 *
 * Immutable after discovery; consumed by the planner and the orchestrator.
 */
struct FileInfo {
    std::filesystem::path local_path;
    std::string key;            ///< Remote path relative to the asset root (POSIX style)
    std::uint64_t size = 0;
    bool is_preview = false;    ///< Derived from kPreviewMarker in key

    FileInfo() = default;
    FileInfo(std::filesystem::path path, std::string remote_key, std::uint64_t byte_size)
        : local_path(std::move(path)),
          key(std::move(remote_key)),
          size(byte_size),
          is_preview(is_preview_key(key)) {}
};

/**
 * @brief Contiguous byte range [start_byte, end_byte) of one file
 */
struct Part {
    std::string file_key;
    std::uint32_t part_number = 0; ///< 1-based
    std::uint64_t start_byte = 0;
    std::uint64_t end_byte = 0;    ///< Exclusive
    std::uint64_t length = 0;
};

enum class SequenceKind {
    Regular,
    Preview
};

/**
 * @brief Batch of files driven through one initialize/transfer/finalize round
 */
struct Sequence {
    std::uint32_t id = 0;
    SequenceKind kind = SequenceKind::Regular;
    std::vector<FileInfo> files;
    std::uint64_t total_bytes = 0;
    std::size_t total_parts = 0;
    std::map<std::string, std::vector<Part>> parts_by_key;
};

enum class PartStatus {
    Pending,
    InFlight,
    Completed,
    Failed
};

enum class FileStatus {
    Pending,
    InProgress,
    Completed,
    Failed
};

/**
 * @brief Runtime state of one part upload
 *
 * Written only by the worker that owns the part; read by the sequence driver
 * after the part task has settled.
 */
struct PartTransferState {
    std::string file_key;
    std::uint32_t sequence_id = 0;
    Part part;
    std::string target_url;
    std::string completion_token;  ///< ETag once Completed
    PartStatus status = PartStatus::Pending;
    std::uint32_t attempts = 0;
    std::string last_error;
    std::chrono::steady_clock::time_point started_at{};
    std::chrono::steady_clock::time_point finished_at{};
};

} // namespace atx::transfer
