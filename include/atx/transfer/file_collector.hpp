#pragma once

#include "atx/core/config.hpp"
#include "atx/core/result.hpp"
#include "atx/transfer/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace atx::transfer {

/// "/" -> "", "/models" -> "models/", "a/b/" -> "a/b/"
std::string normalize_asset_location(std::string location);

/**
 * @brief Discovers the files under a directory
 *
 * Keys are the asset location followed by the path relative to directory,
 * always with forward slashes. Results are sorted by key. Fails with
 * InvalidFile when directory is missing, is not a directory or holds no
 * regular files.
 */
Result<std::vector<FileInfo>> collect_from_directory(const std::filesystem::path& directory,
                                                     bool recursive,
                                                     const std::string& asset_location = "/");

/// Keys are the asset location followed by the file name; duplicate names are rejected.
Result<std::vector<FileInfo>> collect_from_list(const std::vector<std::filesystem::path>& paths,
                                                const std::string& asset_location = "/");

/**
 * @brief Static per-file checks run before planning
 *
 * The path must name an existing regular file. Preview files, and every file
 * of an asset preview upload, must also fit max_preview_file_size
 * (FileTooLarge) and carry an allowed extension (PreviewFile).
 */
Result<void> validate_for_upload(const FileInfo& file,
                                 UploadType upload_type,
                                 const core::TransferLimits& limits);

/// Preview keys whose base key ("x.glb" for "x.glb.previewFile.png") is not among files.
std::vector<std::string> find_orphan_previews(const std::vector<FileInfo>& files);

} // namespace atx::transfer
