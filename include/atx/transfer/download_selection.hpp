#pragma once

#include "atx/core/result.hpp"
#include "atx/net/api_client.hpp"
#include "atx/transfer/download_orchestrator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace atx::transfer {

/**
 * @brief Which files of an asset a download run covers
 *
 * With neither keys nor file_key every file of the asset is selected.
 * file_key names one file, or a folder when it ends in '/' or recursive is
 * set. include_previews adds the preview files of every selected file.
 */
struct DownloadSelection {
    std::vector<std::string> keys;
    std::optional<std::string> file_key;
    bool recursive = false;
    bool include_previews = false;
};

/**
 * @brief Files below a folder prefix, folder objects excluded
 *
 * Without recursive only direct children match. Keys and prefix are
 * compared with a leading '/', so "models" and "/models/" are the same folder.
 */
std::vector<net::AssetFileEntry> files_under_prefix(const std::vector<net::AssetFileEntry>& entries,
                                                    const std::string& prefix,
                                                    bool recursive);

/// Listed files whose key is base_key + ".previewFile." + extension
std::vector<net::AssetFileEntry> previews_of(const std::vector<net::AssetFileEntry>& entries,
                                             const std::string& base_key);

/// Resolves a selection into remote files, in listing order with duplicates removed.
Result<std::vector<RemoteFile>> select_remote_files(net::AssetApi& api, const DownloadSelection& selection);

struct ShareableLink {
    std::string key;
    std::string url;
    std::int64_t expires_in_seconds = 0;
};

struct FailedLink {
    std::string key;
    std::string error;
};

struct ShareableLinks {
    std::vector<ShareableLink> links;
    std::vector<FailedLink> failed;
};

/// Presigned URLs for each file without downloading anything. A failed lookup skips that file.
ShareableLinks collect_shareable_links(net::AssetApi& api, const std::vector<RemoteFile>& files);

} // namespace atx::transfer
