#include "atx/transfer/download_selection.hpp"

#include "atx/transfer/types.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace atx::transfer {
namespace {

std::string rooted(const std::string& key) {
    return !key.empty() && key.front() == '/' ? key : "/" + key;
}

bool is_folder_key(const std::string& key) {
    return !key.empty() && key.back() == '/';
}

class Picker {
public:
    void add(const std::string& key, std::optional<std::uint64_t> size) {
        if (seen_.insert(rooted(key)).second) {
            files_.push_back({key, size});
        }
    }

    std::vector<RemoteFile>& files() { return files_; }

private:
    std::set<std::string> seen_;
    std::vector<RemoteFile> files_;
};

} // namespace

std::vector<net::AssetFileEntry> files_under_prefix(const std::vector<net::AssetFileEntry>& entries,
                                                    const std::string& prefix,
                                                    bool recursive) {
    std::string folder = rooted(prefix);
    if (!is_folder_key(folder)) {
        folder += '/';
    }

    std::vector<net::AssetFileEntry> matches;
    for (const auto& entry : entries) {
        if (entry.is_folder) {
            continue;
        }
        const std::string key = rooted(entry.key);
        if (key.size() <= folder.size() || key.compare(0, folder.size(), folder) != 0) {
            continue;
        }
        if (!recursive && key.find('/', folder.size()) != std::string::npos) {
            continue;
        }
        matches.push_back(entry);
    }
    return matches;
}

std::vector<net::AssetFileEntry> previews_of(const std::vector<net::AssetFileEntry>& entries,
                                             const std::string& base_key) {
    const std::string stem = rooted(base_key) + std::string(kPreviewMarker);
    std::vector<net::AssetFileEntry> previews;
    for (const auto& entry : entries) {
        const std::string key = rooted(entry.key);
        if (!entry.is_folder && key.size() > stem.size() && key.compare(0, stem.size(), stem) == 0) {
            previews.push_back(entry);
        }
    }
    return previews;
}

Result<std::vector<RemoteFile>> select_remote_files(net::AssetApi& api, const DownloadSelection& selection) {
    if (!selection.keys.empty() && selection.file_key) {
        return Err<std::vector<RemoteFile>>(ErrorCode::InvalidConfig,
            "a file key and a list of keys cannot be combined");
    }

    std::optional<std::vector<net::AssetFileEntry>> listing;
    auto listed = [&]() -> Result<void> {
        if (listing) {
            return Ok();
        }
        auto fetched = api.list_files();
        if (fetched.is_error()) {
            return Err<void>(fetched.error());
        }
        listing = fetched.take();
        return Ok();
    };

    Picker picker;
    if (!selection.keys.empty()) {
        for (const auto& key : selection.keys) {
            picker.add(key, std::nullopt);
        }
    } else if (selection.file_key && !selection.recursive && !is_folder_key(*selection.file_key)) {
        picker.add(*selection.file_key, std::nullopt);
    } else {
        auto ready = listed();
        if (ready.is_error()) {
            return Err<std::vector<RemoteFile>>(ready.error());
        }
        if (selection.file_key) {
            for (const auto& entry : files_under_prefix(*listing, *selection.file_key, selection.recursive)) {
                picker.add(entry.key, entry.size);
            }
            if (picker.files().empty()) {
                return Err<std::vector<RemoteFile>>(ErrorCode::NoFiles,
                    "no files found under '" + *selection.file_key + "'");
            }
        } else {
            for (const auto& entry : *listing) {
                if (!entry.is_folder) {
                    picker.add(entry.key, entry.size);
                }
            }
            if (picker.files().empty()) {
                return Err<std::vector<RemoteFile>>(ErrorCode::NoFiles, "asset currently has no files to download");
            }
        }
    }

    if (selection.include_previews) {
        auto ready = listed();
        if (ready.is_error()) {
            return Err<std::vector<RemoteFile>>(ready.error());
        }
        // Copy the base list; adding previews grows picker.files()
        const std::vector<RemoteFile> bases = picker.files();
        for (const auto& base : bases) {
            if (is_preview_key(base.key)) {
                continue;
            }
            for (const auto& preview : previews_of(*listing, base.key)) {
                picker.add(preview.key, preview.size);
            }
        }
    }

    spdlog::debug("[DownloadSelected] files={} listed={}", picker.files().size(),
                  listing ? listing->size() : 0);
    return Ok(std::move(picker.files()));
}

ShareableLinks collect_shareable_links(net::AssetApi& api, const std::vector<RemoteFile>& files) {
    ShareableLinks out;
    for (const auto& file : files) {
        auto target = api.get_download_target(file.key);
        if (target.is_error()) {
            spdlog::warn("[LinkSkipped] key={} error={}", file.key, target.error().describe());
            out.failed.push_back({file.key, target.error().describe()});
            continue;
        }
        out.links.push_back({file.key, target.value().url, target.value().expires_in_seconds});
    }
    return out;
}

} // namespace atx::transfer
