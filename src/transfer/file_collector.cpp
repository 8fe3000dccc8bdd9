#include "atx/transfer/file_collector.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace atx::transfer {
namespace {

Result<FileInfo> describe_file(const fs::path& path, std::string key) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<FileInfo>(ErrorCode::InvalidFile,
            "cannot read size of " + path.string() + ": " + ec.message());
    }
    return Ok(FileInfo(path, std::move(key), static_cast<std::uint64_t>(size)));
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::string normalize_asset_location(std::string location) {
    if (location.empty() || location.back() != '/') {
        location.push_back('/');
    }
    if (location.front() == '/') {
        location.erase(0, 1);
    }
    return location;
}

Result<std::vector<FileInfo>> collect_from_directory(const fs::path& directory,
                                                     bool recursive,
                                                     const std::string& asset_location) {
    std::error_code ec;
    if (!fs::exists(directory, ec)) {
        return Err<std::vector<FileInfo>>(ErrorCode::InvalidFile,
            "Directory not found: " + directory.string());
    }
    if (!fs::is_directory(directory, ec)) {
        return Err<std::vector<FileInfo>>(ErrorCode::InvalidFile,
            "Path is not a directory: " + directory.string());
    }

    const std::string prefix = normalize_asset_location(asset_location);
    std::vector<FileInfo> files;

    auto process_entry = [&](const fs::directory_entry& entry) -> Result<void> {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            return Ok();
        }
        auto relative = fs::relative(entry.path(), directory, entry_ec);
        if (entry_ec || relative.empty()) {
            return Err<void>(Error(ErrorCode::InvalidFile,
                "cannot resolve " + entry.path().string() + " against " + directory.string()));
        }
        auto info = describe_file(entry.path(), prefix + relative.generic_string());
        if (info.is_error()) {
            return Err<void>(info.error());
        }
        files.push_back(info.take());
        return Ok();
    };

    if (recursive) {
        for (fs::recursive_directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
            auto status = process_entry(*it);
            if (status.is_error()) {
                return Err<std::vector<FileInfo>>(status.error());
            }
        }
    } else {
        for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
            auto status = process_entry(*it);
            if (status.is_error()) {
                return Err<std::vector<FileInfo>>(status.error());
            }
        }
    }
    if (ec) {
        return Err<std::vector<FileInfo>>(ErrorCode::InvalidFile,
            "Failed to read directory " + directory.string() + ": " + ec.message());
    }

    if (files.empty()) {
        return Err<std::vector<FileInfo>>(ErrorCode::InvalidFile,
            "No files found in directory: " + directory.string());
    }

    std::sort(files.begin(), files.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.key < b.key; });
    return Ok(std::move(files));
}

Result<std::vector<FileInfo>> collect_from_list(const std::vector<fs::path>& paths,
                                                const std::string& asset_location) {
    const std::string prefix = normalize_asset_location(asset_location);
    std::vector<FileInfo> files;
    std::unordered_set<std::string> names;

    for (const auto& path : paths) {
        const std::string name = path.filename().string();
        if (!names.insert(name).second) {
            return Err<std::vector<FileInfo>>(ErrorCode::InvalidFile,
                "Duplicate filename '" + name + "' found. When uploading multiple files, "
                "each file must have a unique name.");
        }
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Err<std::vector<FileInfo>>(ErrorCode::InvalidFile, "File not found: " + path.string());
        }
        if (!fs::is_regular_file(path, ec)) {
            return Err<std::vector<FileInfo>>(ErrorCode::InvalidFile, "Path is not a file: " + path.string());
        }
        auto info = describe_file(path, prefix + name);
        if (info.is_error()) {
            return Err<std::vector<FileInfo>>(info.error());
        }
        files.push_back(info.take());
    }

    if (files.empty()) {
        return Err<std::vector<FileInfo>>(ErrorCode::NoFiles, "no files to upload");
    }
    return Ok(std::move(files));
}

Result<void> validate_for_upload(const FileInfo& file,
                                 UploadType upload_type,
                                 const core::TransferLimits& limits) {
    std::error_code ec;
    if (!fs::exists(file.local_path, ec)) {
        return Err<void>(Error(ErrorCode::InvalidFile, "File not found: " + file.local_path.string()));
    }
    if (!fs::is_regular_file(file.local_path, ec)) {
        return Err<void>(Error(ErrorCode::InvalidFile, "Path is not a file: " + file.local_path.string()));
    }

    if (upload_type != UploadType::AssetPreview && !file.is_preview) {
        return Ok();
    }

    const std::string name = file.local_path.filename().string();
    if (file.size > limits.max_preview_file_size) {
        return Err<void>(Error(ErrorCode::FileTooLarge,
            "Preview file " + name + " exceeds maximum size of " +
            std::to_string(limits.max_preview_file_size) + " bytes (actual size: " +
            std::to_string(file.size) + " bytes)"));
    }

    const std::string extension = lowercase(file.local_path.extension().string());
    const auto& allowed = limits.allowed_preview_extensions;
    if (std::find(allowed.begin(), allowed.end(), extension) == allowed.end()) {
        std::string allowed_list;
        for (const auto& candidate : allowed) {
            if (!allowed_list.empty()) {
                allowed_list += ", ";
            }
            allowed_list += candidate;
        }
        return Err<void>(Error(ErrorCode::PreviewFile,
            "Preview file " + name + " has unsupported extension '" + extension +
            "'. Allowed extensions: " + allowed_list));
    }
    return Ok();
}

std::vector<std::string> find_orphan_previews(const std::vector<FileInfo>& files) {
    std::set<std::string> base_keys;
    for (const auto& file : files) {
        if (!file.is_preview) {
            base_keys.insert(file.key);
        }
    }

    std::vector<std::string> orphans;
    for (const auto& file : files) {
        if (!file.is_preview) {
            continue;
        }
        const auto base = file.key.substr(0, file.key.find(kPreviewMarker));
        if (base_keys.count(base) == 0) {
            orphans.push_back(file.key);
        }
    }
    return orphans;
}

} // namespace atx::transfer
