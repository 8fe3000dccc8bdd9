#include "atx/net/api_client.hpp"

#include "atx/transfer/retry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace atx::net {
namespace {

using json = nlohmann::json;

std::string server_message(const std::string& body) {
    const auto parsed = json::parse(body, nullptr, false);
    if (parsed.is_object() && parsed.contains("message") && parsed.at("message").is_string()) {
        return parsed.at("message").get<std::string>();
    }
    return body.size() > 200 ? body.substr(0, 200) : body;
}

std::string join_url(const std::string& base, const std::string& path) {
    std::string url = base;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + path;
}

} // namespace

json build_initialize_body(const std::string& database_id,
                           const std::string& asset_id,
                           transfer::UploadType upload_type,
                           const std::vector<UploadFileRequest>& files) {
    json manifest = json::array();
    for (const auto& file : files) {
        manifest.push_back({
            {"relativeKey", file.key},
            {"file_size", file.size},
            {"num_parts", file.part_count},
        });
    }
    return {
        {"databaseId", database_id},
        {"assetId", asset_id},
        {"uploadType", std::string(transfer::upload_type_name(upload_type))},
        {"files", manifest},
    };
}

json build_complete_body(const std::string& database_id,
                         const std::string& asset_id,
                         transfer::UploadType upload_type,
                         const std::vector<CompleteFileRequest>& files) {
    json manifest = json::array();
    for (const auto& file : files) {
        json parts = json::array();
        for (const auto& part : file.parts) {
            parts.push_back({{"PartNumber", part.part_number}, {"ETag", part.token}});
        }
        manifest.push_back({
            {"relativeKey", file.key},
            {"uploadIdS3", file.upload_file_id},
            {"parts", parts},
        });
    }
    return {
        {"databaseId", database_id},
        {"assetId", asset_id},
        {"uploadType", std::string(transfer::upload_type_name(upload_type))},
        {"files", manifest},
    };
}

Result<InitializeUploadResponse> parse_initialize_response(const json& body) {
    try {
        InitializeUploadResponse response;
        response.session_id = body.at("uploadId").get<std::string>();
        response.message = body.value("message", std::string());
        for (const auto& node : body.at("files")) {
            InitializedFile file;
            file.key = node.at("relativeKey").get<std::string>();
            file.upload_file_id = node.value("uploadIdS3", std::string());
            if (node.contains("partUploadUrls")) {
                for (const auto& target : node.at("partUploadUrls")) {
                    file.part_targets.push_back({
                        target.at("PartNumber").get<std::uint32_t>(),
                        target.at("UploadUrl").get<std::string>(),
                    });
                }
            }
            response.files.push_back(std::move(file));
        }
        if (response.session_id.empty()) {
            return Err<InitializeUploadResponse>(ErrorCode::ApiError, "initialize response has an empty uploadId");
        }
        return Ok(std::move(response));
    } catch (const json::exception& e) {
        return Err<InitializeUploadResponse>(ErrorCode::ApiError,
            std::string("malformed initialize response: ") + e.what());
    }
}

Result<CompleteUploadResponse> parse_complete_response(long status, const std::string& body) {
    if (status == 503) {
        CompleteUploadResponse accepted;
        accepted.overall_success = true;
        accepted.asynchronous_processing = true;
        accepted.message = "Upload completion accepted for asynchronous processing";
        accepted.raw = {
            {"message", accepted.message},
            {"overallSuccess", true},
            {"asynchronousProcessing", true},
        };
        return Ok(std::move(accepted));
    }

    const bool partial = status == 409;
    if (!partial && (status < 200 || status >= 300)) {
        return Err<CompleteUploadResponse>(classify_status(status, body, "Upload completion failed"));
    }

    try {
        CompleteUploadResponse response;
        response.raw = body.empty() ? json::object() : json::parse(body);
        response.message = response.raw.value("message", std::string());
        response.overall_success = response.raw.value("overallSuccess", !partial);
        response.asynchronous_processing = response.raw.value("asynchronousProcessing", false);
        response.large_file_async = response.raw.value("largeFileAsynchronousHandling", false);
        if (response.raw.contains("fileResults")) {
            for (const auto& node : response.raw.at("fileResults")) {
                FileCompletionResult result;
                result.key = node.at("relativeKey").get<std::string>();
                result.upload_file_id = node.value("uploadIdS3", std::string());
                result.success = node.value("success", false);
                if (node.contains("error") && node.at("error").is_string()) {
                    result.error = node.at("error").get<std::string>();
                }
                response.file_results.push_back(std::move(result));
            }
        }
        return Ok(std::move(response));
    } catch (const json::exception& e) {
        return Err<CompleteUploadResponse>(Error(ErrorCode::ApiError,
            std::string("malformed completion response: ") + e.what(), status));
    }
}

Result<DownloadTarget> parse_download_target(const json& body) {
    try {
        DownloadTarget target;
        target.url = body.at("downloadUrl").get<std::string>();
        target.expires_in_seconds = body.value("expiresIn", target.expires_in_seconds);
        return Ok(std::move(target));
    } catch (const json::exception& e) {
        return Err<DownloadTarget>(ErrorCode::ApiError, std::string("malformed download response: ") + e.what());
    }
}

Error classify_status(long status, const std::string& body, const std::string& context) {
    const std::string detail = context + " (" + std::to_string(status) + "): " + server_message(body);
    if (status == 401 || status == 403) {
        return Error(ErrorCode::Authentication, "Authentication failed: " + detail, status);
    }
    if (status == 404) {
        return Error(ErrorCode::NotFound, detail, status);
    }
    return Error(ErrorCode::ApiError, detail, status);
}

Result<FileListPage> parse_file_list(const json& body) {
    try {
        FileListPage page;
        for (const auto& node : body.at("items")) {
            AssetFileEntry entry;
            entry.key = node.at("relativePath").get<std::string>();
            entry.is_folder = node.value("isFolder", false);
            if (node.contains("size") && node.at("size").is_number_unsigned()) {
                entry.size = node.at("size").get<std::uint64_t>();
            }
            page.entries.push_back(std::move(entry));
        }
        if (body.contains("NextToken") && body.at("NextToken").is_string() &&
            !body.at("NextToken").get<std::string>().empty()) {
            page.next_token = body.at("NextToken").get<std::string>();
        }
        return Ok(std::move(page));
    } catch (const json::exception& e) {
        return Err<FileListPage>(ErrorCode::ApiError, std::string("malformed file listing: ") + e.what());
    }
}

std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& value) {
    if (value.empty() || value.size() > 9 ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(std::stoll(value) * 1000);
}

RestAssetApi::RestAssetApi(core::ApiConfig config,
                           std::string database_id,
                           std::string asset_id,
                           core::RetryPolicy rate_limit_retry,
                           Transport transport,
                           transfer::Sleeper sleeper)
    : config_(std::move(config)),
      database_id_(std::move(database_id)),
      asset_id_(std::move(asset_id)),
      rate_limit_retry_(rate_limit_retry),
      transport_(std::move(transport)),
      sleeper_(std::move(sleeper)) {}

HttpRequest RestAssetApi::make_request(const std::string& method, const std::string& path) const {
    HttpRequest request;
    request.method = method;
    request.url = join_url(config_.base_url, path);
    request.headers = {
        "Accept: application/json",
        "Authorization: Bearer " + config_.access_token,
    };
    request.connect_timeout = config_.connect_timeout;
    request.timeout = std::chrono::seconds(120);
    return request;
}

Result<HttpResponse> RestAssetApi::send(const HttpRequest& request) {
    for (std::uint32_t attempt = 0;; ++attempt) {
        auto sent = transport_(request);
        if (sent.is_error() || sent.value().status != 429 || attempt >= rate_limit_retry_.max_retries) {
            // A final 429 goes back to the caller to be classified like any other status
            return sent;
        }
        const auto delay = parse_retry_after(sent.value().header("retry-after"))
                               .value_or(transfer::backoff_delay(rate_limit_retry_, attempt));
        spdlog::warn("[ApiThrottled] {} {} attempt={}/{} retry_in={}ms",
                     request.method, request.url, attempt + 1, rate_limit_retry_.max_retries + 1,
                     delay.count());
        if (delay.count() > 0) {
            sleeper_(delay);
        }
    }
}

Result<HttpResponse> RestAssetApi::post_json(const std::string& path, const json& body) {
    HttpRequest request = make_request("POST", path);
    request.headers.push_back("Content-Type: application/json");
    try {
        request.body = body.dump();
    } catch (const json::exception& e) {
        // Keys come straight from local file names, which need not be UTF-8
        return Err<HttpResponse>(ErrorCode::ApiError,
            "cannot encode request for " + path + ": " + e.what());
    }
    return send(request);
}

Result<HttpResponse> RestAssetApi::get(const std::string& path_and_query) {
    return send(make_request("GET", path_and_query));
}

Result<InitializeUploadResponse> RestAssetApi::initialize_upload(
    transfer::UploadType upload_type,
    const std::vector<UploadFileRequest>& files) {
    auto response = post_json("/uploads", build_initialize_body(database_id_, asset_id_, upload_type, files));
    if (response.is_error()) {
        return Err<InitializeUploadResponse>(response.error());
    }
    const auto& reply = response.value();
    if (!reply.ok()) {
        if (reply.status == 404) {
            return Err<InitializeUploadResponse>(Error(ErrorCode::NotFound,
                "Asset '" + asset_id_ + "' not found in database '" + database_id_ + "'", reply.status));
        }
        return Err<InitializeUploadResponse>(classify_status(reply.status, reply.body, "Upload initialization failed"));
    }

    const auto body = json::parse(reply.body, nullptr, false);
    if (body.is_discarded()) {
        return Err<InitializeUploadResponse>(ErrorCode::ApiError, "initialize response is not valid JSON");
    }
    return parse_initialize_response(body);
}

Result<CompleteUploadResponse> RestAssetApi::complete_upload(
    const std::string& session_id,
    transfer::UploadType upload_type,
    const std::vector<CompleteFileRequest>& files) {
    auto response = post_json("/uploads/" + session_id + "/complete",
                              build_complete_body(database_id_, asset_id_, upload_type, files));
    if (response.is_error()) {
        return Err<CompleteUploadResponse>(response.error());
    }
    return parse_complete_response(response.value().status, response.value().body);
}

Result<DownloadTarget> RestAssetApi::get_download_target(const std::string& key) {
    const json body = {{"downloadType", "assetFile"}, {"key", key}};
    auto response = post_json("/database/" + database_id_ + "/assets/" + asset_id_ + "/download", body);
    if (response.is_error()) {
        return Err<DownloadTarget>(response.error());
    }
    const auto& reply = response.value();
    if (!reply.ok()) {
        return Err<DownloadTarget>(classify_status(reply.status, reply.body, "Download request for '" + key + "' failed"));
    }

    const auto parsed = json::parse(reply.body, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<DownloadTarget>(ErrorCode::ApiError, "download response is not valid JSON");
    }
    return parse_download_target(parsed);
}

Result<std::vector<AssetFileEntry>> RestAssetApi::list_files() {
    const std::string path = "/database/" + database_id_ + "/assets/" + asset_id_ + "/listFiles";
    std::vector<AssetFileEntry> entries;
    std::optional<std::string> token;

    do {
        std::string query = path + "?includeArchived=false&maxItems=1000";
        if (token) {
            query += "&startingToken=" + url_encode(*token);
        }
        auto response = get(query);
        if (response.is_error()) {
            return Err<std::vector<AssetFileEntry>>(response.error());
        }
        const auto& reply = response.value();
        if (reply.status == 404) {
            return Err<std::vector<AssetFileEntry>>(Error(ErrorCode::NotFound,
                "Asset '" + asset_id_ + "' not found in database '" + database_id_ + "'", reply.status));
        }
        if (!reply.ok()) {
            return Err<std::vector<AssetFileEntry>>(classify_status(reply.status, reply.body, "Failed to list files"));
        }

        const auto parsed = json::parse(reply.body, nullptr, false);
        if (parsed.is_discarded()) {
            return Err<std::vector<AssetFileEntry>>(ErrorCode::ApiError, "file listing is not valid JSON");
        }
        auto page = parse_file_list(parsed);
        if (page.is_error()) {
            return Err<std::vector<AssetFileEntry>>(page.error());
        }
        auto listed = page.take();
        entries.insert(entries.end(), std::make_move_iterator(listed.entries.begin()),
                       std::make_move_iterator(listed.entries.end()));
        if (listed.next_token && token && *listed.next_token == *token) {
            return Err<std::vector<AssetFileEntry>>(ErrorCode::ApiError, "file listing repeated its page token");
        }
        token = std::move(listed.next_token);
    } while (token);

    spdlog::debug("[FilesListed] asset={} entries={}", asset_id_, entries.size());
    return Ok(std::move(entries));
}

} // namespace atx::net
