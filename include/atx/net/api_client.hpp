#pragma once

#include "atx/core/config.hpp"
#include "atx/core/result.hpp"
#include "atx/net/http.hpp"
#include "atx/transfer/retry.hpp"
#include "atx/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace atx::net {

struct UploadFileRequest {
    std::string key;
    std::uint64_t size = 0;
    std::size_t part_count = 0;
};

struct PartTarget {
    std::uint32_t part_number = 0;
    std::string url;
};

struct InitializedFile {
    std::string key;
    std::string upload_file_id;
    std::vector<PartTarget> part_targets;
};

struct InitializeUploadResponse {
    std::string session_id;
    std::vector<InitializedFile> files;
    std::string message;
};

struct CompletedPart {
    std::uint32_t part_number = 0;
    std::string token;
};

struct CompleteFileRequest {
    std::string key;
    std::string upload_file_id;
    std::vector<CompletedPart> parts; ///< Ascending part numbers; empty for zero-byte files
};

struct FileCompletionResult {
    std::string key;
    std::string upload_file_id;
    bool success = false;
    std::string error;
};

struct CompleteUploadResponse {
    std::vector<FileCompletionResult> file_results;
    bool overall_success = false;
    bool asynchronous_processing = false; ///< Server accepted the commit for later processing
    bool large_file_async = false;        ///< Large files are being processed after the response
    std::string message;
    nlohmann::json raw;
};

struct DownloadTarget {
    std::string url;
    std::int64_t expires_in_seconds = 86400;
};

/// One entry of an asset's file listing
struct AssetFileEntry {
    std::string key; ///< relativePath, leading '/'
    bool is_folder = false;
    std::optional<std::uint64_t> size;
};

struct FileListPage {
    std::vector<AssetFileEntry> entries;
    std::optional<std::string> next_token;
};

/**
 * @brief Control-plane operations of the asset API
 *
 * Implementations must be safe to call from several sequence drivers at once.
 */
class AssetApi {
public:
    virtual ~AssetApi() = default;

    virtual Result<InitializeUploadResponse> initialize_upload(
        transfer::UploadType upload_type,
        const std::vector<UploadFileRequest>& files) = 0;

    virtual Result<CompleteUploadResponse> complete_upload(
        const std::string& session_id,
        transfer::UploadType upload_type,
        const std::vector<CompleteFileRequest>& files) = 0;

    virtual Result<DownloadTarget> get_download_target(const std::string& key) = 0;

    /// Every file and folder object of the asset, archived files excluded
    virtual Result<std::vector<AssetFileEntry>> list_files() = 0;
};

// Payload codecs, exposed for tests
nlohmann::json build_initialize_body(const std::string& database_id,
                                     const std::string& asset_id,
                                     transfer::UploadType upload_type,
                                     const std::vector<UploadFileRequest>& files);

nlohmann::json build_complete_body(const std::string& database_id,
                                   const std::string& asset_id,
                                   transfer::UploadType upload_type,
                                   const std::vector<CompleteFileRequest>& files);

Result<InitializeUploadResponse> parse_initialize_response(const nlohmann::json& body);

/**
 * @brief Interprets a complete-upload reply
 *
 * 2xx and 409 carry per-file results. 503 means the server queued the commit
 * and is reported as an asynchronous success. Other statuses map through
 * classify_status().
 */
Result<CompleteUploadResponse> parse_complete_response(long status, const std::string& body);

Result<DownloadTarget> parse_download_target(const nlohmann::json& body);

Result<FileListPage> parse_file_list(const nlohmann::json& body);

/// Delay asked for by a Retry-After header given in seconds; empty for anything else
std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& value);

/// 401/403 -> Authentication, 404 -> NotFound, anything else -> ApiError
Error classify_status(long status, const std::string& body, const std::string& context);

/**
 * @brief AssetApi over HTTPS with bearer-token authentication
 *
 * Requests answered with 429 are retried with rate_limit_retry, waiting for
 * the server's Retry-After when it sends one. Transport failures are not
 * retried: a lost reply to a complete call may still have committed it.
 */
class RestAssetApi : public AssetApi {
public:
    using Transport = std::function<Result<HttpResponse>(const HttpRequest&)>;

    RestAssetApi(core::ApiConfig config,
                 std::string database_id,
                 std::string asset_id,
                 core::RetryPolicy rate_limit_retry,
                 Transport transport = perform,
                 transfer::Sleeper sleeper = transfer::thread_sleeper());

    Result<InitializeUploadResponse> initialize_upload(
        transfer::UploadType upload_type,
        const std::vector<UploadFileRequest>& files) override;

    Result<CompleteUploadResponse> complete_upload(
        const std::string& session_id,
        transfer::UploadType upload_type,
        const std::vector<CompleteFileRequest>& files) override;

    Result<DownloadTarget> get_download_target(const std::string& key) override;

    Result<std::vector<AssetFileEntry>> list_files() override;

private:
    Result<HttpResponse> post_json(const std::string& path, const nlohmann::json& body);
    Result<HttpResponse> get(const std::string& path_and_query);
    HttpRequest make_request(const std::string& method, const std::string& path) const;
    Result<HttpResponse> send(const HttpRequest& request);

    core::ApiConfig config_;
    std::string database_id_;
    std::string asset_id_;
    core::RetryPolicy rate_limit_retry_;
    Transport transport_;
    transfer::Sleeper sleeper_;
};

} // namespace atx::net
