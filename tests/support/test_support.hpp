#pragma once

#include "atx/core/config.hpp"
#include "atx/net/api_client.hpp"
#include "atx/net/transfer_client.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace atx::test {

namespace fs = std::filesystem;

inline fs::path create_temp_dir(const std::string& prefix = "atx_test_") {
    static std::atomic<uint64_t> counter{0};
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = static_cast<uint64_t>(timestamp) ^ (counter.fetch_add(1) << 8);
    auto unique = fs::temp_directory_path() / fs::path(prefix + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

/// Deterministic bytes so part boundaries can be checked after reassembly
inline std::string pattern_bytes(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>('a' + (i % 26));
    }
    return data;
}

/// Retries without waiting
inline core::RetryPolicy instant_retry(std::uint32_t max_retries) {
    core::RetryPolicy policy;
    policy.max_retries = max_retries;
    policy.base_delay = std::chrono::milliseconds(0);
    policy.max_delay = std::chrono::milliseconds(0);
    policy.jitter = false;
    return policy;
}

/**
 * @brief In-memory AssetApi
 *
 * initialize hands out "mem://<session>/<key>/<part>" targets; complete
 * accepts every listed file unless complete_handler says otherwise.
 * list_files returns listed_files unless list_handler is set.
 */
class FakeAssetApi : public net::AssetApi {
public:
    struct CompleteCall {
        std::string session_id;
        std::vector<net::CompleteFileRequest> files;
    };

    std::function<Result<net::InitializeUploadResponse>(const std::vector<net::UploadFileRequest>&)> initialize_handler;
    std::function<Result<net::CompleteUploadResponse>(const CompleteCall&)> complete_handler;
    std::function<Result<net::DownloadTarget>(const std::string&)> download_handler;
    std::function<Result<std::vector<net::AssetFileEntry>>()> list_handler;
    std::vector<net::AssetFileEntry> listed_files;

    Result<net::InitializeUploadResponse> initialize_upload(
        transfer::UploadType upload_type,
        const std::vector<net::UploadFileRequest>& files) override {
        std::string session_id;
        {
            std::lock_guard lock(mutex_);
            initialize_calls_.push_back(files);
            last_upload_type_ = upload_type;
            session_id = "session-" + std::to_string(initialize_calls_.size());
        }
        if (initialize_handler) {
            return initialize_handler(files);
        }

        net::InitializeUploadResponse response;
        response.session_id = session_id;
        for (const auto& file : files) {
            net::InitializedFile initialized;
            initialized.key = file.key;
            initialized.upload_file_id = "s3-" + file.key;
            for (std::size_t n = 1; n <= file.part_count; ++n) {
                initialized.part_targets.push_back({static_cast<std::uint32_t>(n),
                    "mem://" + session_id + "/" + file.key + "/" + std::to_string(n)});
            }
            response.files.push_back(std::move(initialized));
        }
        return Ok(std::move(response));
    }

    Result<net::CompleteUploadResponse> complete_upload(
        const std::string& session_id,
        transfer::UploadType,
        const std::vector<net::CompleteFileRequest>& files) override {
        CompleteCall call{session_id, files};
        {
            std::lock_guard lock(mutex_);
            complete_calls_.push_back(call);
        }
        if (complete_handler) {
            return complete_handler(call);
        }

        net::CompleteUploadResponse response;
        response.overall_success = true;
        for (const auto& file : files) {
            response.file_results.push_back({file.key, file.upload_file_id, true, ""});
        }
        return Ok(std::move(response));
    }

    Result<net::DownloadTarget> get_download_target(const std::string& key) override {
        if (download_handler) {
            return download_handler(key);
        }
        return Ok(net::DownloadTarget{"mem://download/" + key, 3600});
    }

    Result<std::vector<net::AssetFileEntry>> list_files() override {
        {
            std::lock_guard lock(mutex_);
            ++list_calls_;
        }
        if (list_handler) {
            return list_handler();
        }
        return Ok(listed_files);
    }

    int list_calls() const {
        std::lock_guard lock(mutex_);
        return list_calls_;
    }

    std::vector<std::vector<net::UploadFileRequest>> initialize_calls() const {
        std::lock_guard lock(mutex_);
        return initialize_calls_;
    }

    std::vector<CompleteCall> complete_calls() const {
        std::lock_guard lock(mutex_);
        return complete_calls_;
    }

    transfer::UploadType last_upload_type() const {
        std::lock_guard lock(mutex_);
        return last_upload_type_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::vector<net::UploadFileRequest>> initialize_calls_;
    std::vector<CompleteCall> complete_calls_;
    transfer::UploadType last_upload_type_ = transfer::UploadType::AssetFile;
    int list_calls_ = 0;
};

/**
 * @brief In-memory TransferClient
 *
 * Uploaded bytes are kept per URL. failures_before_success[url] makes the
 * first N calls for that URL fail; a negative count fails forever.
 */
class FakeTransferClient : public net::TransferClient {
public:
    std::map<std::string, int> failures_before_success;
    std::map<std::string, std::string> downloads; ///< url -> body
    std::function<std::chrono::milliseconds(const std::string&)> delay_for;
    bool omit_etag = false;

    Result<std::string> put_part(const std::string& url, const std::vector<char>& bytes) override {
        enter();
        pause(url);
        auto outcome = [&]() -> Result<std::string> {
            std::lock_guard lock(mutex_);
            ++calls_[url];
            if (should_fail_locked(url)) {
                return Err<std::string>(Error(ErrorCode::HttpStatus, "injected failure for " + url, 500L));
            }
            uploads_[url] = std::string(bytes.begin(), bytes.end());
            if (omit_etag) {
                return Err<std::string>(ErrorCode::MissingCompletionToken, "no ETag in part upload response");
            }
            return Ok(std::string("etag-") + std::to_string(std::hash<std::string>{}(url)));
        }();
        leave();
        return outcome;
    }

    Result<std::uint64_t> get_to_stream(const std::string& url,
                                        std::ostream& out,
                                        const ByteCallback& on_bytes) override {
        enter();
        pause(url);
        std::string body;
        bool fail = false;
        {
            std::lock_guard lock(mutex_);
            ++calls_[url];
            fail = should_fail_locked(url);
            const auto it = downloads.find(url);
            if (it == downloads.end()) {
                leave();
                return Err<std::uint64_t>(Error(ErrorCode::HttpStatus, "no such object " + url, 404L));
            }
            body = it->second;
        }

        // Write half the body before failing so callers see a partial file
        const std::size_t limit = fail ? body.size() / 2 : body.size();
        std::uint64_t written = 0;
        const std::size_t step = 7;
        for (std::size_t offset = 0; offset < limit; offset += step) {
            const std::size_t count = std::min(step, limit - offset);
            out.write(body.data() + offset, static_cast<std::streamsize>(count));
            written += count;
            if (on_bytes) {
                on_bytes(written);
            }
        }
        leave();
        if (fail) {
            return Err<std::uint64_t>(ErrorCode::Network, "connection reset during " + url);
        }
        return Ok(written);
    }

    int calls(const std::string& url) const {
        std::lock_guard lock(mutex_);
        const auto it = calls_.find(url);
        return it == calls_.end() ? 0 : it->second;
    }

    std::map<std::string, std::string> uploads() const {
        std::lock_guard lock(mutex_);
        return uploads_;
    }

    int total_calls() const {
        std::lock_guard lock(mutex_);
        int total = 0;
        for (const auto& [url, count] : calls_) {
            total += count;
        }
        return total;
    }

    int peak_in_flight() const { return peak_.load(); }

private:
    bool should_fail_locked(const std::string& url) {
        auto it = failures_before_success.find(url);
        if (it == failures_before_success.end() || it->second == 0) {
            return false;
        }
        if (it->second > 0) {
            --it->second;
        }
        return true;
    }

    void pause(const std::string& url) {
        if (delay_for) {
            const auto delay = delay_for(url);
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
        }
    }

    void enter() {
        const int now = ++in_flight_;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }
    }

    void leave() { --in_flight_; }

    mutable std::mutex mutex_;
    std::map<std::string, int> calls_;
    std::map<std::string, std::string> uploads_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_{0};
};

} // namespace atx::test
