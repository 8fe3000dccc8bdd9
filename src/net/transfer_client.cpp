#include "atx/net/transfer_client.hpp"

#include "atx/net/http.hpp"

#include "curl_handles.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <map>

namespace atx::net {
namespace {

using detail::EasyHandle;
using detail::HeaderList;

struct UploadSource {
    const std::vector<char>* bytes;
    std::size_t offset = 0;
};

size_t read_upload(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* source = static_cast<UploadSource*>(userdata);
    const std::size_t remaining = source->bytes->size() - source->offset;
    const std::size_t count = std::min(remaining, size * nitems);
    if (count > 0) {
        std::memcpy(buffer, source->bytes->data() + source->offset, count);
        source->offset += count;
    }
    return count;
}

struct DownloadSink {
    CURL* curl;
    std::ostream* out;
    const TransferClient::ByteCallback* on_bytes;
    std::uint64_t written = 0;
    std::string error_body;
};

size_t write_download(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<DownloadSink*>(userdata);
    const size_t count = size * nmemb;

    long status = 0;
    curl_easy_getinfo(sink->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        if (sink->error_body.size() < 1024) {
            sink->error_body.append(data, std::min<size_t>(count, 1024));
        }
        return count;
    }

    sink->out->write(data, static_cast<std::streamsize>(count));
    if (!*sink->out) {
        return 0; // Aborts the transfer with CURLE_WRITE_ERROR
    }
    sink->written += count;
    if (*sink->on_bytes) {
        (*sink->on_bytes)(sink->written);
    }
    return count;
}

} // namespace

std::string strip_etag_quotes(const std::string& etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        return etag.substr(1, etag.size() - 2);
    }
    return etag;
}

CurlTransferClient::CurlTransferClient(std::chrono::seconds request_timeout,
                                       std::chrono::seconds connect_timeout)
    : request_timeout_(request_timeout), connect_timeout_(connect_timeout) {}

Result<std::string> CurlTransferClient::put_part(const std::string& url, const std::vector<char>& bytes) {
    EasyHandle curl(curl_easy_init());
    if (!curl) {
        return Err<std::string>(ErrorCode::Network, "Failed to init curl");
    }

    UploadSource source{&bytes};
    std::string body;
    std::map<std::string, std::string> headers;
    // Presigned targets reject the 100-continue handshake on some gateways
    HeaderList header_list(curl_slist_append(nullptr, "Expect:"));

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, read_upload);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &source);
    curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(bytes.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, detail::append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, detail::collect_header);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(request_timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout_.count()));
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return Err<std::string>(ErrorCode::Network, std::string("part upload failed: ") + curl_easy_strerror(rc));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        return Err<std::string>(Error(ErrorCode::HttpStatus,
            "part upload returned HTTP " + std::to_string(status) + ": " + body.substr(0, 200), status));
    }

    const auto etag = headers.find("etag");
    if (etag == headers.end() || strip_etag_quotes(etag->second).empty()) {
        return Err<std::string>(ErrorCode::MissingCompletionToken, "no ETag in part upload response");
    }
    return Ok(strip_etag_quotes(etag->second));
}

Result<std::uint64_t> CurlTransferClient::get_to_stream(const std::string& url,
                                                        std::ostream& out,
                                                        const ByteCallback& on_bytes) {
    EasyHandle curl(curl_easy_init());
    if (!curl) {
        return Err<std::uint64_t>(ErrorCode::Network, "Failed to init curl");
    }

    DownloadSink sink{curl.get(), &out, &on_bytes};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_download);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(request_timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout_.count()));

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_WRITE_ERROR) {
        return Err<std::uint64_t>(ErrorCode::Io, "failed writing downloaded bytes to disk");
    }
    if (rc != CURLE_OK) {
        return Err<std::uint64_t>(ErrorCode::Network, std::string("download failed: ") + curl_easy_strerror(rc));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        return Err<std::uint64_t>(Error(ErrorCode::HttpStatus,
            "download returned HTTP " + std::to_string(status) + ": " + sink.error_body.substr(0, 200), status));
    }
    return Ok(sink.written);
}

} // namespace atx::net
