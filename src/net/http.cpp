#include "atx/net/http.hpp"

#include "curl_handles.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace atx::net {
namespace {

using detail::EasyHandle;
using detail::HeaderList;

} // namespace

CurlGlobal::CurlGlobal() {
    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        spdlog::error("[Http] curl_global_init failed: {}", curl_easy_strerror(rc));
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

std::string HttpResponse::header(const std::string& lower_name) const {
    const auto it = headers.find(lower_name);
    return it == headers.end() ? std::string() : it->second;
}

bool parse_header_line(const std::string& line, std::string& name, std::string& value) {
    const auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto begin = line.find_first_not_of(" \t", colon + 1);
    auto end = line.find_last_not_of(" \t\r\n");
    value = (begin == std::string::npos || end < begin) ? std::string() : line.substr(begin, end - begin + 1);
    return true;
}

std::string url_encode(const std::string& value) {
    EasyHandle curl(curl_easy_init());
    if (!curl) {
        return value;
    }
    char* escaped = curl_easy_escape(curl.get(), value.data(), static_cast<int>(value.size()));
    if (escaped == nullptr) {
        return value;
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

Result<HttpResponse> perform(const HttpRequest& request) {
    EasyHandle curl(curl_easy_init());
    if (!curl) {
        return Err<HttpResponse>(ErrorCode::Network, "Failed to init curl");
    }

    HttpResponse response;
    HeaderList header_list;
    for (const auto& header : request.headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
        if (appended == nullptr) {
            return Err<HttpResponse>(ErrorCode::Network, "Failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, detail::append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, detail::collect_header);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connect_timeout.count()));
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }
    if (request.method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return Err<HttpResponse>(ErrorCode::Network,
            request.method + " " + request.url + " failed: " + curl_easy_strerror(rc));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return Ok(std::move(response));
}

} // namespace atx::net
