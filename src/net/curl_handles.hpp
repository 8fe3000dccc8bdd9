#pragma once

#include "atx/net/http.hpp"

#include <curl/curl.h>

#include <map>
#include <memory>
#include <string>

namespace atx::net::detail {

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

/// CURLOPT_WRITEFUNCTION appending into the std::string passed as userdata
inline size_t append_body(char* data, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(data, size * nmemb);
    return size * nmemb;
}

/// CURLOPT_HEADERFUNCTION filling the std::map<std::string, std::string> passed as userdata
inline size_t collect_header(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string name;
    std::string value;
    if (parse_header_line(std::string(data, size * nmemb), name, value)) {
        (*headers)[name] = value;
    }
    return size * nmemb;
}

} // namespace atx::net::detail
