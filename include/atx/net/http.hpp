#pragma once

#include "atx/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace atx::net {

/**
 * @brief Owns libcurl's process-wide state
 *
 * Construct one on the main thread before any transfer thread starts and keep
 * it alive until every transfer has finished.
 */
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers; ///< "Name: value"
    std::string body;
    std::chrono::seconds timeout{3600};
    std::chrono::seconds connect_timeout{30};
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers; ///< Lower-cased names

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
    [[nodiscard]] std::string header(const std::string& lower_name) const;
};

/// Sends a buffered request. Transport failures map to Network; any HTTP status is a success here.
Result<HttpResponse> perform(const HttpRequest& request);

/// Percent-encodes a query parameter value.
std::string url_encode(const std::string& value);

/// Splits "Name: value\r\n" into a lower-cased name and a trimmed value; false for status lines.
bool parse_header_line(const std::string& line, std::string& name, std::string& value);

} // namespace atx::net
