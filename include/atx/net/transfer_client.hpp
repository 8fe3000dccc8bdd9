#pragma once

#include "atx/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace atx::net {

/**
 * @brief Data-plane operations against presigned transfer targets
 *
 * One call moves one part or one whole file. Implementations must allow
 * concurrent calls from different worker threads.
 */
class TransferClient {
public:
    using ByteCallback = std::function<void(std::uint64_t total_so_far)>;

    virtual ~TransferClient() = default;

    /// Raw PUT of bytes; returns the completion token (ETag without quotes).
    virtual Result<std::string> put_part(const std::string& url, const std::vector<char>& bytes) = 0;

    /// Whole-body GET written to out; on_bytes runs after every write. Returns bytes written.
    virtual Result<std::uint64_t> get_to_stream(const std::string& url,
                                                std::ostream& out,
                                                const ByteCallback& on_bytes) = 0;
};

/// "\"abc\"" -> "abc"; unquoted tokens pass through
std::string strip_etag_quotes(const std::string& etag);

/**
 * @brief TransferClient backed by libcurl
 *
 * Each call owns its easy handle, so no handle is ever shared between
 * threads. A CurlGlobal must outlive every call.
 */
class CurlTransferClient : public TransferClient {
public:
    CurlTransferClient(std::chrono::seconds request_timeout, std::chrono::seconds connect_timeout);

    Result<std::string> put_part(const std::string& url, const std::vector<char>& bytes) override;

    Result<std::uint64_t> get_to_stream(const std::string& url,
                                        std::ostream& out,
                                        const ByteCallback& on_bytes) override;

private:
    std::chrono::seconds request_timeout_;
    std::chrono::seconds connect_timeout_;
};

} // namespace atx::net
