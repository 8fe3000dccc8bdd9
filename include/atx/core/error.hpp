#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace atx {

/**
 * @brief Failure categories reported by planning, control-plane and data-plane code
 *
 * Planning codes are fatal before any network call. Control-plane codes fail a
 * single sequence (or the whole run when raised before planning completes).
 * Data-plane codes are transient and retried until the retry ceiling is hit.
 */
enum class ErrorCode {
    // Planning
    InvalidFile,
    FileTooLarge,
    PreviewFile,
    TooManyParts,
    NoFiles,
    // Configuration
    InvalidConfig,
    // Control plane
    ApiError,
    Authentication,
    NotFound,
    // Data plane
    Network,
    HttpStatus,
    MissingCompletionToken,
    Io,
    // Finalize
    FinalizeFailed,
    // A driver stopped on an unexpected exception
    Internal
};

std::string_view error_code_name(ErrorCode code) noexcept;

struct Error {
    ErrorCode code = ErrorCode::ApiError;
    std::string message;
    std::optional<long> http_status; ///< Set when the failure came from an HTTP response

    Error() = default;
    Error(ErrorCode c, std::string msg, std::optional<long> status = std::nullopt)
        : code(c), message(std::move(msg)), http_status(status) {}

    /// "<code>: <message>" for log lines and reports
    std::string describe() const;
};

} // namespace atx
