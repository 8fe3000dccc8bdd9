#include "atx/core/error.hpp"

namespace atx {

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidFile: return "invalid_file";
        case ErrorCode::FileTooLarge: return "file_too_large";
        case ErrorCode::PreviewFile: return "preview_file";
        case ErrorCode::TooManyParts: return "too_many_parts";
        case ErrorCode::NoFiles: return "no_files";
        case ErrorCode::InvalidConfig: return "invalid_config";
        case ErrorCode::ApiError: return "api_error";
        case ErrorCode::Authentication: return "authentication";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::Network: return "network";
        case ErrorCode::HttpStatus: return "http_status";
        case ErrorCode::MissingCompletionToken: return "missing_completion_token";
        case ErrorCode::Io: return "io";
        case ErrorCode::FinalizeFailed: return "finalize_failed";
        case ErrorCode::Internal: return "internal";
    }
    return "unknown";
}

std::string Error::describe() const {
    std::string text(error_code_name(code));
    text += ": ";
    text += message;
    if (http_status) {
        text += " (HTTP " + std::to_string(*http_status) + ")";
    }
    return text;
}

} // namespace atx
