#pragma once

#include <string>

namespace harvest {

enum class ErrorCode {
    InvalidArgument,
    IoError,
    ParseError,
    NetworkError,
    Timeout,
    Cancelled,
    ArchiveError,
    SessionUnavailable
};

/**
 * @brief Error value carried by Result
 */
struct Error {
    ErrorCode code = ErrorCode::IoError;
    std::string message;
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::IoError: return "io error";
        case ErrorCode::ParseError: return "parse error";
        case ErrorCode::NetworkError: return "network error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::ArchiveError: return "archive error";
        case ErrorCode::SessionUnavailable: return "session unavailable";
    }
    return "unknown";
}

inline std::string describe(const Error& error) {
    return std::string(to_string(error.code)) + ": " + error.message;
}

} // namespace harvest
