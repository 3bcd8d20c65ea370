#pragma once

#include <string>
#include <string_view>

namespace bulkup {

enum class ErrorCode {
    RootNotFound,
    NotADirectory,
    InvalidArgument,
    Io,
    Parse,
    Authentication,
    Network,
    RemoteService,
    File,
    Cancelled
};

/**
 * @brief Error payload carried by bulkup::Result
 *
 * The code is informational; callers in the transfer core only ever surface
 * the message as a per-file reason.
 */
struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

inline std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::RootNotFound: return "root not found";
        case ErrorCode::NotADirectory: return "not a directory";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::Io: return "i/o error";
        case ErrorCode::Parse: return "parse error";
        case ErrorCode::Authentication: return "authentication failure";
        case ErrorCode::Network: return "network failure";
        case ErrorCode::RemoteService: return "remote service failure";
        case ErrorCode::File: return "file error";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace bulkup
