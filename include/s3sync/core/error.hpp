#pragma once

#include <string>

namespace s3sync {

/**
 * @brief Failure categories surfaced by the sync pipeline
 *
 * Io           - local stat/open/read/write failures
 * Transport    - object store rejected or failed a Put
 * Ledger       - status or part records could not be persisted
 * Coordination - splitter task failed or broke the channel protocol
 * Cancelled    - caller requested cancellation
 * Config       - invalid or unreadable configuration
 */
enum class ErrorCode {
    Io,
    Transport,
    Ledger,
    Coordination,
    Cancelled,
    Config
};

struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Io: return "io";
        case ErrorCode::Transport: return "transport";
        case ErrorCode::Ledger: return "ledger";
        case ErrorCode::Coordination: return "coordination";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::Config: return "config";
    }
    return "unknown";
}

inline std::string to_string(const Error& error) {
    return std::string(error_code_name(error.code)) + ": " + error.message;
}

} // namespace s3sync
