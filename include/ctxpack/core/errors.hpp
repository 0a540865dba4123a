#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace ctxpack::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,
    AlreadyExists = 4,
    InternalError = 9,
    InvalidState = 10,

    // Thread store errors (100-199)
    ThreadNotFound = 100,
    StoreLockTimeout = 101,
    StoreBackendFailed = 102,
    ThreadCorrupted = 103,
    NoActiveThread = 104,

    // Transport errors (200-299)
    TransportUnavailable = 200,
    TransportFailed = 201,

    // Tokenizer errors (300-399)
    EncodingNotFound = 300,
    EncodingParseFailed = 301,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,

    // File system errors (700-799)
    FileNotFound = 700,
    FileReadFailed = 701,
    FileWriteFailed = 702,
};

// Get human-readable message for error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvalidState: return "Invalid state";

        case ErrorCode::ThreadNotFound: return "Thread not found";
        case ErrorCode::StoreLockTimeout: return "Timed out waiting for thread store lock";
        case ErrorCode::StoreBackendFailed: return "Thread store backend failure";
        case ErrorCode::ThreadCorrupted: return "Thread data corrupted";
        case ErrorCode::NoActiveThread: return "No active thread";

        case ErrorCode::TransportUnavailable: return "No transport configured";
        case ErrorCode::TransportFailed: return "Transport failed";

        case ErrorCode::EncodingNotFound: return "Tokenizer encoding file not found";
        case ErrorCode::EncodingParseFailed: return "Failed to parse tokenizer encoding";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";

        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadFailed: return "Failed to read file";
        case ErrorCode::FileWriteFailed: return "Failed to write file";
    }
    return "Unknown error code";
}

// Store contention and transport hiccups can succeed on a later attempt
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::StoreLockTimeout:
        case ErrorCode::StoreBackendFailed:
        case ErrorCode::TransportFailed:
            return true;
        default:
            return false;
    }
}

inline bool is_fatal(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigParseFailed:
        case ErrorCode::ConfigValidationFailed:
            return true;
        default:
            return false;
    }
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Thread id, file path, etc.
    std::optional<std::string> source;   // Component that raised it

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    static Error from_code(ErrorCode code, std::string context) {
        Error e{code};
        e.context = std::move(context);
        return e;
    }

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    bool is_retriable() const { return ctxpack::core::is_retriable(code); }
    bool is_fatal() const { return ctxpack::core::is_fatal(code); }

    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        if (source) {
            result += " at " + *source;
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

}  // namespace ctxpack::core
