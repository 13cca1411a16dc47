#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace ctxsys::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,
    AlreadyExists = 4,
    InternalError = 5,
    InvalidState = 6,

    // Storage errors (100-199)
    DatabaseOpenFailed = 100,
    DatabaseError = 101,
    TransactionFailed = 102,
    SerializationFailed = 103,
    ProjectNotInitialized = 104,

    // Checkpoint errors (200-299)
    CheckpointNotFound = 200,
    CheckpointSaveFailed = 201,

    // Execution errors (300-399)
    StepFailed = 300,
    NoStepRunner = 301,
    UnknownAction = 302,

    // Memory tier errors (400-499)
    MemoryItemNotFound = 400,
    InvalidTier = 401,

    // Embedding errors (500-599)
    EmbeddingFailed = 500,
    EmbeddingUnavailable = 501,
    EmbeddingInvalidResponse = 502,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,
    ConfigWriteFailed = 603,

    // Network errors (800-899)
    NetworkError = 800,
    ConnectionRefused = 801,
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

        case ErrorCode::DatabaseOpenFailed: return "Failed to open database";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::TransactionFailed: return "Transaction failed";
        case ErrorCode::SerializationFailed: return "Failed to serialize or parse stored data";
        case ErrorCode::ProjectNotInitialized: return "Project tables not initialized";

        case ErrorCode::CheckpointNotFound: return "Checkpoint not found";
        case ErrorCode::CheckpointSaveFailed: return "Failed to save checkpoint";

        case ErrorCode::StepFailed: return "Step execution failed";
        case ErrorCode::NoStepRunner: return "No step runner configured";
        case ErrorCode::UnknownAction: return "Unknown action";

        case ErrorCode::MemoryItemNotFound: return "Memory item not found";
        case ErrorCode::InvalidTier: return "Invalid memory tier";

        case ErrorCode::EmbeddingFailed: return "Embedding request failed";
        case ErrorCode::EmbeddingUnavailable: return "Embedding provider unavailable";
        case ErrorCode::EmbeddingInvalidResponse: return "Invalid response from embedding provider";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";
        case ErrorCode::ConfigWriteFailed: return "Failed to write configuration";

        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionRefused: return "Connection refused";
    }
    return "Unknown error code";
}

// Transient failures a caller may reasonably try again
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::TransactionFailed:
        case ErrorCode::EmbeddingUnavailable:
        case ErrorCode::NetworkError:
        case ErrorCode::ConnectionRefused:
            return true;
        default:
            return false;
    }
}

struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // checkpoint id, item id, SQL, path...

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    bool is_retriable() const { return ctxsys::core::is_retriable(code); }

    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

}  // namespace ctxsys::core
