#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    MissingFile,
    UnsupportedFormat,
    FileTooLarge,
    StorageError,
    ModelUnavailable,
    InferenceError,
};

struct TranscribeError {
    ErrorKind kind;
    std::string detail;
    // Set for ModelUnavailable while the model is still loading.
    bool retryable = false;
};

// Stable identifier used in error response bodies, e.g. "file_too_large".
constexpr std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingFile: return "missing_file";
        case ErrorKind::UnsupportedFormat: return "unsupported_format";
        case ErrorKind::FileTooLarge: return "file_too_large";
        case ErrorKind::StorageError: return "storage_error";
        case ErrorKind::ModelUnavailable: return "model_unavailable";
        case ErrorKind::InferenceError: return "inference_error";
    }
    return "internal_error";
}

constexpr int http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingFile:
        case ErrorKind::UnsupportedFormat:
            return 400;
        case ErrorKind::FileTooLarge:
            return 413;
        case ErrorKind::ModelUnavailable:
            return 503;
        case ErrorKind::StorageError:
        case ErrorKind::InferenceError:
            return 500;
    }
    return 500;
}
