#include "error.hpp"

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::Conflict: return "Conflict";
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::AlreadyExists: return "AlreadyExists";
    case ErrorCode::AlreadyFenced: return "AlreadyFenced";
    case ErrorCode::AlreadyUnfenced: return "AlreadyUnfenced";
    case ErrorCode::ConflictingFenceState: return "ConflictingFenceState";
    case ErrorCode::MissingExternalSource: return "MissingExternalSource";
    case ErrorCode::SnapshotFailed: return "SnapshotFailed";
    case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
    case ErrorCode::ParseError: return "ParseError";
    case ErrorCode::IoFailed: return "IoFailed";
    case ErrorCode::Unavailable: return "Unavailable";
    case ErrorCode::Cancelled: return "Cancelled";
    case ErrorCode::Timeout: return "Timeout";
    case ErrorCode::Internal: return "Internal";
    }
    return "Unknown";
}

bool isRetryable(ErrorCode code) {
    switch (code) {
    case ErrorCode::Conflict:
    case ErrorCode::Unavailable:
    case ErrorCode::IoFailed:
    case ErrorCode::Cancelled:
    case ErrorCode::Timeout:
        return true;
    default:
        return false;
    }
}

std::string describe(const Error& error) {
    return std::string(errorCodeName(error.code)) + ": " + error.message;
}
