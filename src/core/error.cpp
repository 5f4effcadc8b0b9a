#include "mist/core/error.hpp"

#include <sstream>

namespace mist {

ErrorCategory category_of(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NoFileFound:
        case ErrorCode::ParseError:
        case ErrorCode::DuplicateProfile:
        case ErrorCode::MissingField:
        case ErrorCode::InvalidValue:
        case ErrorCode::NotFound:
            return ErrorCategory::Config;
        case ErrorCode::KeyNotFound:
        case ErrorCode::UnsupportedFileType:
        case ErrorCode::DecryptFailed:
        case ErrorCode::BackendUnavailable:
            return ErrorCategory::Encryption;
        case ErrorCode::TransportFailure:
        case ErrorCode::EngineFailure:
        case ErrorCode::AlreadyRunning:
            return ErrorCategory::Sync;
        case ErrorCode::StagingCreateFailed:
        case ErrorCode::StagingRemoveFailed:
        case ErrorCode::Filesystem:
            return ErrorCategory::IO;
        case ErrorCode::Cancelled:
        case ErrorCode::Declined:
            return ErrorCategory::Session;
    }
    return ErrorCategory::IO;
}

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NoFileFound: return "NoFileFound";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::DuplicateProfile: return "DuplicateProfile";
        case ErrorCode::MissingField: return "MissingField";
        case ErrorCode::InvalidValue: return "InvalidValue";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::KeyNotFound: return "KeyNotFound";
        case ErrorCode::UnsupportedFileType: return "UnsupportedFileType";
        case ErrorCode::DecryptFailed: return "DecryptFailed";
        case ErrorCode::BackendUnavailable: return "BackendUnavailable";
        case ErrorCode::TransportFailure: return "TransportFailure";
        case ErrorCode::EngineFailure: return "EngineFailure";
        case ErrorCode::AlreadyRunning: return "AlreadyRunning";
        case ErrorCode::StagingCreateFailed: return "StagingCreateFailed";
        case ErrorCode::StagingRemoveFailed: return "StagingRemoveFailed";
        case ErrorCode::Filesystem: return "Filesystem";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Declined: return "Declined";
    }
    return "Unknown";
}

const char* to_string(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::Config: return "config";
        case ErrorCategory::Encryption: return "encryption";
        case ErrorCategory::Sync: return "sync";
        case ErrorCategory::IO: return "io";
        case ErrorCategory::Session: return "session";
    }
    return "unknown";
}

ErrorCategory Error::category() const noexcept {
    return category_of(code);
}

std::string Error::describe() const {
    std::ostringstream oss;
    oss << to_string(code) << ": " << message;
    if (!profile.empty()) {
        oss << " (profile: " << profile;
        if (!field.empty()) {
            oss << ", field: " << field;
        }
        oss << ")";
    }
    if (!path.empty()) {
        oss << " (path: " << path.string() << ")";
    }
    return oss.str();
}

int exit_code_for(const Error& error) noexcept {
    switch (error.code) {
        case ErrorCode::AlreadyRunning: return exit_code::kAlreadyRunning;
        case ErrorCode::Cancelled: return exit_code::kCancelled;
        case ErrorCode::Declined: return exit_code::kDeclined;
        default: break;
    }
    switch (error.category()) {
        case ErrorCategory::Config: return exit_code::kConfig;
        case ErrorCategory::Encryption: return exit_code::kEncryption;
        case ErrorCategory::Sync: return exit_code::kSync;
        case ErrorCategory::IO: return exit_code::kIO;
        case ErrorCategory::Session: return exit_code::kDeclined;
    }
    return exit_code::kIO;
}

} // namespace mist
