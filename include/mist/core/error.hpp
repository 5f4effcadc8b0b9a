#pragma once

#include <filesystem>
#include <string>

namespace mist {

/**
 * @brief Every way a mist invocation can fail
 *
 * Codes are grouped into categories (see ErrorCategory); the category
 * decides the process exit code so scripts can tell a broken config file
 * from a missing key or an unreachable host.
 */
enum class ErrorCode {
    // Configuration
    NoFileFound,
    ParseError,
    DuplicateProfile,
    MissingField,
    InvalidValue,
    NotFound,

    // Encryption backend
    KeyNotFound,
    UnsupportedFileType,
    DecryptFailed,
    BackendUnavailable,

    // Sync engine / transport
    TransportFailure,
    EngineFailure,
    AlreadyRunning,

    // Local filesystem
    StagingCreateFailed,
    StagingRemoveFailed,
    Filesystem,

    // Session control
    Cancelled,
    Declined
};

enum class ErrorCategory {
    Config,
    Encryption,
    Sync,
    IO,
    Session
};

/**
 * @brief Error payload carried by mist::Result
 *
 * `path`, `profile` and `field` are filled in when the failing operation
 * knows them; message() renders them for the user.
 */
struct Error {
    ErrorCode code = ErrorCode::Filesystem;
    std::string message;
    std::filesystem::path path;
    std::string profile;
    std::string field;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    Error& with_path(std::filesystem::path p) {
        path = std::move(p);
        return *this;
    }

    Error& with_profile(std::string name) {
        profile = std::move(name);
        return *this;
    }

    Error& with_field(std::string name) {
        field = std::move(name);
        return *this;
    }

    [[nodiscard]] ErrorCategory category() const noexcept;

    /// "<code>: <message> (path: ...)"
    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] ErrorCategory category_of(ErrorCode code) noexcept;
[[nodiscard]] const char* to_string(ErrorCode code) noexcept;
[[nodiscard]] const char* to_string(ErrorCategory category) noexcept;

namespace exit_code {
constexpr int kDone = 0;
constexpr int kDeclined = 1;
constexpr int kUsage = 2;
constexpr int kConfig = 3;
constexpr int kEncryption = 4;
constexpr int kSync = 5;
constexpr int kAlreadyRunning = 6;
constexpr int kIO = 7;
constexpr int kCancelled = 130;
} // namespace exit_code

[[nodiscard]] int exit_code_for(const Error& error) noexcept;

} // namespace mist
