#pragma once

#include "mist/core/result.hpp"

#include <filesystem>
#include <string>

namespace mist::crypto {

/**
 * @brief Public-key file encryption capability
 *
 * Implementations must report failures distinctly:
 * - ErrorCode::KeyNotFound         recipient has no usable public key
 * - ErrorCode::DecryptFailed       wrong key, corrupt input, no private key
 * - ErrorCode::BackendUnavailable  the backend itself cannot be run
 *
 * Neither call may modify or remove `input`.
 */
class EncryptionBackend {
public:
    virtual ~EncryptionBackend() = default;

    virtual Result<void> check_recipient(const std::string& recipient) = 0;

    virtual Result<void> encrypt_file(const std::filesystem::path& input,
                                      const std::filesystem::path& output,
                                      const std::string& recipient) = 0;

    virtual Result<void> decrypt_file(const std::filesystem::path& input,
                                      const std::filesystem::path& output) = 0;
};

} // namespace mist::crypto
