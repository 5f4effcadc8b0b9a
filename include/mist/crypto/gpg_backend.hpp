#pragma once

#include "mist/core/cancellation.hpp"
#include "mist/crypto/backend.hpp"

#include <string>
#include <vector>

namespace mist::crypto {

/**
 * @brief EncryptionBackend that shells out to GnuPG in batch mode
 *
 * EXAMPLE:
 * GpgBackend gpg({"gpg", false, &token});
 * gpg.encrypt_file("notes.txt", "notes.txt.gpg", "ABCD1234");
 */
class GpgBackend : public EncryptionBackend {
public:
    struct Options {
        std::string program = "gpg";
        bool armor = false;
        const CancellationToken* cancel = nullptr;
    };

    GpgBackend() = default;
    explicit GpgBackend(Options options) : options_(std::move(options)) {}

    Result<void> check_recipient(const std::string& recipient) override;

    Result<void> encrypt_file(const std::filesystem::path& input,
                              const std::filesystem::path& output,
                              const std::string& recipient) override;

    Result<void> decrypt_file(const std::filesystem::path& input,
                              const std::filesystem::path& output) override;

    // Command lines are exposed for tests; nothing is executed.
    [[nodiscard]] std::vector<std::string> list_keys_command(const std::string& recipient) const;
    [[nodiscard]] std::vector<std::string> encrypt_command(const std::filesystem::path& input,
                                                           const std::filesystem::path& output,
                                                           const std::string& recipient) const;
    [[nodiscard]] std::vector<std::string> decrypt_command(const std::filesystem::path& input,
                                                           const std::filesystem::path& output) const;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    Options options_;
};

} // namespace mist::crypto
