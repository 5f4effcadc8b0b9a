#include "mist/crypto/gpg_backend.hpp"
#include "mist/process/command.hpp"

#include <spdlog/spdlog.h>

namespace mist::crypto {
namespace fs = std::filesystem;

namespace {

bool mentions_missing_key(const std::string& output) {
    return output.find("No public key") != std::string::npos ||
           output.find("unusable public key") != std::string::npos ||
           output.find("No such user ID") != std::string::npos ||
           output.find("error reading key") != std::string::npos;
}

std::string first_line(const std::string& output) {
    const auto end = output.find('\n');
    return end == std::string::npos ? output : output.substr(0, end);
}

Error unavailable(const std::string& program) {
    return Error{ErrorCode::BackendUnavailable, "Cannot execute encryption program '" + program + "'"};
}

} // namespace

std::vector<std::string> GpgBackend::list_keys_command(const std::string& recipient) const {
    return {options_.program, "--batch", "--list-keys", "--", recipient};
}

std::vector<std::string> GpgBackend::encrypt_command(const fs::path& input,
                                                     const fs::path& output,
                                                     const std::string& recipient) const {
    std::vector<std::string> argv{options_.program, "--batch", "--yes", "--quiet",
                                  "--trust-model", "always", "--encrypt",
                                  "--recipient", recipient};
    if (options_.armor) {
        argv.emplace_back("--armor");
    }
    argv.insert(argv.end(), {"--output", output.string(), "--", input.string()});
    return argv;
}

std::vector<std::string> GpgBackend::decrypt_command(const fs::path& input, const fs::path& output) const {
    return {options_.program, "--batch", "--yes", "--quiet", "--decrypt",
            "--output", output.string(), "--", input.string()};
}

Result<void> GpgBackend::check_recipient(const std::string& recipient) {
    process::CommandOptions opts;
    opts.cancel = options_.cancel;

    auto run = process::run_command(list_keys_command(recipient), opts);
    if (run.is_error()) {
        return Err<void>(run.error());
    }

    const auto& result = run.value();
    if (result.exit_code == process::kExecFailedStatus) {
        return Err<void>(unavailable(options_.program));
    }
    if (!result.success()) {
        spdlog::debug("gpg --list-keys {} failed: {}", recipient, first_line(result.output));
        return Err<void>(ErrorCode::KeyNotFound, "No public key for recipient '" + recipient + "'");
    }
    return Ok();
}

Result<void> GpgBackend::encrypt_file(const fs::path& input, const fs::path& output, const std::string& recipient) {
    process::CommandOptions opts;
    opts.cancel = options_.cancel;

    auto run = process::run_command(encrypt_command(input, output, recipient), opts);
    if (run.is_error()) {
        return Err<void>(run.error());
    }

    const auto& result = run.value();
    if (result.exit_code == process::kExecFailedStatus) {
        return Err<void>(unavailable(options_.program));
    }
    if (result.success()) {
        return Ok();
    }
    if (mentions_missing_key(result.output)) {
        return Err<void>(Error{ErrorCode::KeyNotFound, "No usable public key for recipient '" + recipient + "'"}
                             .with_path(input));
    }
    return Err<void>(Error{ErrorCode::BackendUnavailable,
                           "gpg exited with status " + std::to_string(result.exit_code) + ": " +
                               first_line(result.output)}
                         .with_path(input));
}

Result<void> GpgBackend::decrypt_file(const fs::path& input, const fs::path& output) {
    process::CommandOptions opts;
    opts.cancel = options_.cancel;

    auto run = process::run_command(decrypt_command(input, output), opts);
    if (run.is_error()) {
        return Err<void>(run.error());
    }

    const auto& result = run.value();
    if (result.exit_code == process::kExecFailedStatus) {
        return Err<void>(unavailable(options_.program));
    }
    if (!result.success()) {
        return Err<void>(Error{ErrorCode::DecryptFailed, "Cannot decrypt artifact: " + first_line(result.output)}
                             .with_path(input));
    }
    return Ok();
}

} // namespace mist::crypto
