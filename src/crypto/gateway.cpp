#include "mist/crypto/gateway.hpp"
#include "mist/core/hash.hpp"
#include "mist/events/events.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

namespace mist::crypto {
namespace fs = std::filesystem;

namespace {

struct TreeListing {
    std::vector<std::string> files;
    std::vector<std::string> directories;
};

Result<TreeListing> scan_tree(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Err<TreeListing>(Error{ErrorCode::Filesystem, "Not a directory"}.with_path(root));
    }

    TreeListing listing;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return Err<TreeListing>(Error{ErrorCode::Filesystem, "Cannot read directory: " + ec.message()}
                                    .with_path(root));
    }

    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return Err<TreeListing>(Error{ErrorCode::Filesystem, "Cannot read directory: " + ec.message()}
                                        .with_path(root));
        }

        const auto& entry = *it;
        const auto status = entry.symlink_status(ec);
        const std::string relative = entry.path().lexically_relative(root).generic_string();

        if (fs::is_symlink(status)) {
            return Err<TreeListing>(Error{ErrorCode::UnsupportedFileType, "Symbolic links cannot be encrypted"}
                                        .with_path(entry.path()));
        }
        if (fs::is_directory(status)) {
            listing.directories.push_back(relative);
            continue;
        }
        if (!fs::is_regular_file(status)) {
            return Err<TreeListing>(Error{ErrorCode::UnsupportedFileType, "Special files cannot be encrypted"}
                                        .with_path(entry.path()));
        }
        listing.files.push_back(relative);
    }

    std::sort(listing.files.begin(), listing.files.end());
    std::sort(listing.directories.begin(), listing.directories.end());
    return Ok(std::move(listing));
}

/**
 * @brief "<destination>.partial" that disappears unless committed
 */
class PartialTree {
public:
    explicit PartialTree(fs::path destination)
        : destination_(std::move(destination)), path_(destination_.string() + ".partial") {}

    ~PartialTree() {
        if (!committed_) {
            std::error_code ec;
            fs::remove_all(path_, ec);
            if (ec) {
                spdlog::warn("Failed to remove partial tree {}: {}", path_.string(), ec.message());
            }
        }
    }

    PartialTree(const PartialTree&) = delete;
    PartialTree& operator=(const PartialTree&) = delete;

    Result<void> create() {
        std::error_code ec;
        if (fs::exists(fs::symlink_status(destination_, ec))) {
            return Err<void>(Error{ErrorCode::Filesystem, "Destination already exists"}.with_path(destination_));
        }
        fs::remove_all(path_, ec);
        fs::create_directories(path_, ec);
        if (ec) {
            return Err<void>(Error{ErrorCode::Filesystem, "Cannot create directory: " + ec.message()}
                                 .with_path(path_));
        }
        return Ok();
    }

    Result<void> make_directory(const std::string& relative) {
        std::error_code ec;
        fs::create_directories(path_ / relative, ec);
        if (ec) {
            return Err<void>(Error{ErrorCode::Filesystem, "Cannot create directory: " + ec.message()}
                                 .with_path(path_ / relative));
        }
        return Ok();
    }

    Result<void> commit() {
        std::error_code ec;
        fs::rename(path_, destination_, ec);
        if (ec) {
            return Err<void>(Error{ErrorCode::Filesystem, "Cannot move tree into place: " + ec.message()}
                                 .with_path(destination_));
        }
        committed_ = true;
        return Ok();
    }

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

private:
    fs::path destination_;
    fs::path path_;
    bool committed_ = false;
};

Result<void> ensure_parent(const fs::path& file) {
    std::error_code ec;
    fs::create_directories(file.parent_path(), ec);
    if (ec) {
        return Err<void>(Error{ErrorCode::Filesystem, "Cannot create directory: " + ec.message()}
                             .with_path(file.parent_path()));
    }
    return Ok();
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * Copy a cached artifact to `output` keeping its modification time, so
 * unison -times sees an unchanged file.
 */
bool reuse_artifact(const fs::path& cached, const fs::path& output) {
    std::error_code ec;
    fs::copy_file(cached, output, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return false;
    }
    const auto stamp = fs::last_write_time(cached, ec);
    if (!ec) {
        fs::last_write_time(output, stamp, ec);
    }
    if (ec) {
        fs::remove(output, ec);
        return false;
    }
    return true;
}

// Empty, uniquely named sibling of `target`.
Result<fs::path> reserve_temporary(const fs::path& target) {
    const std::string pattern =
        (target.parent_path() / ("." + target.filename().string() + ".mist-XXXXXX")).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    const int fd = ::mkstemp(name.data());
    if (fd < 0) {
        return Err<fs::path>(Error{ErrorCode::Filesystem,
                                   std::string("Cannot create temporary file: ") + std::strerror(errno)}
                                 .with_path(target));
    }
    ::close(fd);
    return Ok(fs::path(name.data()));
}

} // namespace

std::string artifact_name(const std::string& relative_path) {
    return relative_path + kArtifactSuffix;
}

std::optional<std::string> plaintext_name(const std::string& artifact_path) {
    const std::string suffix = kArtifactSuffix;
    if (artifact_path.size() <= suffix.size() || !ends_with(artifact_path, suffix)) {
        return std::nullopt;
    }
    return artifact_path.substr(0, artifact_path.size() - suffix.size());
}

EncryptionGateway::EncryptionGateway(EncryptionBackend& backend,
                                     events::EventBus& bus,
                                     const CancellationToken* cancel)
    : backend_(backend), bus_(bus), cancel_(cancel) {}

Result<void> EncryptionGateway::check_cancelled() const {
    if (cancel_ != nullptr && cancel_->is_cancelled()) {
        return Err<void>(ErrorCode::Cancelled, "Interrupted");
    }
    return Ok();
}

Result<TreeManifest> EncryptionGateway::encrypt(const fs::path& source,
                                                const std::string& recipient,
                                                const fs::path& destination,
                                                const ReusableArtifacts* reuse) {
    if (auto res = check_cancelled(); res.is_error()) {
        return Err<TreeManifest>(res.error());
    }

    // Reject the whole tree before a single artifact is written
    auto listing = scan_tree(source);
    if (listing.is_error()) {
        return Err<TreeManifest>(listing.error());
    }

    PartialTree partial(destination);
    if (auto res = partial.create(); res.is_error()) {
        return Err<TreeManifest>(res.error());
    }
    for (const auto& dir : listing.value().directories) {
        if (auto res = partial.make_directory(dir); res.is_error()) {
            return Err<TreeManifest>(res.error());
        }
    }

    TreeManifest manifest;
    manifest.root = destination;

    for (const auto& relative : listing.value().files) {
        if (auto res = check_cancelled(); res.is_error()) {
            return Err<TreeManifest>(res.error());
        }

        const fs::path input = source / relative;
        const fs::path output = partial.path() / artifact_name(relative);

        auto digest = hash_file(input);
        if (digest.is_error()) {
            return Err<TreeManifest>(digest.error());
        }

        std::error_code ec;
        ManifestEntry entry;
        entry.path = relative;
        entry.size = fs::file_size(input, ec);
        entry.digest = digest.value();
        if (ec) {
            return Err<TreeManifest>(Error{ErrorCode::Filesystem, "Cannot stat file: " + ec.message()}
                                         .with_path(input));
        }

        if (auto res = ensure_parent(output); res.is_error()) {
            return Err<TreeManifest>(res.error());
        }

        std::optional<fs::path> previous;
        if (reuse != nullptr) {
            previous = reuse->find_artifact(relative, entry.digest, recipient);
        }

        if (previous && reuse_artifact(*previous, output)) {
            entry.reused = true;
        } else {
            if (previous) {
                spdlog::debug("Cached artifact for {} unusable, re-encrypting", relative);
            }
            if (auto res = backend_.encrypt_file(input, output, recipient); res.is_error()) {
                Error error = res.error();
                if (error.path.empty()) {
                    error.with_path(input);
                }
                return Err<TreeManifest>(std::move(error));
            }
        }

        bus_.emit(events::ArtifactEncryptedEvent{relative, entry.size, entry.reused});
        manifest.entries.push_back(std::move(entry));
    }

    if (auto res = partial.commit(); res.is_error()) {
        return Err<TreeManifest>(res.error());
    }
    return Ok(std::move(manifest));
}

Result<TreeManifest> EncryptionGateway::decrypt(const fs::path& ciphertext,
                                                const fs::path& destination,
                                                const std::optional<std::set<std::string>>& only) {
    if (auto res = check_cancelled(); res.is_error()) {
        return Err<TreeManifest>(res.error());
    }

    auto listing = scan_tree(ciphertext);
    if (listing.is_error()) {
        return Err<TreeManifest>(listing.error());
    }

    // Validate names up front so a stray file fails before any decryption
    std::vector<std::pair<std::string, std::string>> work;
    for (const auto& artifact : listing.value().files) {
        auto plain = plaintext_name(artifact);
        if (!plain) {
            return Err<TreeManifest>(Error{ErrorCode::UnsupportedFileType, "Not an encrypted artifact"}
                                         .with_path(ciphertext / artifact));
        }
        if (only && only->count(*plain) == 0) {
            continue;
        }
        work.emplace_back(artifact, *plain);
    }

    PartialTree partial(destination);
    if (auto res = partial.create(); res.is_error()) {
        return Err<TreeManifest>(res.error());
    }
    if (!only) {
        for (const auto& dir : listing.value().directories) {
            if (auto res = partial.make_directory(dir); res.is_error()) {
                return Err<TreeManifest>(res.error());
            }
        }
    }

    TreeManifest manifest;
    manifest.root = destination;

    for (const auto& [artifact, plain] : work) {
        if (auto res = check_cancelled(); res.is_error()) {
            return Err<TreeManifest>(res.error());
        }

        const fs::path input = ciphertext / artifact;
        const fs::path output = partial.path() / plain;
        if (auto res = ensure_parent(output); res.is_error()) {
            return Err<TreeManifest>(res.error());
        }

        if (auto res = backend_.decrypt_file(input, output); res.is_error()) {
            Error error = res.error();
            if (error.path.empty()) {
                error.with_path(input);
            }
            return Err<TreeManifest>(std::move(error));
        }

        auto digest = hash_file(output);
        if (digest.is_error()) {
            return Err<TreeManifest>(digest.error());
        }

        std::error_code ec;
        ManifestEntry entry;
        entry.path = plain;
        entry.size = fs::file_size(output, ec);
        entry.digest = digest.value();

        bus_.emit(events::ArtifactDecryptedEvent{plain, entry.size});
        manifest.entries.push_back(std::move(entry));
    }

    if (auto res = partial.commit(); res.is_error()) {
        return Err<TreeManifest>(res.error());
    }
    return Ok(std::move(manifest));
}

Result<std::vector<std::string>> install_tree(const fs::path& plaintext,
                                              const fs::path& local,
                                              events::EventBus& bus,
                                              const CancellationToken* cancel) {
    auto listing = scan_tree(plaintext);
    if (listing.is_error()) {
        return Err<std::vector<std::string>>(listing.error());
    }

    std::error_code ec;
    fs::create_directories(local, ec);
    if (ec) {
        return Err<std::vector<std::string>>(Error{ErrorCode::Filesystem, "Cannot create directory: " + ec.message()}
                                                 .with_path(local));
    }
    for (const auto& dir : listing.value().directories) {
        fs::create_directories(local / dir, ec);
        if (ec) {
            return Err<std::vector<std::string>>(
                Error{ErrorCode::Filesystem, "Cannot create directory: " + ec.message()}.with_path(local / dir));
        }
    }

    std::vector<std::string> installed;
    for (const auto& relative : listing.value().files) {
        if (cancel != nullptr && cancel->is_cancelled()) {
            return Err<std::vector<std::string>>(ErrorCode::Cancelled, "Interrupted");
        }

        const fs::path target = local / relative;
        if (auto res = ensure_parent(target); res.is_error()) {
            return Err<std::vector<std::string>>(res.error());
        }
        if (fs::is_directory(fs::symlink_status(target, ec))) {
            return Err<std::vector<std::string>>(
                Error{ErrorCode::Filesystem, "A directory is in the way of a file"}.with_path(target));
        }

        auto temporary = reserve_temporary(target);
        if (temporary.is_error()) {
            return Err<std::vector<std::string>>(temporary.error());
        }
        fs::copy_file(plaintext / relative, temporary.value(), fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            fs::rename(temporary.value(), target, ec);
        }
        if (ec) {
            const std::string reason = ec.message();
            fs::remove(temporary.value(), ec);
            return Err<std::vector<std::string>>(Error{ErrorCode::Filesystem, "Cannot install file: " + reason}
                                                     .with_path(target));
        }

        bus.emit(events::LocalFileInstalledEvent{relative});
        installed.push_back(relative);
    }
    return Ok(std::move(installed));
}

} // namespace mist::crypto
