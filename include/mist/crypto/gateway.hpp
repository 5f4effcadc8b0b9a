/**
 * @file gateway.hpp
 * @brief Tree-level encryption on top of an EncryptionBackend
 *
 * WHY THIS FILE EXISTS:
 * The backend only knows single files. A session needs whole trees turned
 * into ciphertext (and back) as one unit: either every file made it, or
 * nothing is visible at the destination.
 *
 * LAYOUT:
 *   source/notes/todo.txt    ->  destination/notes/todo.txt.gpg
 *
 * ATOMICITY:
 * Output is written under "<destination>.partial" and renamed into place
 * only after the last file succeeded. On failure the partial tree is
 * removed and `destination` does not exist.
 */

#pragma once

#include "mist/core/cancellation.hpp"
#include "mist/core/result.hpp"
#include "mist/crypto/backend.hpp"
#include "mist/events/event_bus.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mist::crypto {

/// Suffix of every artifact in a ciphertext tree.
inline constexpr const char* kArtifactSuffix = ".gpg";

/**
 * @brief One file of a tree produced by the gateway
 */
struct ManifestEntry {
    std::string path;           ///< Plaintext relative path (POSIX style)
    std::uint64_t size = 0;     ///< Plaintext size in bytes
    std::string digest;         ///< FNV-1a of the plaintext
    bool reused = false;        ///< Artifact copied from a previous run
};

struct TreeManifest {
    std::filesystem::path root;
    std::vector<ManifestEntry> entries;
};

/**
 * @brief Source of previously produced artifacts
 *
 * Encryption output is randomized, so re-encrypting an unchanged file
 * yields a different artifact. Returning the old artifact for an unchanged
 * plaintext keeps the ciphertext tree stable across runs.
 */
class ReusableArtifacts {
public:
    virtual ~ReusableArtifacts() = default;

    /// Path of an artifact for `relative_path` whose plaintext had `digest`, if any.
    virtual std::optional<std::filesystem::path> find_artifact(const std::string& relative_path,
                                                               const std::string& digest,
                                                               const std::string& recipient) const = 0;
};

/// "notes/todo.txt" -> "notes/todo.txt.gpg"
std::string artifact_name(const std::string& relative_path);

/// "notes/todo.txt.gpg" -> "notes/todo.txt"; nullopt without the suffix.
std::optional<std::string> plaintext_name(const std::string& artifact_path);

class EncryptionGateway {
public:
    EncryptionGateway(EncryptionBackend& backend,
                      events::EventBus& bus,
                      const CancellationToken* cancel = nullptr);

    /**
     * @brief Encrypt every regular file under `source` into `destination`
     *
     * ERRORS:
     * - UnsupportedFileType  a symlink or special file exists anywhere in
     *                        `source` (detected before anything is written)
     * - Filesystem           `source` is not a directory, or `destination`
     *                        already exists
     * - backend errors       KeyNotFound, BackendUnavailable
     * - Cancelled
     */
    Result<TreeManifest> encrypt(const std::filesystem::path& source,
                                 const std::string& recipient,
                                 const std::filesystem::path& destination,
                                 const ReusableArtifacts* reuse = nullptr);

    /**
     * @brief Decrypt the artifacts under `ciphertext` into `destination`
     *
     * When `only` is given, just those plaintext relative paths are
     * decrypted. Files without the artifact suffix are UnsupportedFileType.
     */
    Result<TreeManifest> decrypt(const std::filesystem::path& ciphertext,
                                 const std::filesystem::path& destination,
                                 const std::optional<std::set<std::string>>& only = std::nullopt);

private:
    Result<void> check_cancelled() const;

    EncryptionBackend& backend_;
    events::EventBus& bus_;
    const CancellationToken* cancel_;
};

/**
 * @brief Copy the files under `plaintext` into `local`
 *
 * Each file is written to a uniquely named hidden sibling and renamed
 * over the target. Files only present in `local` are left alone.
 */
Result<std::vector<std::string>> install_tree(const std::filesystem::path& plaintext,
                                              const std::filesystem::path& local,
                                              events::EventBus& bus,
                                              const CancellationToken* cancel = nullptr);

} // namespace mist::crypto
