#pragma once

#include "mist/core/result.hpp"
#include "mist/crypto/gateway.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace mist::sync {

/**
 * @brief Ciphertext tree of the last successful run of a profile
 *
 * Layout:
 *   <staging_root>/<profile>.cache/
 *       artifacts/      copy of the ciphertext tree that reached the remote
 *       manifest.json   recipient + plaintext digest/size per file
 *
 * The encryption gateway asks it for artifacts of unchanged files, so a
 * run with no local edits hands the sync engine byte-identical
 * ciphertext. Holds ciphertext only.
 */
class ArtifactCache : public crypto::ReusableArtifacts {
public:
    struct Entry {
        std::string digest;
        std::uint64_t size = 0;
    };

    /**
     * @brief Load the cache of `profile_name`
     *
     * A missing or unreadable manifest yields an empty cache; stale caches
     * only cost a re-encryption.
     */
    static ArtifactCache open(const std::filesystem::path& staging_root, const std::string& profile_name);

    static std::filesystem::path cache_path(const std::filesystem::path& staging_root,
                                            const std::string& profile_name);

    std::optional<std::filesystem::path> find_artifact(const std::string& relative_path,
                                                       const std::string& digest,
                                                       const std::string& recipient) const override;

    /**
     * @brief Replace the cache with `ciphertext` described by `manifest`
     *
     * Only artifacts listed in `manifest` are kept.
     */
    Result<void> commit(const std::filesystem::path& ciphertext,
                        const crypto::TreeManifest& manifest,
                        const std::string& recipient);

    [[nodiscard]] bool empty() const noexcept { return entries_.empty() && recipient_.empty(); }
    [[nodiscard]] const std::string& recipient() const noexcept { return recipient_; }
    [[nodiscard]] const std::map<std::string, Entry>& entries() const noexcept { return entries_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    ArtifactCache(std::filesystem::path path, std::string profile)
        : path_(std::move(path)), profile_(std::move(profile)) {}

    std::filesystem::path path_;
    std::string profile_;
    std::string recipient_;
    std::map<std::string, Entry> entries_;
};

} // namespace mist::sync
