#pragma once

#include "mist/config/profile.hpp"
#include "mist/core/result.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace mist::staging {

/**
 * @brief Ephemeral, owner-only working directory for one session
 *
 * Layout:
 *   <root>/<profile>.session/
 *       ciphertext/   tree handed to / received from the sync engine
 *       plaintext/    decrypted files waiting to be installed locally
 *
 * The directory name is stable per profile (the profile lock makes it
 * exclusive) so the bidirectional engine sees the same replica root on
 * every run. Whatever is left there by a killed process is wiped on the
 * next acquire.
 *
 * release() is idempotent and also runs from the destructor; deletion
 * failures are reported through the cleanup callback and never escalate.
 */
class StagingArea {
public:
    using CleanupFailureHandler = std::function<void(const std::filesystem::path&, const std::string&)>;

    /**
     * @brief Create the session directory for `profile` under `staging_root`
     *
     * Must be called with the profile lock held.
     */
    static Result<StagingArea> acquire(const config::Profile& profile,
                                       const std::filesystem::path& staging_root);

    StagingArea(StagingArea&& other) noexcept;
    StagingArea& operator=(StagingArea&& other) noexcept;
    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;
    ~StagingArea();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path ciphertext_dir() const { return path_ / "ciphertext"; }
    [[nodiscard]] std::filesystem::path plaintext_dir() const { return path_ / "plaintext"; }
    [[nodiscard]] bool released() const noexcept { return released_; }

    void on_cleanup_failure(CleanupFailureHandler handler) { on_cleanup_failure_ = std::move(handler); }

    /**
     * @brief Recursively delete the session directory
     *
     * @return true when the directory is gone afterwards
     */
    bool release() noexcept;

    /// Session directory a profile would use under `staging_root`.
    static std::filesystem::path session_path(const std::filesystem::path& staging_root,
                                              const std::string& profile_name);

private:
    explicit StagingArea(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
    bool released_ = false;
    CleanupFailureHandler on_cleanup_failure_;
};

} // namespace mist::staging
