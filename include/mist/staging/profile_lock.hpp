#pragma once

#include "mist/core/result.hpp"

#include <filesystem>
#include <string>

namespace mist::staging {

/**
 * @brief Exclusive, non-blocking per-profile lock
 *
 * Backed by flock(2) on `<staging_root>/<profile>.lock`. Contention fails
 * immediately with ErrorCode::AlreadyRunning. The kernel drops the lock if
 * the process dies, so a crashed run never wedges the profile. The lock
 * file itself is left in place; unlinking it would race with a waiting
 * acquirer.
 */
class ProfileLock {
public:
    static Result<ProfileLock> acquire(const std::filesystem::path& staging_root,
                                       const std::string& profile_name);

    ProfileLock(ProfileLock&& other) noexcept;
    ProfileLock& operator=(ProfileLock&& other) noexcept;
    ProfileLock(const ProfileLock&) = delete;
    ProfileLock& operator=(const ProfileLock&) = delete;
    ~ProfileLock();

    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    ProfileLock(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}

    int fd_ = -1;
    std::filesystem::path path_;
};

/// Create `root` (and parents) with owner-only permissions if missing.
Result<void> ensure_private_directory(const std::filesystem::path& root);

} // namespace mist::staging
