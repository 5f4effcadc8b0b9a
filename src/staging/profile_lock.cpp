#include "mist/staging/profile_lock.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace mist::staging {
namespace fs = std::filesystem;

Result<void> ensure_private_directory(const fs::path& root) {
    std::error_code ec;
    if (fs::is_directory(root, ec)) {
        return Ok();
    }

    fs::create_directories(root, ec);
    if (ec) {
        return Err<void>(Error{ErrorCode::StagingCreateFailed, "Failed to create directory: " + ec.message()}
                             .with_path(root));
    }
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        return Err<void>(Error{ErrorCode::StagingCreateFailed, "Failed to restrict permissions: " + ec.message()}
                             .with_path(root));
    }
    return Ok();
}

Result<ProfileLock> ProfileLock::acquire(const fs::path& staging_root, const std::string& profile_name) {
    if (auto res = ensure_private_directory(staging_root); res.is_error()) {
        return Err<ProfileLock>(res.error());
    }

    fs::path lock_path = staging_root / (profile_name + ".lock");
    const int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Err<ProfileLock>(Error{ErrorCode::Filesystem,
                                      std::string("Failed to open lock file: ") + std::strerror(errno)}
                                    .with_path(lock_path));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            Error error{ErrorCode::AlreadyRunning,
                        "Another mist process is already running profile [" + profile_name + "]"};
            error.with_profile(profile_name).with_path(lock_path);
            return Err<ProfileLock>(std::move(error));
        }
        return Err<ProfileLock>(Error{ErrorCode::Filesystem, std::string("Failed to lock: ") + std::strerror(err)}
                                    .with_path(lock_path));
    }

    spdlog::debug("Acquired profile lock {}", lock_path.string());
    return Ok(ProfileLock(fd, std::move(lock_path)));
}

ProfileLock::ProfileLock(ProfileLock&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

ProfileLock& ProfileLock::operator=(ProfileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

ProfileLock::~ProfileLock() {
    release();
}

void ProfileLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace mist::staging
