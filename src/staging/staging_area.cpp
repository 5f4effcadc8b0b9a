#include "mist/staging/staging_area.hpp"
#include "mist/staging/profile_lock.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace mist::staging {
namespace fs = std::filesystem;

fs::path StagingArea::session_path(const fs::path& staging_root, const std::string& profile_name) {
    return staging_root / (profile_name + ".session");
}

Result<StagingArea> StagingArea::acquire(const config::Profile& profile, const fs::path& staging_root) {
    const fs::path path = session_path(staging_root, profile.name);

    if (config::paths_overlap(path, profile.local_path)) {
        Error error{ErrorCode::InvalidValue, "Staging directory overlaps the local directory"};
        error.with_profile(profile.name).with_field("staging_path").with_path(path);
        return Err<StagingArea>(std::move(error));
    }

    if (auto res = ensure_private_directory(staging_root); res.is_error()) {
        return Err<StagingArea>(res.error());
    }

    std::error_code ec;
    if (fs::exists(fs::symlink_status(path, ec))) {
        spdlog::warn("Removing stale staging directory {} left by an earlier run", path.string());
        fs::remove_all(path, ec);
        if (ec) {
            return Err<StagingArea>(Error{ErrorCode::StagingCreateFailed,
                                          "Failed to remove stale staging directory: " + ec.message()}
                                        .with_path(path));
        }
    }

    if (!fs::create_directory(path, ec) || ec) {
        return Err<StagingArea>(Error{ErrorCode::StagingCreateFailed,
                                      "Failed to create staging directory: " + ec.message()}
                                    .with_path(path));
    }

    // From here on the destructor owns cleanup.
    StagingArea area(path);

    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        return Err<StagingArea>(Error{ErrorCode::StagingCreateFailed,
                                      "Failed to restrict staging permissions: " + ec.message()}
                                    .with_path(path));
    }

    spdlog::debug("Staging area ready at {}", path.string());
    return Ok(std::move(area));
}

StagingArea::StagingArea(StagingArea&& other) noexcept
    : path_(std::move(other.path_)),
      released_(other.released_),
      on_cleanup_failure_(std::move(other.on_cleanup_failure_)) {
    other.released_ = true;
}

StagingArea& StagingArea::operator=(StagingArea&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        released_ = other.released_;
        on_cleanup_failure_ = std::move(other.on_cleanup_failure_);
        other.released_ = true;
    }
    return *this;
}

StagingArea::~StagingArea() {
    release();
}

bool StagingArea::release() noexcept {
    if (released_) {
        return true;
    }
    released_ = true;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (!ec && !fs::exists(fs::symlink_status(path_, ec))) {
        spdlog::debug("Staging area {} removed", path_.string());
        return true;
    }

    const std::string reason = ec ? ec.message() : std::string("directory still present");
    spdlog::warn("Failed to remove staging directory {}: {}", path_.string(), reason);
    if (on_cleanup_failure_) {
        on_cleanup_failure_(path_, reason);
    }
    return false;
}

} // namespace mist::staging
