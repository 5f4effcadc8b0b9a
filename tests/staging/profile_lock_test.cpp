#include "mist/staging/profile_lock.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>

namespace fs = std::filesystem;
using mist::ErrorCode;
using mist::staging::ProfileLock;
using mist::test_support::TempDir;

TEST(ProfileLockTest, AcquireCreatesPrivateRootAndLockFile) {
    TempDir dir;
    const fs::path root = dir / "nested/staging";

    auto lock = ProfileLock::acquire(root, "docs");
    ASSERT_TRUE(lock.is_ok()) << lock.error().describe();
    EXPECT_TRUE(lock.value().held());
    EXPECT_EQ(lock.value().path(), root / "docs.lock");
    EXPECT_TRUE(fs::exists(root / "docs.lock"));

    const auto perms = fs::status(root).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
}

TEST(ProfileLockTest, SecondAcquireFailsImmediately) {
    TempDir dir;

    auto first = ProfileLock::acquire(dir.path(), "docs");
    ASSERT_TRUE(first.is_ok());

    auto second = ProfileLock::acquire(dir.path(), "docs");
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().code, ErrorCode::AlreadyRunning);
    EXPECT_EQ(second.error().profile, "docs");
}

TEST(ProfileLockTest, DifferentProfilesDoNotContend) {
    TempDir dir;

    auto docs = ProfileLock::acquire(dir.path(), "docs");
    auto photos = ProfileLock::acquire(dir.path(), "photos");

    EXPECT_TRUE(docs.is_ok());
    EXPECT_TRUE(photos.is_ok());
}

TEST(ProfileLockTest, ReleaseAllowsReacquire) {
    TempDir dir;

    {
        auto lock = ProfileLock::acquire(dir.path(), "docs");
        ASSERT_TRUE(lock.is_ok());
    }

    auto again = ProfileLock::acquire(dir.path(), "docs");
    ASSERT_TRUE(again.is_ok());

    again.value().release();
    EXPECT_FALSE(again.value().held());
    EXPECT_TRUE(ProfileLock::acquire(dir.path(), "docs").is_ok());
}

TEST(ProfileLockTest, MovedLockStaysHeld) {
    TempDir dir;

    auto acquired = ProfileLock::acquire(dir.path(), "docs");
    ASSERT_TRUE(acquired.is_ok());
    ProfileLock moved = std::move(acquired.value());

    EXPECT_TRUE(moved.held());
    EXPECT_TRUE(ProfileLock::acquire(dir.path(), "docs").is_error());
}
