#include "mist/sync/artifact_cache.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using mist::crypto::ManifestEntry;
using mist::crypto::TreeManifest;
using mist::sync::ArtifactCache;
using mist::test_support::TempDir;
using mist::test_support::read_file;
using mist::test_support::write_file;

namespace {

TreeManifest two_file_manifest() {
    TreeManifest manifest;
    manifest.entries.push_back(ManifestEntry{"a.txt", 3, "digest-a", false});
    manifest.entries.push_back(ManifestEntry{"dir/b.txt", 5, "digest-b", true});
    return manifest;
}

} // namespace

class ArtifactCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(dir_ / "cipher/a.txt.gpg", "cipher-a");
        write_file(dir_ / "cipher/dir/b.txt.gpg", "cipher-b");
    }

    TempDir dir_;
    fs::path root_ = dir_ / "staging";
};

TEST_F(ArtifactCacheTest, MissingCacheIsEmpty) {
    auto cache = ArtifactCache::open(root_, "docs");
    EXPECT_TRUE(cache.empty());
    EXPECT_EQ(cache.path(), root_ / "docs.cache");
    EXPECT_FALSE(cache.find_artifact("a.txt", "digest-a", "KEYID").has_value());
}

TEST_F(ArtifactCacheTest, CommitThenReopen) {
    auto cache = ArtifactCache::open(root_, "docs");
    ASSERT_TRUE(cache.commit(dir_ / "cipher", two_file_manifest(), "KEYID").is_ok());

    auto reopened = ArtifactCache::open(root_, "docs");
    EXPECT_FALSE(reopened.empty());
    EXPECT_EQ(reopened.recipient(), "KEYID");
    ASSERT_EQ(reopened.entries().size(), 2u);
    EXPECT_EQ(reopened.entries().at("dir/b.txt").size, 5u);

    auto artifact = reopened.find_artifact("dir/b.txt", "digest-b", "KEYID");
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(read_file(*artifact), "cipher-b");
}

TEST_F(ArtifactCacheTest, LookupRequiresMatchingDigestAndRecipient) {
    auto cache = ArtifactCache::open(root_, "docs");
    ASSERT_TRUE(cache.commit(dir_ / "cipher", two_file_manifest(), "KEYID").is_ok());

    EXPECT_FALSE(cache.find_artifact("a.txt", "other-digest", "KEYID").has_value());
    EXPECT_FALSE(cache.find_artifact("a.txt", "digest-a", "NEWKEY").has_value());
    EXPECT_FALSE(cache.find_artifact("c.txt", "digest-a", "KEYID").has_value());
    EXPECT_TRUE(cache.find_artifact("a.txt", "digest-a", "KEYID").has_value());
}

TEST_F(ArtifactCacheTest, CommitReplacesPreviousContents) {
    auto cache = ArtifactCache::open(root_, "docs");
    ASSERT_TRUE(cache.commit(dir_ / "cipher", two_file_manifest(), "KEYID").is_ok());

    TreeManifest smaller;
    smaller.entries.push_back(ManifestEntry{"a.txt", 3, "digest-a2", false});
    ASSERT_TRUE(cache.commit(dir_ / "cipher", smaller, "KEYID").is_ok());

    EXPECT_EQ(cache.entries().size(), 1u);
    EXPECT_FALSE(fs::exists(cache.path() / "artifacts/dir/b.txt.gpg"));
    EXPECT_FALSE(fs::exists(root_ / "docs.cache.next"));
    EXPECT_TRUE(cache.find_artifact("a.txt", "digest-a2", "KEYID").has_value());
}

TEST_F(ArtifactCacheTest, EntriesWithoutArtifactAreSkipped) {
    TreeManifest manifest = two_file_manifest();
    manifest.entries.push_back(ManifestEntry{"ghost.txt", 1, "digest-g", false});

    auto cache = ArtifactCache::open(root_, "docs");
    ASSERT_TRUE(cache.commit(dir_ / "cipher", manifest, "KEYID").is_ok());
    EXPECT_EQ(cache.entries().count("ghost.txt"), 0u);
}

TEST_F(ArtifactCacheTest, CorruptManifestIsIgnored) {
    write_file(root_ / "docs.cache/manifest.json", "{ not json");
    auto cache = ArtifactCache::open(root_, "docs");
    EXPECT_TRUE(cache.empty());

    write_file(root_ / "docs.cache/manifest.json", R"({"version": 99, "recipient": "KEYID", "files": {}})");
    EXPECT_TRUE(ArtifactCache::open(root_, "docs").empty());
}

TEST_F(ArtifactCacheTest, MistypedManifestIsIgnored) {
    const fs::path manifest = root_ / "docs.cache/manifest.json";

    write_file(manifest,
               R"({"version": 1, "recipient": "KEYID", "files": {"a.txt": {"digest": "00", "size": "big"}}})");
    EXPECT_TRUE(ArtifactCache::open(root_, "docs").empty());

    write_file(manifest, R"({"version": "1"})");
    EXPECT_TRUE(ArtifactCache::open(root_, "docs").empty());

    write_file(manifest, R"({"version": 1, "recipient": "KEYID", "files": [{"digest": "00"}]})");
    EXPECT_TRUE(ArtifactCache::open(root_, "docs").empty());

    write_file(manifest, R"({"version": 1, "recipient": 7, "files": {}})");
    EXPECT_TRUE(ArtifactCache::open(root_, "docs").empty());

    write_file(manifest, R"({"version": 1, "recipient": "KEYID", "files": {"a.txt": {"digest": 12, "size": 1}}})");
    EXPECT_TRUE(ArtifactCache::open(root_, "docs").empty());
}

TEST_F(ArtifactCacheTest, ProfilesDoNotShareCaches) {
    auto docs = ArtifactCache::open(root_, "docs");
    ASSERT_TRUE(docs.commit(dir_ / "cipher", two_file_manifest(), "KEYID").is_ok());

    EXPECT_TRUE(ArtifactCache::open(root_, "photos").empty());
}
