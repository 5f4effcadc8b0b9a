#include "mist/crypto/gpg_backend.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using mist::ErrorCode;
using mist::crypto::GpgBackend;
using mist::test_support::TempDir;
using mist::test_support::write_file;

namespace {

using Argv = std::vector<std::string>;

GpgBackend missing_gpg() {
    GpgBackend::Options options;
    options.program = "/nonexistent/mist-gpg";
    return GpgBackend(options);
}

} // namespace

TEST(GpgBackendTest, ListKeysCommand) {
    GpgBackend gpg;
    EXPECT_EQ(gpg.list_keys_command("ABCD1234"), (Argv{"gpg", "--batch", "--list-keys", "--", "ABCD1234"}));
}

TEST(GpgBackendTest, EncryptCommandIsBatchAndExplicit) {
    GpgBackend gpg;
    EXPECT_EQ(gpg.encrypt_command("in.txt", "in.txt.gpg", "ABCD1234"),
              (Argv{"gpg", "--batch", "--yes", "--quiet", "--trust-model", "always", "--encrypt",
                    "--recipient", "ABCD1234", "--output", "in.txt.gpg", "--", "in.txt"}));
}

TEST(GpgBackendTest, ArmorAddsFlag) {
    GpgBackend::Options options;
    options.program = "gpg2";
    options.armor = true;
    GpgBackend gpg(options);

    const auto argv = gpg.encrypt_command("a", "a.gpg", "KEY");
    EXPECT_EQ(argv.front(), "gpg2");
    EXPECT_NE(std::find(argv.begin(), argv.end(), "--armor"), argv.end());
}

TEST(GpgBackendTest, DecryptCommand) {
    GpgBackend gpg;
    EXPECT_EQ(gpg.decrypt_command("-odd.gpg", "-odd"),
              (Argv{"gpg", "--batch", "--yes", "--quiet", "--decrypt", "--output", "-odd", "--", "-odd.gpg"}));
}

TEST(GpgBackendTest, MissingProgramIsBackendUnavailable) {
    auto gpg = missing_gpg();

    auto check = gpg.check_recipient("ABCD1234");
    ASSERT_TRUE(check.is_error());
    EXPECT_EQ(check.error().code, ErrorCode::BackendUnavailable);
}

TEST(GpgBackendTest, MissingProgramFailsEncryptAndDecrypt) {
    TempDir dir;
    write_file(dir / "plain.txt", "secret");
    auto gpg = missing_gpg();

    auto encrypted = gpg.encrypt_file(dir / "plain.txt", dir / "plain.txt.gpg", "ABCD1234");
    ASSERT_TRUE(encrypted.is_error());
    EXPECT_EQ(encrypted.error().code, ErrorCode::BackendUnavailable);

    write_file(dir / "other.txt.gpg", "not really");
    auto decrypted = gpg.decrypt_file(dir / "other.txt.gpg", dir / "other.txt");
    ASSERT_TRUE(decrypted.is_error());
    EXPECT_EQ(decrypted.error().code, ErrorCode::BackendUnavailable);
}

TEST(GpgBackendTest, FailingProgramMeansRecipientUnknown) {
    // `false` accepts any arguments and exits 1, like gpg with an unknown key
    GpgBackend::Options options;
    options.program = "false";
    GpgBackend gpg(options);

    auto check = gpg.check_recipient("nobody@example.org");
    ASSERT_TRUE(check.is_error());
    EXPECT_EQ(check.error().code, ErrorCode::KeyNotFound);
}

TEST(GpgBackendTest, FailedDecryptNamesArtifact) {
    TempDir dir;
    write_file(dir / "x.gpg", "junk");
    GpgBackend::Options options;
    options.program = "false";
    GpgBackend gpg(options);

    auto decrypted = gpg.decrypt_file(dir / "x.gpg", dir / "x");
    ASSERT_TRUE(decrypted.is_error());
    EXPECT_EQ(decrypted.error().code, ErrorCode::DecryptFailed);
    EXPECT_EQ(decrypted.error().path, dir / "x.gpg");
}
