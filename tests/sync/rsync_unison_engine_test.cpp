#include "mist/sync/rsync_unison_engine.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using mist::ErrorCode;
using mist::sync::Endpoint;
using mist::sync::RsyncUnisonEngine;
using mist::sync::shell_quote;
using mist::test_support::TempDir;

using Argv = std::vector<std::string>;

TEST(ShellQuoteTest, QuotesForPosixShell) {
    EXPECT_EQ(shell_quote("/srv/docs"), "'/srv/docs'");
    EXPECT_EQ(shell_quote("my docs"), "'my docs'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(RsyncUnisonEngineTest, ProbeAndPrepareCommands) {
    RsyncUnisonEngine engine;
    const Endpoint remote{"backup.example.org", "/srv/docs"};

    EXPECT_EQ(engine.probe_command(remote), (Argv{"ssh", "backup.example.org", "test -d '/srv/docs'"}));
    EXPECT_EQ(engine.prepare_command(remote), (Argv{"ssh", "backup.example.org", "mkdir -p '/srv/docs'"}));
}

TEST(RsyncUnisonEngineTest, MirrorCopiesDirectoryContents) {
    RsyncUnisonEngine engine;

    EXPECT_EQ(engine.mirror_command({"", "/stage/ciphertext"}, {"host", "/srv/docs"}),
              (Argv{"rsync", "-a", "--delete", "--checksum", "--protect-args", "-e", "ssh",
                    "/stage/ciphertext/", "host:/srv/docs/"}));
    EXPECT_EQ(engine.mirror_command({"host", "/srv/docs/"}, {"", "/stage/ciphertext"}).back(), "/stage/ciphertext/");
}

TEST(RsyncUnisonEngineTest, ReconcileCommand) {
    RsyncUnisonEngine::Options options;
    options.ssh_program = "ssh -p 2222";
    RsyncUnisonEngine engine(options);

    const auto argv = engine.reconcile_command("/stage/ciphertext", {"host", "/srv/docs"});
    EXPECT_EQ(argv, (Argv{"unison", "/stage/ciphertext", "ssh://host//srv/docs", "-auto", "-times", "-perms", "0",
                          "-ui", "text", "-sshcmd", "ssh -p 2222"}));
}

TEST(RsyncUnisonEngineTest, BatchModeForUnison) {
    RsyncUnisonEngine::Options options;
    options.batch = true;
    RsyncUnisonEngine engine(options);

    EXPECT_EQ(engine.reconcile_command("/l", {"h", "docs"}).back(), "-batch");
    EXPECT_EQ(engine.reconcile_command("/l", {"h", "docs"})[2], "ssh://h/docs");
}

TEST(RsyncUnisonEngineTest, RsyncExitCodes) {
    EXPECT_TRUE(RsyncUnisonEngine::classify_rsync_exit(0, "").is_ok());

    auto transport = RsyncUnisonEngine::classify_rsync_exit(255, "ssh: connect to host h port 22: No route\n");
    ASSERT_TRUE(transport.is_error());
    EXPECT_EQ(transport.error().code, ErrorCode::TransportFailure);
    EXPECT_NE(transport.error().message.find("No route"), std::string::npos);

    EXPECT_EQ(RsyncUnisonEngine::classify_rsync_exit(12, "").error().code, ErrorCode::TransportFailure);
    EXPECT_EQ(RsyncUnisonEngine::classify_rsync_exit(23, "").error().code, ErrorCode::EngineFailure);
    EXPECT_EQ(RsyncUnisonEngine::classify_rsync_exit(127, "").error().code, ErrorCode::EngineFailure);
}

TEST(RsyncUnisonEngineTest, UnisonExitCodes) {
    EXPECT_TRUE(RsyncUnisonEngine::classify_unison_exit(0, "").is_ok());
    EXPECT_TRUE(RsyncUnisonEngine::classify_unison_exit(1, "skipped: notes.txt.gpg").is_ok());

    EXPECT_EQ(RsyncUnisonEngine::classify_unison_exit(3, "Fatal error: Lost connection with the server").error().code,
              ErrorCode::TransportFailure);
    EXPECT_EQ(RsyncUnisonEngine::classify_unison_exit(2, "Fatal error: archive mismatch").error().code,
              ErrorCode::EngineFailure);
}

TEST(RsyncUnisonEngineTest, LocalProbeChecksDirectory) {
    TempDir dir;
    RsyncUnisonEngine engine;

    auto present = engine.probe({"", dir.path().string()});
    ASSERT_TRUE(present.is_ok());
    EXPECT_TRUE(present.value());

    auto absent = engine.probe({"", (dir / "nope").string()});
    ASSERT_TRUE(absent.is_ok());
    EXPECT_FALSE(absent.value());
}

TEST(RsyncUnisonEngineTest, MissingSshIsTransportFailure) {
    RsyncUnisonEngine::Options options;
    options.ssh_program = "/nonexistent/mist-ssh";
    RsyncUnisonEngine engine(options);

    auto probe = engine.probe({"host", "/srv/docs"});
    ASSERT_TRUE(probe.is_error());
    EXPECT_EQ(probe.error().code, ErrorCode::TransportFailure);
}
