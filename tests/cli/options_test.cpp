#include "mist/cli/options.hpp"

#include <gtest/gtest.h>

using mist::ErrorCode;
using mist::cli::parse_arguments;
using mist::sync::SyncMode;

TEST(CliOptionsTest, DefaultsToSync) {
    auto parsed = parse_arguments({"docs"});
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().profile, "docs");
    EXPECT_EQ(parsed.value().mode, SyncMode::Sync);
    EXPECT_FALSE(parsed.value().assume_yes);
    EXPECT_FALSE(parsed.value().config_path.has_value());
}

TEST(CliOptionsTest, ModesAndFlags) {
    auto push = parse_arguments({"-p", "-y", "docs"});
    ASSERT_TRUE(push.is_ok());
    EXPECT_EQ(push.value().mode, SyncMode::Push);
    EXPECT_TRUE(push.value().assume_yes);

    auto pull = parse_arguments({"docs", "--pull", "--verbose"});
    ASSERT_TRUE(pull.is_ok());
    EXPECT_EQ(pull.value().mode, SyncMode::Pull);
    EXPECT_TRUE(pull.value().verbose);
}

TEST(CliOptionsTest, ConfigFile) {
    auto separate = parse_arguments({"-c", "/etc/mist.yaml", "docs"});
    ASSERT_TRUE(separate.is_ok());
    EXPECT_EQ(separate.value().config_path->string(), "/etc/mist.yaml");

    auto joined = parse_arguments({"--config=/tmp/m.yaml", "docs"});
    ASSERT_TRUE(joined.is_ok());
    EXPECT_EQ(joined.value().config_path->string(), "/tmp/m.yaml");

    auto missing = parse_arguments({"docs", "--config"});
    ASSERT_TRUE(missing.is_error());
}

TEST(CliOptionsTest, UsageMistakes) {
    EXPECT_EQ(parse_arguments({"-p", "-P", "docs"}).error().code, ErrorCode::InvalidValue);
    EXPECT_EQ(parse_arguments({"-v", "-q", "docs"}).error().code, ErrorCode::InvalidValue);
    EXPECT_TRUE(parse_arguments({}).is_error());
    EXPECT_TRUE(parse_arguments({"--frobnicate", "docs"}).is_error());
    EXPECT_TRUE(parse_arguments({"docs", "photos"}).is_error());
}

TEST(CliOptionsTest, DoubleDashEndsOptions) {
    auto parsed = parse_arguments({"--", "-weird-name"});
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().profile, "-weird-name");
}

TEST(CliOptionsTest, HelpNeedsNoProfile) {
    auto help = parse_arguments({"--help"});
    ASSERT_TRUE(help.is_ok());
    EXPECT_TRUE(help.value().help);

    auto version = parse_arguments({"--version"});
    ASSERT_TRUE(version.is_ok());
    EXPECT_TRUE(version.value().version);
}

TEST(CliOptionsTest, UsageListsExitCodes) {
    const auto text = mist::cli::usage("mist");
    EXPECT_EQ(text.rfind("Usage: mist", 0), 0u);
    EXPECT_NE(text.find("130 interrupted"), std::string::npos);
}
