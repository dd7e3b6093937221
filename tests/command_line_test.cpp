#include "command_line.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace {

using black_bars::CommandLineOptions;
using black_bars::ParseCommandLine;

TEST(CommandLineTest, NoArgumentsUsesDefaults) {
    CommandLineOptions options;
    std::ostringstream err;

    ASSERT_TRUE(ParseCommandLine({}, options, err));
    EXPECT_TRUE(options.config_path.empty());
    EXPECT_FALSE(options.show_help);
    EXPECT_FALSE(options.show_version);
    EXPECT_TRUE(err.str().empty());
}

TEST(CommandLineTest, HelpAliases) {
    for (const char* flag : {"-h", "--help", "/?", "-?"}) {
        CommandLineOptions options;
        std::ostringstream err;
        ASSERT_TRUE(ParseCommandLine({flag}, options, err)) << flag;
        EXPECT_TRUE(options.show_help) << flag;
    }
}

TEST(CommandLineTest, Version) {
    CommandLineOptions options;
    std::ostringstream err;

    ASSERT_TRUE(ParseCommandLine({"--version"}, options, err));
    EXPECT_TRUE(options.show_version);
}

TEST(CommandLineTest, ConfigPathForms) {
    CommandLineOptions options;
    std::ostringstream err;

    ASSERT_TRUE(ParseCommandLine({"-c", "C:\\games\\bars.toml"}, options, err));
    EXPECT_EQ(options.config_path, "C:\\games\\bars.toml");

    ASSERT_TRUE(ParseCommandLine({"--config", "a.toml"}, options, err));
    EXPECT_EQ(options.config_path, "a.toml");

    ASSERT_TRUE(ParseCommandLine({"--config=b.toml"}, options, err));
    EXPECT_EQ(options.config_path, "b.toml");
}

TEST(CommandLineTest, MissingConfigValueFails) {
    CommandLineOptions options;
    std::ostringstream err;

    EXPECT_FALSE(ParseCommandLine({"--config"}, options, err));
    EXPECT_NE(err.str().find("Missing value for --config"), std::string::npos);
    EXPECT_NE(err.str().find("Usage:"), std::string::npos);
}

TEST(CommandLineTest, UnknownOptionFails) {
    CommandLineOptions options;
    std::ostringstream err;

    EXPECT_FALSE(ParseCommandLine({"--fullscreen"}, options, err));
    EXPECT_NE(err.str().find("Unknown option: --fullscreen"), std::string::npos);
}

TEST(CommandLineTest, ReparseResetsOptions) {
    CommandLineOptions options;
    std::ostringstream err;

    ASSERT_TRUE(ParseCommandLine({"-h", "-c", "x.toml"}, options, err));
    ASSERT_TRUE(ParseCommandLine({}, options, err));
    EXPECT_FALSE(options.show_help);
    EXPECT_TRUE(options.config_path.empty());
}

TEST(CommandLineTest, UsageListsOptions) {
    std::ostringstream out;
    black_bars::PrintUsage(out);

    EXPECT_NE(out.str().find("--config"), std::string::npos);
    EXPECT_NE(out.str().find("--version"), std::string::npos);
    EXPECT_NE(out.str().find("--help"), std::string::npos);
}

}  // anonymous namespace
