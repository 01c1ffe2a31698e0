#include <gtest/gtest.h>
#include <cli/pool_cli.hpp>
#include <stdexcept>

TEST(CliArgs, RunCollectsCommandWords) {
    auto args = parse_cli_args({"-H", "a@h1", "-H", "a@h2", "run", "ls", "-la", "/srv"});
    EXPECT_EQ(args.command, "run");
    std::vector<std::string> hosts = {"a@h1", "a@h2"};
    EXPECT_EQ(args.hosts, hosts);
    std::vector<std::string> words = {"ls", "-la", "/srv"};
    EXPECT_EQ(args.positional, words);
}

TEST(CliArgs, RunKeepsFlagsAfterCommand) {
    auto args = parse_cli_args({"run", "echo", "-H", "x"});
    EXPECT_TRUE(args.hosts.empty());
    std::vector<std::string> words = {"echo", "-H", "x"};
    EXPECT_EQ(args.positional, words);
}

TEST(CliArgs, CopyOptions) {
    auto args = parse_cli_args({"copy", "/a", "/b", "--remote-to-local", "--ignore", ".git",
                                "--ignore", "tmp", "--rsync", "--delete", "--shim",
                                "-i", "/k", "--strict", "no", "--as-user", "www"});
    EXPECT_EQ(args.command, "copy");
    std::vector<std::string> paths = {"/a", "/b"};
    EXPECT_EQ(args.positional, paths);
    EXPECT_TRUE(args.remote_to_local);
    EXPECT_TRUE(args.use_shim);
    std::vector<std::string> ignores = {".git", "tmp"};
    EXPECT_EQ(args.ignores, ignores);
    std::vector<std::string> rsync = {"--delete"};
    EXPECT_EQ(args.rsync, rsync);
    EXPECT_EQ(args.key.value_or(""), "/k");
    EXPECT_EQ(args.strict.value_or(""), "no");
    EXPECT_EQ(args.as_user.value_or(""), "www");
}

TEST(CliArgs, HelpAndVersion) {
    EXPECT_EQ(parse_cli_args({"--help"}).command, "--help");
    EXPECT_EQ(parse_cli_args({"run", "echo", "--version"}).command, "run");
    EXPECT_EQ(parse_cli_args({"--version"}).command, "--version");
}

TEST(CliArgs, MissingValueThrows) {
    EXPECT_THROW(parse_cli_args({"-H"}), std::invalid_argument);
}

TEST(CliArgs, UnknownCopyFlagThrows) {
    EXPECT_THROW(parse_cli_args({"copy", "/a", "/b", "--bogus"}), std::invalid_argument);
}
