#include <gtest/gtest.h>
#include <ssh/command_builder.hpp>

static SshCommandBuilder make_builder(std::optional<int> port = std::nullopt,
                                      std::optional<std::string> key = std::nullopt,
                                      std::optional<std::string> strict = std::nullopt,
                                      std::optional<std::string> as_user = std::nullopt) {
    return SshCommandBuilder(RemoteEndpoint{"user", "host", port}, key, strict, as_user);
}

// ── is_sudo_command ─────────────────────────────────────────

TEST(CommandBuilder, SudoDetection) {
    EXPECT_TRUE(is_sudo_command("sudo ls"));
    EXPECT_TRUE(is_sudo_command("sudo"));
    EXPECT_TRUE(is_sudo_command("sudo\tls"));
    EXPECT_FALSE(is_sudo_command("ls"));
    EXPECT_FALSE(is_sudo_command("echo sudo"));
    EXPECT_FALSE(is_sudo_command("sudoedit /etc/hosts"));
}

// ── ssh args ────────────────────────────────────────────────

TEST(CommandBuilder, SshArgsOrder) {
    auto args = build_ssh_args(22, std::string("/k"), std::string("no"));
    std::vector<std::string> expected = {"-p", "22", "-i", "/k", "-o", "StrictHostKeyChecking=no"};
    EXPECT_EQ(args, expected);
}

TEST(CommandBuilder, SshArgsEmpty) {
    EXPECT_TRUE(build_ssh_args(std::nullopt, std::nullopt, std::nullopt).empty());
}

// ── build ───────────────────────────────────────────────────

TEST(CommandBuilder, PlainCommand) {
    EXPECT_EQ(make_builder().build("echo hi"), R"(ssh user@host "echo hi")");
}

TEST(CommandBuilder, NoTtyWithoutSudo) {
    for (const std::string cmd : {"ls", "echo sudo", "cat /etc/sudoers", "sudoedit x"}) {
        EXPECT_EQ(make_builder().build(cmd).find("-tt"), std::string::npos) << cmd;
    }
}

TEST(CommandBuilder, TtyForSudo) {
    EXPECT_EQ(make_builder().build("sudo my-command -x"),
              R"(ssh -tt user@host "sudo my-command -x")");
    EXPECT_EQ(make_builder(22).build("sudo ls"), R"(ssh -tt -p 22 user@host "sudo ls")");
}

TEST(CommandBuilder, EscapesDoubleQuotes) {
    EXPECT_EQ(make_builder().build(R"(echo "ok")"), R"(ssh user@host "echo \"ok\"")");
    EXPECT_EQ(escape_double_quotes(R"(a"b"c)"), R"(a\"b\"c)");
}

TEST(CommandBuilder, NoUnescapedQuoteInPayload) {
    std::string built = make_builder().build(R"(x="1" y="2")");
    std::string prefix = "ssh user@host \"";
    ASSERT_EQ(built.compare(0, prefix.size(), prefix), 0);
    ASSERT_EQ(built.back(), '"');
    std::string payload = built.substr(prefix.size(), built.size() - prefix.size() - 1);
    for (size_t i = 0; i < payload.size(); ++i) {
        if (payload[i] == '"') {
            ASSERT_GT(i, 0u);
            EXPECT_EQ(payload[i - 1], '\\');
        }
    }
}

TEST(CommandBuilder, PortKeyAndStrict) {
    auto b = make_builder(12345, std::string("/path/to/key"), std::string("no"));
    EXPECT_EQ(b.build("my-command -x"),
              R"(ssh -p 12345 -i /path/to/key -o StrictHostKeyChecking=no user@host "my-command -x")");
}

TEST(CommandBuilder, AsUserWrapsCommand) {
    auto b = make_builder(std::nullopt, std::nullopt, std::nullopt, std::string("www"));
    EXPECT_EQ(b.build("ls -la"), R"(ssh user@host "sudo -u www ls -la")");
}

TEST(CommandBuilder, AsUserStripsExistingSudo) {
    auto b = make_builder(std::nullopt, std::nullopt, std::nullopt, std::string("www"));
    EXPECT_EQ(b.build("sudo ls -la"), R"(ssh -tt user@host "sudo -u www ls -la")");
    EXPECT_EQ(b.wrap_command("sudo   whoami"), "sudo -u www whoami");
}

TEST(CommandBuilder, Qualify) {
    EXPECT_EQ(make_builder(22).qualify("/srv/app"), "user@host:/srv/app");
}
