#include <gtest/gtest.h>
#include "ondd/core/cli.hpp"
#include "ondd/core/command_registry.hpp"
#include "ondd/ipc/protocol_client.hpp"
#include "support/scripted_transport.hpp"
#include <sstream>

using namespace ondd::core;
using ondd::testing::ScriptedTransport;
using ondd::testing::TransportScript;

class CommandLineParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "onddctl");
        argv.clear();
        storage = std::move(args);
        for (auto& arg : storage) {
            argv.push_back(arg.data());
        }
        return parser.parse(static_cast<int>(argv.size()), argv.data());
    }

    CommandLineParser parser{"onddctl"};
    std::vector<std::string> storage;
    std::vector<char*> argv;
};

TEST_F(CommandLineParserTest, OptionsAndCommand) {
    ASSERT_TRUE(parse({"-v", "--socket", "/tmp/x.sock", "-t2000", "status"}));

    EXPECT_TRUE(parser.has_option("verbose"));
    EXPECT_EQ(parser.get_option("socket"), "/tmp/x.sock");
    EXPECT_EQ(parser.get_option("timeout"), "2000");
    EXPECT_EQ(parser.get_positional_args(), std::vector<std::string>{"status"});
}

TEST_F(CommandLineParserTest, LongOptionWithEquals) {
    ASSERT_TRUE(parse({"--config=/etc/onddctl.conf", "ping"}));

    EXPECT_EQ(parser.get_option("config"), "/etc/onddctl.conf");
    EXPECT_EQ(parser.get_option("c"), "/etc/onddctl.conf");
}

TEST_F(CommandLineParserTest, DefaultConfigPath) {
    ASSERT_TRUE(parse({"status"}));

    EXPECT_FALSE(parser.has_option("config"));
    EXPECT_EQ(parser.get_option("config"), "~/.onddctl.conf");
    EXPECT_EQ(parser.get_option("timeout", "20000"), "20000");
}

TEST_F(CommandLineParserTest, CommandArgumentsPassThrough) {
    ASSERT_TRUE(parse({"set-settings", "frequency=11471", "-v", "lnb=u"}));

    EXPECT_FALSE(parser.has_option("verbose"));
    EXPECT_EQ(parser.get_positional_args(),
              (std::vector<std::string>{"set-settings", "frequency=11471", "-v", "lnb=u"}));
}

TEST_F(CommandLineParserTest, UnknownOption) {
    EXPECT_FALSE(parse({"--frobnicate", "status"}));
    EXPECT_EQ(parser.get_error(), "Unknown option: --frobnicate");
}

TEST_F(CommandLineParserTest, MissingValue) {
    EXPECT_FALSE(parse({"--socket"}));
    EXPECT_FALSE(parser.get_error().empty());
}

TEST_F(CommandLineParserTest, HelpListsOptions) {
    std::ostringstream out;
    parser.print_help(out);

    EXPECT_NE(out.str().find("--socket"), std::string::npos);
    EXPECT_NE(out.str().find("~/.onddctl.conf"), std::string::npos);
}

class CommandRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        script = std::make_shared<TransportScript>();
        ondd::ipc::ClientOptions options;
        options.endpoint = "/tmp/ondd-cli.sock";
        client = std::make_unique<ondd::ipc::ProtocolClient>(options, ScriptedTransport::factory(script));
    }

    CommandResult run(std::vector<std::string> args) {
        return registry.execute_command(*client, args, out);
    }

    std::shared_ptr<TransportScript> script;
    std::unique_ptr<ondd::ipc::ProtocolClient> client;
    CommandRegistry registry;
    std::ostringstream out;
};

TEST_F(CommandRegistryTest, KnowsAllCommands) {
    for (const char* name : {"ping", "status", "transfers", "files", "streams", "tuner", "cache",
                             "cache-reset", "settings", "set-settings", "output", "set-output", "events"}) {
        EXPECT_TRUE(registry.has_command(name)) << name;
    }
    EXPECT_FALSE(registry.has_command("reboot"));
}

TEST_F(CommandRegistryTest, EmptyAndUnknownCommands) {
    auto empty = run({});
    EXPECT_FALSE(empty.success);
    EXPECT_EQ(empty.message, "No command given");

    auto unknown = run({"reboot"});
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.message, "Unknown command: reboot");
}

TEST_F(CommandRegistryTest, Ping) {
    EXPECT_TRUE(run({"ping"}).success);

    script->refuse_connections = true;
    auto result = run({"ping"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "ONDD is not reachable at /tmp/ondd-cli.sock");
}

TEST_F(CommandRegistryTest, Status) {
    script->respond("state: busy\nprogress: 42\npath: /srv/dl/video.mp4\nsize: 2048\nreceived: 1024\n\n");

    auto result = run({"status"});

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_NE(out.str().find("busy"), std::string::npos);
    EXPECT_NE(out.str().find("42%"), std::string::npos);
    EXPECT_NE(out.str().find("video.mp4"), std::string::npos);
    EXPECT_NE(out.str().find("1.00 KB of 2.00 KB"), std::string::npos);
}

TEST_F(CommandRegistryTest, EmptyTransfers) {
    script->respond("");

    ASSERT_TRUE(run({"transfers"}).success);
    EXPECT_EQ(out.str(), "No transfers in progress\n");
}

TEST_F(CommandRegistryTest, Cache) {
    script->respond("used: 1024\nfree: 1024\n\n");

    ASSERT_TRUE(run({"cache"}).success);
    EXPECT_NE(out.str().find("2.00 KB"), std::string::npos);
}

TEST_F(CommandRegistryTest, DaemonErrorsBecomeResults) {
    script->respond("state: idle\n\n");

    auto result = run({"status"});

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("progress"), std::string::npos);
}

TEST_F(CommandRegistryTest, SetSettingsWithUniversalLnb) {
    script->respond("");

    auto result = run({"set-settings", "frequency=12000", "symbolrate=27500", "lnb=u", "voltage=18"});

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(script->sent_requests(), std::vector<std::string>{
        "SET-SETTINGS frequency=1400 symbolrate=27500 delivery=dvb-s modulation=qpsk "
        "tone=yes voltage=18 azimuth=0\n"});
}

TEST_F(CommandRegistryTest, SetSettingsExplicitToneWins) {
    script->respond("");

    auto result = run({"set-settings", "frequency=11471", "symbolrate=27500", "lnb=u", "tone=yes"});

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(script->sent_requests(), std::vector<std::string>{
        "SET-SETTINGS frequency=1721 symbolrate=27500 delivery=dvb-s modulation=qpsk "
        "tone=yes voltage=13 azimuth=0\n"});
}

TEST_F(CommandRegistryTest, SetSettingsRejectsBadInput) {
    EXPECT_FALSE(run({"set-settings", "frequency"}).success);
    EXPECT_FALSE(run({"set-settings", "frequency=abc", "symbolrate=27500"}).success);
    EXPECT_FALSE(run({"set-settings", "frequency=1721", "symbolrate=27500", "lnb=x"}).success);
    EXPECT_FALSE(run({"set-settings", "frequency=1721", "symbolrate=27500", "polarity=h"}).success);
    EXPECT_FALSE(run({"set-settings", "frequency=1721"}).success);
    EXPECT_TRUE(script->sent_requests().empty());
}

TEST_F(CommandRegistryTest, SetOutput) {
    script->respond("code: 200\n\n");
    script->respond("code: 500\nmessage: read-only\n\n");

    auto ok = run({"set-output", "/srv/downloads"});
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.message, "Output path set to /srv/downloads");

    auto rejected = run({"set-output", "/srv/ro"});
    EXPECT_FALSE(rejected.success);
    EXPECT_NE(rejected.message.find("read-only"), std::string::npos);

    EXPECT_FALSE(run({"set-output"}).success);
}

TEST_F(CommandRegistryTest, Events) {
    script->respond("time: 0\ntype: tuned\nmessage: locked\n\n");

    ASSERT_TRUE(run({"events"}).success);
    EXPECT_NE(out.str().find("1970-01-01T00:00:00Z"), std::string::npos);
    EXPECT_NE(out.str().find("locked"), std::string::npos);
}

TEST_F(CommandRegistryTest, HelpListsCommands) {
    std::ostringstream help;
    registry.print_help(help);

    EXPECT_NE(help.str().find("set-settings"), std::string::npos);
    EXPECT_NE(help.str().find("Discard the download cache"), std::string::npos);
}
