// ==============================================================================
// test_cli_gtest.cpp - Тесты разбора командной строки (GoogleTest)
// ==============================================================================

#include "reghive/cli.hpp"
#include "reghive/platform.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace reghive::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_NoArguments_HelpToStderr) {
    Args args{"reghive"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "Usage: reghive [OPTIONS] <COMMAND>"));
}

TEST(CliTest, Parse_Help) {
    for (const char* flag : {"--help", "-h"}) {
        Args args{"reghive", flag};
        ParseResult result = parse(args.argc(), args.argv());
        EXPECT_TRUE(result.ok);
        EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    }
}

TEST(CliTest, Parse_Version) {
    Args args{"reghive", "-V"};
    ParseResult result = parse(args.argc(), args.argv());
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
    EXPECT_EQ(render_version(), "reghive 0.1.0\n");
}

TEST(CliTest, Parse_UnknownGlobalFlag) {
    Args args{"reghive", "--bogus"};
    ParseResult result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "unexpected argument '--bogus'"));
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "For more information, try '--help'."));
}

TEST(CliTest, Parse_UnknownSubcommand) {
    Args args{"reghive", "hunt"};
    ParseResult result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "unrecognized subcommand 'hunt'"));
}

TEST(CliTest, Parse_HelpSubcommand) {
    Args args{"reghive", "help", "inspect"};
    ParseResult result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    const auto* help = std::get_if<HelpCommand>(&result.command);
    ASSERT_NE(help, nullptr);
    EXPECT_EQ(help->command.value_or(""), "inspect");
}

// ==============================================================================
// inspect
// ==============================================================================

TEST(CliInspectTest, HiveOnly_Defaults) {
    Args args{"reghive", "inspect", "SYSTEM"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto* cmd = std::get_if<InspectCommand>(&result.command);
    ASSERT_NE(cmd, nullptr);
    EXPECT_EQ(platform::path_to_utf8(cmd->hive), "SYSTEM");
    EXPECT_TRUE(cmd->logs.empty());
    EXPECT_FALSE(cmd->no_logs);
    EXPECT_FALSE(cmd->no_recover);
    EXPECT_FALSE(cmd->json);
    EXPECT_FALSE(cmd->key.has_value());
    EXPECT_FALSE(cmd->max_depth.has_value());
}

TEST(CliInspectTest, AllOptions) {
    Args args{"reghive",   "-v",        "inspect",       "NTUSER.DAT",  "--log",
              "a.LOG1",    "--log=b.LOG2", "--no-recover", "--config",   "reghive.yml",
              "--max-depth", "64",      "-k",            "Software\\Microsoft", "-j",
              "-o",        "out.json",  "-q",            "-vv"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    EXPECT_EQ(result.global.verbose, 3);
    EXPECT_TRUE(result.global.quiet);

    const auto* cmd = std::get_if<InspectCommand>(&result.command);
    ASSERT_NE(cmd, nullptr);
    EXPECT_EQ(platform::path_to_utf8(cmd->hive), "NTUSER.DAT");
    ASSERT_EQ(cmd->logs.size(), 2u);
    EXPECT_EQ(platform::path_to_utf8(cmd->logs[0]), "a.LOG1");
    EXPECT_EQ(platform::path_to_utf8(cmd->logs[1]), "b.LOG2");
    EXPECT_TRUE(cmd->no_recover);
    ASSERT_TRUE(cmd->config.has_value());
    EXPECT_EQ(platform::path_to_utf8(*cmd->config), "reghive.yml");
    EXPECT_EQ(cmd->max_depth.value_or(0), 64u);
    EXPECT_EQ(cmd->key.value_or(""), "Software\\Microsoft");
    EXPECT_TRUE(cmd->json);
    ASSERT_TRUE(cmd->output.has_value());
    EXPECT_EQ(platform::path_to_utf8(*cmd->output), "out.json");
}

TEST(CliInspectTest, MissingHive) {
    Args args{"reghive", "inspect", "--json"};
    ParseResult result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "<HIVE>"));
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "Usage: reghive inspect [OPTIONS] <HIVE>"));
}

TEST(CliInspectTest, SecondPositional_Rejected) {
    Args args{"reghive", "inspect", "SYSTEM", "SOFTWARE"};
    ParseResult result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "unexpected argument 'SOFTWARE'"));
}

TEST(CliInspectTest, MissingOptionValue) {
    Args args{"reghive", "inspect", "SYSTEM", "--log"};
    ParseResult result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                         "a value is required for '--log <LOG>' but none was supplied"));
}

TEST(CliInspectTest, InvalidMaxDepth) {
    for (const char* value : {"0", "abc", "99999999999"}) {
        Args args{"reghive", "inspect", "SYSTEM", "--max-depth", value};
        ParseResult result = parse(args.argc(), args.argv());
        EXPECT_FALSE(result.ok) << value;
        EXPECT_TRUE(contains(result.diagnostic.stderr_message,
                             std::string("invalid value '") + value + "'"));
    }
}

TEST(CliInspectTest, NoLogsConflictsWithLog) {
    Args args{"reghive", "inspect", "SYSTEM", "--no-logs", "--log", "SYSTEM.LOG1"};
    ParseResult result = parse(args.argc(), args.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.diagnostic.stderr_message, "'--no-logs' cannot be used"));
}

TEST(CliInspectTest, HelpFlag) {
    Args args{"reghive", "inspect", "--help"};
    ParseResult result = parse(args.argc(), args.argv());
    ASSERT_TRUE(result.ok);
    const auto* help = std::get_if<HelpCommand>(&result.command);
    ASSERT_NE(help, nullptr);
    EXPECT_EQ(help->command.value_or(""), "inspect");
}

// ==============================================================================
// Справка
// ==============================================================================

TEST(CliHelpTest, RenderHelp) {
    EXPECT_TRUE(contains(render_help(), "inspect"));
    EXPECT_TRUE(contains(render_help(std::string("inspect")), "--no-logs"));
    EXPECT_TRUE(contains(render_help(std::string("inspect")), "--key <KEY>"));
    EXPECT_TRUE(contains(render_help(std::string("nope")), "unrecognized subcommand 'nope'"));
}

TEST(CliHelpTest, RenderUsageError) {
    EXPECT_EQ(render_usage_error("error: boom", "reghive inspect"),
              "error: boom\n\nUsage: reghive inspect\n\nFor more information, try '--help'.\n");
}

}  // namespace reghive::cli::test
