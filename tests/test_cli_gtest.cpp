// ==============================================================================
// test_cli_gtest.cpp - Тесты парсинга командной строки (GoogleTest)
// ==============================================================================

#include "dds/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace dds::cli::test {

namespace {

/// argv из списка строк (argv[0] = "dds")
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_{"dds"} {
        storage_.insert(storage_.end(), args.begin(), args.end());
        for (auto& s : storage_) {
            ptrs_.push_back(s.data());
        }
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

ParseResult parse_args(std::initializer_list<std::string> list) {
    Args args(list);
    return parse(args.argc(), args.argv());
}

}  // namespace

// ==============================================================================
// Поиск (действие по умолчанию)
// ==============================================================================

TEST(CliTest, NoArgs_SearchesCurrentDirectory) {
    // Arrange & Act
    ParseResult r = parse_args({});

    // Assert
    ASSERT_TRUE(r.ok);
    ASSERT_TRUE(std::holds_alternative<SearchCommand>(r.command));
    const auto& cmd = std::get<SearchCommand>(r.command);
    EXPECT_EQ(cmd.dir, ".");
    EXPECT_FALSE(cmd.recursive);
    EXPECT_FALSE(cmd.dry);
    EXPECT_FALSE(cmd.force);
    EXPECT_FALSE(cmd.cache_hours.has_value());
}

TEST(CliTest, LongFlags) {
    ParseResult r = parse_args({"--recursive", "--dry", "--force", "--verbose", "/Users/me"});

    ASSERT_TRUE(r.ok);
    const auto& cmd = std::get<SearchCommand>(r.command);
    EXPECT_TRUE(cmd.recursive);
    EXPECT_TRUE(cmd.dry);
    EXPECT_TRUE(cmd.force);
    EXPECT_EQ(cmd.dir, "/Users/me");
    EXPECT_EQ(r.global.verbose, 1);
}

TEST(CliTest, ShortFlagsBundled) {
    ParseResult r = parse_args({"-rdvv", "dir"});

    ASSERT_TRUE(r.ok);
    const auto& cmd = std::get<SearchCommand>(r.command);
    EXPECT_TRUE(cmd.recursive);
    EXPECT_TRUE(cmd.dry);
    EXPECT_EQ(r.global.verbose, 2);
}

TEST(CliTest, QuietFlag) {
    ParseResult r = parse_args({"-q"});

    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(r.global.quiet);
}

TEST(CliTest, ValueOptions_SpaceAndEquals) {
    ParseResult r = parse_args(
        {"--cache-hours", "0", "-j", "16", "--timeout=5", "--config=/etc/dds.yaml", "x"});

    ASSERT_TRUE(r.ok);
    const auto& cmd = std::get<SearchCommand>(r.command);
    EXPECT_EQ(cmd.cache_hours, 0u);
    EXPECT_EQ(cmd.concurrency, 16u);
    EXPECT_EQ(cmd.timeout_secs, 5u);
    ASSERT_TRUE(r.global.config_path.has_value());
    EXPECT_EQ(*r.global.config_path, "/etc/dds.yaml");
}

TEST(CliTest, DoubleDash_TreatsNextAsDirectory) {
    ParseResult r = parse_args({"--", "-weird-dir"});

    ASSERT_TRUE(r.ok);
    EXPECT_EQ(std::get<SearchCommand>(r.command).dir, "-weird-dir");
}

// ==============================================================================
// Команды управления кэшем
// ==============================================================================

TEST(CliTest, CacheStatus) {
    ParseResult r = parse_args({"--cache-status"});

    ASSERT_TRUE(r.ok);
    ASSERT_TRUE(std::holds_alternative<CacheStatusCommand>(r.command));
    EXPECT_FALSE(std::get<CacheStatusCommand>(r.command).json);
    EXPECT_FALSE(std::get<CacheStatusCommand>(r.command).cache_hours.has_value());
}

TEST(CliTest, CacheStatus_KeepsCacheHours) {
    ParseResult r = parse_args({"--cache-hours", "6", "--cache-status"});

    ASSERT_TRUE(r.ok);
    ASSERT_TRUE(std::holds_alternative<CacheStatusCommand>(r.command));
    EXPECT_EQ(std::get<CacheStatusCommand>(r.command).cache_hours, 6u);
}

TEST(CliTest, CacheStats_KeepsCacheHours) {
    ParseResult r = parse_args({"--cache-stats", "--cache-hours", "0", "--json"});

    ASSERT_TRUE(r.ok);
    ASSERT_TRUE(std::holds_alternative<CacheStatsCommand>(r.command));
    const auto& cmd = std::get<CacheStatsCommand>(r.command);
    EXPECT_TRUE(cmd.json);
    EXPECT_EQ(cmd.cache_hours, 0u);
}

TEST(CliTest, CacheStats_Json) {
    ParseResult r = parse_args({"--json", "--cache-stats"});

    ASSERT_TRUE(r.ok);
    ASSERT_TRUE(std::holds_alternative<CacheStatsCommand>(r.command));
    EXPECT_TRUE(std::get<CacheStatsCommand>(r.command).json);
}

TEST(CliTest, CacheClearIncomplete) {
    ParseResult r = parse_args({"--cache-clear-incomplete"});

    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(std::holds_alternative<CacheClearIncompleteCommand>(r.command));
}

TEST(CliTest, TwoCacheCommands_AreRejected) {
    ParseResult r = parse_args({"--cache-status", "--cache-stats"});

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.exit_code, 2);
    EXPECT_NE(r.diagnostic.stderr_message.find("cannot be used with"), std::string::npos);
}

// ==============================================================================
// help / version
// ==============================================================================

TEST(CliTest, Help) {
    ParseResult r = parse_args({"-r", "--help"});

    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(r.command));
}

TEST(CliTest, Version) {
    ParseResult r = parse_args({"-V"});

    ASSERT_TRUE(r.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(r.command));
    EXPECT_EQ(render_version(), "dds v0.2.0\n");
}

TEST(CliTest, RenderHelp_ListsOptions) {
    std::string help = render_help();

    EXPECT_NE(help.find("Usage: dds [OPTIONS] [DIR]"), std::string::npos);
    for (const char* opt : {"--recursive", "--dry", "--force", "--cache-hours", "--concurrency",
                            "--timeout", "--config", "--cache-status", "--cache-stats",
                            "--cache-clear-incomplete", "--json", "--version"}) {
        EXPECT_NE(help.find(opt), std::string::npos) << opt;
    }
}

// ==============================================================================
// Ошибки
// ==============================================================================

TEST(CliTest, UnknownLongOption_ExitCode2) {
    ParseResult r = parse_args({"--frobnicate"});

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.exit_code, 2);
    EXPECT_EQ(r.diagnostic.stderr_message.rfind("error: unexpected argument '--frobnicate'", 0),
              0u);
    EXPECT_NE(r.diagnostic.stderr_message.find("For more information, try '--help'."),
              std::string::npos);
}

TEST(CliTest, UnknownShortFlag_ExitCode2) {
    ParseResult r = parse_args({"-rx"});

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.exit_code, 2);
    EXPECT_NE(r.diagnostic.stderr_message.find("'-x'"), std::string::npos);
}

TEST(CliTest, SecondPositional_Rejected) {
    ParseResult r = parse_args({"a", "b"});

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.exit_code, 2);
}

TEST(CliTest, MissingValue_Rejected) {
    ParseResult r = parse_args({"--timeout"});

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.exit_code, 2);
    EXPECT_NE(r.diagnostic.stderr_message.find("a value is required"), std::string::npos);
}

TEST(CliTest, NonNumericValue_Rejected) {
    ParseResult r = parse_args({"--cache-hours", "soon"});

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.exit_code, 2);
    EXPECT_NE(r.diagnostic.stderr_message.find("invalid value 'soon'"), std::string::npos);
}

TEST(CliTest, ZeroConcurrency_Rejected) {
    ParseResult r = parse_args({"--concurrency=0"});

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.exit_code, 2);
}

TEST(CliTest, NegativeTimeout_Rejected) {
    ParseResult r = parse_args({"--timeout", "-3"});

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.diagnostic.exit_code, 2);
}

}  // namespace dds::cli::test
