// ---------------------------------------------------------------------------
// test_cli_options.cpp
//
// parse_cli / apply_cli 단위 테스트.
//
// [테스트 범위]
// - 경로 인자, 짧은/긴 옵션, --opt=value 형식
// - --disable 반복 및 쉼표 구분
// - --help / --version / --list-rules 는 경로 없이 성공
// - 실패: 알 수 없는 옵션, 값 누락, 숫자 아님, 음수, 허용 목록 밖의 이름, 경로 없음
// - apply_cli: 명시한 값만 덮어쓰고 disabled_rules 는 누적
// ---------------------------------------------------------------------------

#include "cli/cli_options.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

// argv 벡터를 만들어 parse_cli 에 넘긴다. argv[0] 은 프로그램 이름.
std::expected<CliOptions, std::string> parse(std::vector<const char*> args) {
    args.insert(args.begin(), "migsafe");
    return parse_cli(static_cast<int>(args.size()), args.data());
}

}  // namespace

// ---------------------------------------------------------------------------
// 정상 파싱
// ---------------------------------------------------------------------------
TEST(CliOptions, PathsOnly_Defaults) {
    const auto opts = parse({"migrations/", "extra.sql"});
    ASSERT_TRUE(opts.has_value()) << opts.error();

    ASSERT_EQ(opts->paths.size(), 2u);
    EXPECT_EQ(opts->paths[0], "migrations/");
    EXPECT_EQ(opts->paths[1], "extra.sql");
    EXPECT_FALSE(opts->rows.has_value());
    EXPECT_FALSE(opts->format.has_value());
    EXPECT_FALSE(opts->fail_on.has_value());
    EXPECT_FALSE(opts->jobs.has_value());
    EXPECT_TRUE(opts->disabled_rules.empty());
    EXPECT_FALSE(opts->list_rules);
    EXPECT_FALSE(opts->show_help);
}

TEST(CliOptions, AllOptions) {
    const auto opts = parse({"-r", "1000000", "-f", "sarif", "--fail-on", "critical",
                             "-j", "3", "-c", "ci.yaml", "--log-level", "debug",
                             "--log-file", "events.log", "db"});
    ASSERT_TRUE(opts.has_value()) << opts.error();

    EXPECT_EQ(opts->rows, 1'000'000);
    EXPECT_EQ(opts->format, OutputFormat::kSarif);
    EXPECT_EQ(opts->fail_on, Severity::kCritical);
    EXPECT_EQ(opts->jobs, 3u);
    EXPECT_EQ(opts->config_path, "ci.yaml");
    EXPECT_EQ(opts->log_level, "debug");
    EXPECT_EQ(opts->log_file, "events.log");
    ASSERT_EQ(opts->paths.size(), 1u);
    EXPECT_EQ(opts->paths[0], "db");
}

TEST(CliOptions, LongFormWithEquals) {
    const auto opts = parse({"--rows=500", "--format=json", "x.sql"});
    ASSERT_TRUE(opts.has_value()) << opts.error();
    EXPECT_EQ(opts->rows, 500);
    EXPECT_EQ(opts->format, OutputFormat::kJson);
}

TEST(CliOptions, DisableRepeatedAndCommaSeparated) {
    const auto opts = parse({"--disable", "BAN001,LCK002", "--disable", " BAN003 ", "x.sql"});
    ASSERT_TRUE(opts.has_value()) << opts.error();
    EXPECT_EQ(opts->disabled_rules,
              (std::vector<std::string>{"BAN001", "LCK002", "BAN003"}));
}

TEST(CliOptions, FlagsWithoutPaths_Succeed) {
    const auto help = parse({"--help"});
    ASSERT_TRUE(help.has_value());
    EXPECT_TRUE(help->show_help);

    const auto version = parse({"--version"});
    ASSERT_TRUE(version.has_value());
    EXPECT_TRUE(version->show_version);

    const auto list = parse({"--list-rules"});
    ASSERT_TRUE(list.has_value());
    EXPECT_TRUE(list->list_rules);
}

// ---------------------------------------------------------------------------
// 사용법 오류
// ---------------------------------------------------------------------------
TEST(CliOptions, NoPaths_Fails) {
    const auto opts = parse({});
    ASSERT_FALSE(opts.has_value());
    EXPECT_EQ(opts.error(), "no input paths");
}

TEST(CliOptions, UnknownOption_Fails) {
    EXPECT_FALSE(parse({"--bogus", "x.sql"}).has_value());
}

TEST(CliOptions, MissingValue_Fails) {
    EXPECT_FALSE(parse({"x.sql", "--format"}).has_value());
}

TEST(CliOptions, BadNumbers_Fail) {
    EXPECT_FALSE(parse({"--rows", "lots", "x.sql"}).has_value());
    EXPECT_FALSE(parse({"--rows=-5", "x.sql"}).has_value());
    EXPECT_FALSE(parse({"--jobs=-2", "x.sql"}).has_value());
}

TEST(CliOptions, BadNames_Fail) {
    EXPECT_FALSE(parse({"--format", "xml", "x.sql"}).has_value());
    EXPECT_FALSE(parse({"--fail-on", "severe", "x.sql"}).has_value());
    EXPECT_FALSE(parse({"--log-level", "loud", "x.sql"}).has_value());
}

// ---------------------------------------------------------------------------
// apply_cli
// ---------------------------------------------------------------------------
TEST(CliOptions, ApplyCli_OnlyExplicitValues) {
    LintConfig cfg;
    cfg.rows           = 99;
    cfg.format         = OutputFormat::kJson;
    cfg.disabled_rules = {"BAN003"};

    const auto opts = parse({"--fail-on", "low", "--disable", "LCK001", "x.sql"});
    ASSERT_TRUE(opts.has_value());
    apply_cli(*opts, cfg);

    EXPECT_EQ(cfg.rows, 99);
    EXPECT_EQ(cfg.format, OutputFormat::kJson);
    EXPECT_EQ(cfg.fail_on, Severity::kLow);
    EXPECT_EQ(cfg.disabled_rules, (std::vector<std::string>{"BAN003", "LCK001"}));
    EXPECT_FALSE(cfg.log_path.has_value());
}

TEST(CliOptions, ApplyCli_LogFileSetsLogPath) {
    LintConfig cfg;
    const auto opts = parse({"--log-file", "/tmp/x.log", "x.sql"});
    ASSERT_TRUE(opts.has_value());
    apply_cli(*opts, cfg);
    EXPECT_EQ(cfg.log_path, "/tmp/x.log");
}

TEST(CliOptions, UsageText_ListsOptions) {
    const auto usage = usage_text();
    EXPECT_NE(usage.find("Usage: migsafe"), std::string::npos);
    EXPECT_NE(usage.find("--fail-on"), std::string::npos);
    EXPECT_NE(usage.find("--list-rules"), std::string::npos);
}
