#include "analyzer/rule_catalog.hpp"
#include "analyzer/rule_matcher.hpp"
#include "cli/cli_options.hpp"
#include "collector/file_collector.hpp"
#include "config/config_loader.hpp"
#include "lint/lint_runner.hpp"
#include "logger/console_logger.hpp"
#include "logger/event_logger.hpp"
#include "report/report_writer.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// 종료 코드
//   0: 정상 (임계값 미만)
//   1: fail_on 이상 Finding 존재, 또는 파일 읽기/탐색 실패
//   2: 사용법 오류, 설정 오류
// ---------------------------------------------------------------------------
namespace {

constexpr int kExitOk        = 0;
constexpr int kExitFindings  = 1;
constexpr int kExitUsage     = 2;

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 인자 파싱 ───────────────────────────────────────────────────────
    const auto cli = parse_cli(argc, argv);
    if (!cli) {
        std::cerr << "migsafe: " << cli.error() << "\n\n" << usage_text();
        return kExitUsage;
    }
    if (cli->show_help) {
        std::cout << usage_text();
        return kExitOk;
    }
    if (cli->show_version) {
        std::cout << "migsafe " << kToolVersion << '\n';
        return kExitOk;
    }

    init_console_logger("warn");

    // ── 설정 로드 (기본값 → YAML → 환경변수 → CLI) ──────────────────────
    std::optional<std::filesystem::path> config_file;
    if (cli->config_path) {
        config_file = *cli->config_path;
    }
    auto loaded = ConfigLoader::load_for_run(config_file);
    if (!loaded) {
        return kExitUsage;  // 원인은 ConfigLoader 가 이미 로그로 남김
    }
    LintConfig config = std::move(*loaded);
    ConfigLoader::apply_env(config);
    apply_cli(*cli, config);

    init_console_logger(config.log_level);
    spdlog::debug("config: rows={} format={} fail_on={} jobs={}",
                  config.rows, to_string(config.format), to_string(config.fail_on), config.jobs);

    // ── --list-rules ────────────────────────────────────────────────────
    if (cli->list_rules) {
        const RuleMatcher matcher(default_rules(), config.disabled_rules);
        write_rule_list(std::cout, matcher.rules());
        return kExitOk;
    }

    // ── 대상 파일 수집 ──────────────────────────────────────────────────
    const auto files = collect_sql_files(cli->paths);
    if (!files) {
        spdlog::error("{}", files.error());
        return kExitFindings;
    }
    if (files->empty()) {
        spdlog::warn("No .sql files found");
        return kExitOk;
    }

    // ── 이벤트 로거 (선택) ──────────────────────────────────────────────
    std::unique_ptr<EventLogger> event_logger;
    if (config.log_path) {
        try {
            event_logger = std::make_unique<EventLogger>(*config.log_path);
        } catch (const std::runtime_error& e) {
            spdlog::error("event log: {}", e.what());
            return kExitUsage;
        }
    }

    // ── 분석 및 리포트 ──────────────────────────────────────────────────
    LintRunner runner{config, event_logger.get()};
    const auto results = runner.run(*files);
    write_report(std::cout, config.format, results, runner.matcher().rules());
    std::cout.flush();

    const auto stats = runner.stats();
    spdlog::info("scanned {} file(s), {} statement(s), {} finding(s), max risk {} in {}ms",
                 stats.files_scanned, stats.statements, stats.findings_total,
                 stats.max_risk_score, stats.elapsed.count());

    if (has_errors(results) || exceeds_threshold(results, config.fail_on)) {
        return kExitFindings;
    }
    return kExitOk;
}
