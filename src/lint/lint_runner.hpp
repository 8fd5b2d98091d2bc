#pragma once

// ---------------------------------------------------------------------------
// lint_runner.hpp
//
// 파일 목록을 읽어 RuleMatcher 로 분석하고 FileResult 목록을 만든다.
//
// [동시성]
// - 파일 단위로 boost::asio::thread_pool 에 분배한다. 파일 간 공유 상태는
//   읽기 전용 RuleMatcher 와 atomic LintStats 뿐이다.
// - 결과 벡터는 입력 순서를 그대로 유지한다 (완료 순서와 무관).
//
// [오류 처리]
// - 읽기 실패한 파일은 FileResult::error 에 사유를 담고 나머지 파일은 계속
//   분석한다. 종료 코드 결정은 호출자(main) 몫이다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "analyzer/rule_matcher.hpp"
#include "config/lint_config.hpp"
#include "lint/file_result.hpp"
#include "stats/lint_stats.hpp"

class EventLogger;

class LintRunner {
public:
    // event_logger: nullptr 이면 이벤트 로그를 남기지 않는다. 소유하지 않음.
    explicit LintRunner(const LintConfig& config, EventLogger* event_logger = nullptr);

    LintRunner(const LintRunner&)            = delete;
    LintRunner& operator=(const LintRunner&) = delete;

    // run
    //   files 를 모두 분석한다. 반환 벡터의 i 번째는 files[i] 의 결과.
    [[nodiscard]] std::vector<FileResult> run(const std::vector<std::filesystem::path>& files);

    // lint_source
    //   이미 읽은 SQL 텍스트 하나를 분석한다.
    [[nodiscard]] FileResult lint_source(const std::string& path, std::string_view sql);

    [[nodiscard]] const RuleMatcher& matcher() const noexcept { return matcher_; }
    [[nodiscard]] LintStatsSnapshot stats() const noexcept { return stats_.snapshot(); }

    // 실제 사용할 워커 수 (config.jobs == 0 이면 hardware_concurrency, 최소 1)
    [[nodiscard]] std::size_t worker_count(std::size_t file_count) const noexcept;

private:
    FileResult lint_file(const std::filesystem::path& path);

    std::int64_t rows_;
    std::uint32_t jobs_;
    RuleMatcher  matcher_;
    LintStats    stats_;
    EventLogger* event_logger_;
};

// read_sql_file
//   파일 전체를 문자열로 읽는다. 실패 시 사유 문자열.
[[nodiscard]] std::expected<std::string, std::string>
read_sql_file(const std::filesystem::path& path);

// exceeds_threshold
//   severity_rank(finding) >= severity_rank(fail_on) 인 Finding 이 하나라도 있으면 true.
[[nodiscard]] bool exceeds_threshold(std::span<const FileResult> results, Severity fail_on) noexcept;

// has_errors
//   읽기 실패한 파일이 하나라도 있으면 true.
[[nodiscard]] bool has_errors(std::span<const FileResult> results) noexcept;
