#pragma once

// ---------------------------------------------------------------------------
// rule_matcher.hpp
//
// 규칙 카탈로그를 정규식으로 컴파일하고, 구문 단위로 매칭하여 Finding 을
// 만든다. 잠금 시간 추정과 위험 점수 집계도 여기서 제공한다.
//
// [스레드 안전성]
// - 생성 이후 RuleMatcher 는 읽기 전용이다. 여러 스레드가 같은 인스턴스의
//   analyze() 를 동시에 호출해도 된다 (std::regex 검색은 const).
//
// [오탐/미탐 트레이드오프]
// - 패턴 검색이므로 주석/문자열 리터럴 안의 키워드도 매칭된다 (false positive).
// - "ALTER TABLE IF EXISTS t ..." 나 스키마 한정자 사이 공백처럼 \S+ 하나로
//   표현되지 않는 테이블 이름은 놓친다 (false negative).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "analyzer/rule.hpp"
#include "analyzer/statement_splitter.hpp"

// Finding::sql 에 담는 구문 앞부분 최대 길이
inline constexpr std::size_t kMaxSnippetLength = 120;

// 구문 하나에서 패턴을 검색하는 최대 길이 (8 KiB). 초과분은 검색하지 않는다.
// std::regex 는 \S+ 가 소비하는 문자마다 재귀하므로 스택 깊이가 이 값에 비례한다.
inline constexpr std::size_t kMaxScanLength = 8 * 1024;

// 행 수 → 밀리초 환산 비율 (rows / kRowsPerMs)
inline constexpr std::int64_t kRowsPerMs = 10000;

// ---------------------------------------------------------------------------
// RuleMatcher
//   생성 시 패턴 목록을 컴파일하고 analyze() 에서 매칭.
//
//   [성능 고려사항]
//   - 생성자에서 std::regex 컴파일 비용이 발생하므로 인스턴스를 재사용할 것.
//   - 비용은 O(규칙 수 * 구문 길이).
// ---------------------------------------------------------------------------
class RuleMatcher {
public:
    // 기본 생성자: default_rules() 전체를 사용한다.
    RuleMatcher();

    // rules: 사용할 규칙 (선언 순서 유지)
    // disabled_ids: 건너뛸 규칙 ID. 카탈로그에 없는 ID 는 경고 로그 후 무시.
    //
    // 잘못된 정규식을 가진 규칙은 로그 후 제외한다. 나머지 규칙은 계속 적용된다.
    explicit RuleMatcher(std::vector<Rule> rules,
                         const std::vector<std::string>& disabled_ids = {});

    ~RuleMatcher();

    // 복사 금지 (컴파일된 regex 재사용), 이동 허용
    RuleMatcher(const RuleMatcher&)            = delete;
    RuleMatcher& operator=(const RuleMatcher&) = delete;
    RuleMatcher(RuleMatcher&&) noexcept;
    RuleMatcher& operator=(RuleMatcher&&) noexcept;

    // analyze
    //   sql : 마이그레이션 스크립트 전체
    //   rows: 행 수 힌트 (0 이하 = 없음)
    //   반환: 구문 순서, 구문 안에서는 규칙 선언 순서로 정렬된 Finding 목록.
    //   어떤 문자열에도 예외를 던지지 않는다. 빈 입력은 빈 결과.
    [[nodiscard]] std::vector<Finding> analyze(std::string_view sql,
                                               std::int64_t rows = 0) const;

    // analyze_statement
    //   이미 분할된 구문 하나에 대해 매칭한다. 결과를 out 뒤에 덧붙인다.
    void analyze_statement(const Statement& stmt, std::int64_t rows,
                           std::vector<Finding>& out) const;

    // 실제로 활성화된 규칙 (비활성/컴파일 실패 제외, 선언 순서)
    [[nodiscard]] const std::vector<Rule>& rules() const noexcept { return active_rules_; }

private:
    struct CompiledRule;

    std::vector<Rule>         active_rules_;
    std::vector<CompiledRule> compiled_;  // active_rules_ 와 같은 인덱스
};

// analyze
//   내장 카탈로그 전체로 분석한다. 내부 정적 RuleMatcher 를 공유한다.
[[nodiscard]] std::vector<Finding> analyze(std::string_view sql, std::int64_t rows = 0);

// estimate_lock_ms
//   rows <= 0 : base_ms 그대로 (없으면 없음)
//   rows >  0 : max(base_ms 또는 1, rows / 10000 + (base_ms 또는 0)), 정수 나눗셈
[[nodiscard]] std::optional<std::int64_t>
estimate_lock_ms(std::optional<std::int64_t> base_ms, std::int64_t rows) noexcept;

// risk_score
//   min(100, Σ severity_weight * 25). 빈 목록은 0.
[[nodiscard]] int risk_score(std::span<const Finding> findings) noexcept;
