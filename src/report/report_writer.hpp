#pragma once

// ---------------------------------------------------------------------------
// report_writer.hpp
//
// FileResult 목록을 사람/도구가 읽는 형식으로 출력한다.
//
// - text : 파일별 표 + 위험 점수
// - json : { "<path>": [ {rule_id, severity, message, line, lock_type, lock_ms} ] }
// - sarif: SARIF 2.1.0. critical/high → "error", 나머지 → "warning"
//
// 읽기 실패한 파일(FileResult::error)
// - text : "ERR <path> - <reason>" 줄
// - json : 키를 만들지 않는다 (빈 배열은 문제 없는 파일에만 쓴다)
// - sarif: runs[0].invocations[0].toolExecutionNotifications 에 level "error"
//          로 기록하고 executionSuccessful 을 false 로 둔다
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "analyzer/rule.hpp"
#include "common/types.hpp"
#include "lint/file_result.hpp"

inline constexpr std::string_view kToolName    = "MigSafe";
inline constexpr std::string_view kToolVersion = "1.0.0";
inline constexpr std::string_view kSarifSchema =
    "https://json.schemastore.org/sarif-2.1.0.json";

// sarif_level
//   critical/high → "error", medium/low → "warning"
[[nodiscard]] std::string_view sarif_level(Severity sev) noexcept;

// format_lock_ms
//   "<n>ms" 또는 "unknown"
[[nodiscard]] std::string format_lock_ms(const std::optional<std::int64_t>& lock_ms);

void write_text_report(std::ostream& out, std::span<const FileResult> results);
void write_json_report(std::ostream& out, std::span<const FileResult> results);

// rules: tool.driver.rules 에 기재할 규칙 메타데이터 (보통 활성 규칙 전체)
void write_sarif_report(std::ostream& out, std::span<const FileResult> results,
                        std::span<const Rule> rules);

void write_report(std::ostream& out, OutputFormat format,
                  std::span<const FileResult> results, std::span<const Rule> rules);

// write_rule_list
//   --list-rules 출력. ID, 심각도, 잠금 모드, 기준 추정치, 설명.
void write_rule_list(std::ostream& out, std::span<const Rule> rules);
