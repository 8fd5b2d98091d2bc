#pragma once

// ---------------------------------------------------------------------------
// lint_config.hpp
//
// 린트 실행 설정 구조체 정의 (헤더만, 구현 없음).
// 기본값 → .migsafe.yaml → 환경변수 → CLI 플래그 순서로 덮어쓴다.
//
// [설계 원칙]
// - 모든 멤버는 기본값을 명시한다. 설정 파일이 없어도 그대로 실행 가능.
// - 이 구조체는 판정 로직을 포함하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"  // Severity, OutputFormat

// 설정 파일 기본 이름 (작업 디렉터리 기준)
inline constexpr const char* kDefaultConfigFile = ".migsafe.yaml";

// ---------------------------------------------------------------------------
// LintConfig
//   rows          : 잠금 시간 추정용 행 수 힌트 (0 = 없음)
//   format        : 리포트 형식
//   fail_on       : 이 심각도 이상 Finding 이 있으면 종료 코드 1
//   disabled_rules: 건너뛸 규칙 ID 목록
//   jobs          : 파일 분석 워커 수 (0 = hardware_concurrency)
//   log_level     : "trace"|"debug"|"info"|"warn"|"error"|"critical"|"off"
//   log_path      : 구조화 이벤트 로그 파일 (없으면 기록 안 함)
// ---------------------------------------------------------------------------
struct LintConfig {
    std::int64_t               rows{0};
    OutputFormat               format{OutputFormat::kText};
    Severity                   fail_on{Severity::kHigh};
    std::vector<std::string>   disabled_rules{};
    std::uint32_t              jobs{0};
    std::string                log_level{"warn"};
    std::optional<std::string> log_path{};
};
