#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 위험 마이그레이션 규칙과 탐지 결과(Finding) 정의 (헤더만, 구현 없음).
//
// [설계 원칙]
// - Rule 은 프로세스 시작 시 한 번 만들어지는 불변 데이터다.
// - Finding 은 매칭 시점의 Rule 메타데이터 스냅샷이며 Rule 을 참조하지 않는다.
// - 규칙 ID 는 유일하고, 한 번 배포된 ID 의 의미는 바뀌지 않는다 (SARIF ruleId).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "common/types.hpp"  // Severity

// ---------------------------------------------------------------------------
// Rule
//   하나의 위험 패턴.
//
//   [패턴 3단계 매칭]
//   모든 패턴은 ECMAScript 문법, 대소문자 무관으로 정규화된 구문에서 검색된다.
//   1. trigger_pattern  : 구문 어딘가에 있어야 한다.
//   2. required_pattern : (선택) trigger 이후에 있어야 한다. 비어 있으면 생략.
//   3. unless_pattern   : (선택) 마지막 trigger/required 매치 이후에 있으면
//                         규칙이 성립하지 않는다. 비어 있으면 생략.
//   2, 3 은 부정 전방탐색 (?![^;]*X) 을 구문 전체 길이의 반복 없이
//   독립 검색 두 번으로 대체한 것이다.
// ---------------------------------------------------------------------------
struct Rule {
    std::string                 id{};                // 예: "BAN001"
    Severity                    severity{Severity::kLow};
    std::string                 message{};           // 사람이 읽는 설명
    std::string                 lock_type{};         // 예: "ACCESS EXCLUSIVE" (정보용)
    std::optional<std::int64_t> base_lock_ms{};      // 행 수 힌트 없을 때의 기준 추정치

    std::string                 trigger_pattern{};
    std::string                 required_pattern{};
    std::string                 unless_pattern{};
};

// ---------------------------------------------------------------------------
// Finding
//   구문 하나가 규칙 하나에 걸린 결과. 생성 후 변경하지 않는다.
//   lock_ms == std::nullopt 이면 "추정 불가".
// ---------------------------------------------------------------------------
struct Finding {
    std::string                 rule_id{};
    Severity                    severity{Severity::kLow};
    std::string                 message{};
    std::size_t                 line{1};       // 구문 시작 줄 (1-based)
    std::string                 sql{};         // 정규화된 구문 앞부분 (표시용)
    std::string                 lock_type{};
    std::optional<std::int64_t> lock_ms{};

    bool operator==(const Finding&) const = default;
};
