#pragma once

// ---------------------------------------------------------------------------
// rule_catalog.hpp
//
// 내장 규칙 카탈로그. 선언 순서가 곧 Finding 출력 순서다.
//
// [호환성]
// - 추가만 허용한다 (append-only). 기존 ID 삭제/의미 변경 금지.
//   CI 의 SARIF 이력이 ruleId 로 결과를 추적한다.
// ---------------------------------------------------------------------------

#include <optional>
#include <string_view>
#include <vector>

#include "analyzer/rule.hpp"

// default_rules
//   프로세스 범위 읽기 전용 카탈로그. 최초 호출 시 한 번 초기화된다.
[[nodiscard]] const std::vector<Rule>& default_rules();

// find_rule
//   ID 로 내장 규칙을 찾는다 (대소문자 구분). 없으면 std::nullopt.
[[nodiscard]] std::optional<Rule> find_rule(std::string_view id);
