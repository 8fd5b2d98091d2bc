// ---------------------------------------------------------------------------
// rule_catalog.cpp
//
// PostgreSQL 잠금 모드 기준 내장 규칙.
//
// [패턴 작성 규칙]
// - 입력은 statement_splitter 가 정규화한 한 줄 구문이다. 공백은 \s+ 로 쓴다.
// - 구문 전체에 걸친 .* / [^;]* 반복을 쓰지 않는다. 긴 구문에서
//   std::regex 의 재귀 깊이가 입력 길이에 비례하기 때문이다.
//   "뒤에 X 가 없어야 함" 은 unless_pattern 으로 표현한다.
//
// [LCK001 trigger]
// "ADD\s+(?:COLUMN\s+)?\S+\s+\S+" 에서 COLUMN 그룹을 뺀 형태를 쓴다.
// COLUMN 키워드도 \S+ 하나로 흡수되므로 매칭되는 구문 집합은 같고,
// "ADD COLUMN x NOT NULL" 처럼 타입이 생략된 경우에도 trigger 가
// NOT 을 삼키지 않는다.
// ---------------------------------------------------------------------------

#include "analyzer/rule_catalog.hpp"

#include <algorithm>
#include <optional>
#include <string_view>
#include <vector>

namespace {

std::vector<Rule> build_catalog() {
    return {
        Rule{
            .id               = "BAN001",
            .severity         = Severity::kCritical,
            .message          = "DROP TABLE permanently deletes data and all indexes",
            .lock_type        = "ACCESS EXCLUSIVE",
            .base_lock_ms     = 10,
            .trigger_pattern  = R"(\bDROP\s+TABLE\b)",
        },
        Rule{
            .id               = "BAN002",
            .severity         = Severity::kHigh,
            .message          = "DROP COLUMN is irreversible and may break running queries",
            .lock_type        = "ACCESS EXCLUSIVE",
            .base_lock_ms     = 50,
            .trigger_pattern  = R"(\bALTER\s+TABLE\s+\S+\s+DROP\s+COLUMN\b)",
        },
        Rule{
            .id               = "BAN003",
            .severity         = Severity::kMedium,
            .message          = "Renaming table/column will break application queries",
            .lock_type        = "ACCESS EXCLUSIVE",
            .base_lock_ms     = 5,
            .trigger_pattern  = R"(\bALTER\s+TABLE\s+\S+\s+RENAME\b)",
        },
        Rule{
            .id               = "LCK001",
            .severity         = Severity::kCritical,
            .message          = "Adding NOT NULL column without DEFAULT rewrites entire table under lock",
            .lock_type        = "ACCESS EXCLUSIVE",
            .base_lock_ms     = std::nullopt,
            .trigger_pattern  = R"(\bADD\s+\S+\s+\S+)",
            .required_pattern = R"(\bNOT\s+NULL\b)",
            .unless_pattern   = R"(\bDEFAULT\b)",
        },
        Rule{
            .id               = "LCK002",
            .severity         = Severity::kHigh,
            .message          = "CREATE INDEX without CONCURRENTLY blocks all writes",
            .lock_type        = "SHARE",
            .base_lock_ms     = std::nullopt,
            .trigger_pattern  = R"(\bCREATE\s+(?:UNIQUE\s+)?INDEX\s+(?!CONCURRENTLY\b))",
        },
        Rule{
            .id               = "LCK003",
            .severity         = Severity::kHigh,
            .message          = "Adding FK without NOT VALID scans entire table under lock",
            .lock_type        = "SHARE ROW EXCLUSIVE",
            .base_lock_ms     = std::nullopt,
            .trigger_pattern  = R"(\bADD\s+(?:CONSTRAINT\s+\S+\s+)?FOREIGN\s+KEY\b)",
            .unless_pattern   = R"(\bNOT\s+VALID\b)",
        },
        Rule{
            .id               = "LCK004",
            .severity         = Severity::kCritical,
            .message          = "Changing column type rewrites the entire table under ACCESS EXCLUSIVE lock",
            .lock_type        = "ACCESS EXCLUSIVE",
            .base_lock_ms     = std::nullopt,
            .trigger_pattern  =
                R"(\bALTER\s+TABLE\s+\S+\s+ALTER\s+COLUMN\s+\S+\s+(?:SET\s+DATA\s+)?TYPE\b)",
        },
        Rule{
            .id               = "LCK005",
            .severity         = Severity::kHigh,
            .message          = "SET NOT NULL scans full table; use CHECK constraint + NOT VALID instead",
            .lock_type        = "ACCESS EXCLUSIVE",
            .base_lock_ms     = std::nullopt,
            .trigger_pattern  =
                R"(\bALTER\s+TABLE\s+\S+\s+ALTER\s+COLUMN\s+\S+\s+SET\s+NOT\s+NULL\b)",
        },
    };
}

}  // namespace

const std::vector<Rule>& default_rules() {
    static const std::vector<Rule> kCatalog = build_catalog();
    return kCatalog;
}

std::optional<Rule> find_rule(std::string_view id) {
    const auto& rules = default_rules();
    const auto  it    = std::find_if(rules.begin(), rules.end(),
                                     [id](const Rule& r) { return r.id == id; });
    if (it == rules.end()) {
        return std::nullopt;
    }
    return *it;
}
