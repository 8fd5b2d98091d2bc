// ---------------------------------------------------------------------------
// rule_matcher.cpp
//
// 규칙 매칭 / 잠금 시간 추정 / 위험 점수 구현.
//
// [매칭 절차: 구문 하나, 규칙 하나]
//  1. trigger 를 검색한다. 없으면 불일치.
//  2. required 가 있으면 trigger 끝 이후에서 검색한다. 없으면 불일치.
//     있으면 마지막 매치의 끝을 anchor 로 삼는다.
//     required 가 없으면 마지막 trigger 매치의 끝이 anchor 다.
//  3. unless 가 있고 anchor 이후에서 발견되면 불일치.
//
// "마지막" 매치를 anchor 로 쓰는 이유: (?![^;]*X) 는 여러 후보 중 하나라도
// 뒤에 X 가 없으면 성립한다. 가장 뒤쪽 후보가 그 조건을 가장 쉽게 만족한다.
//
// [CompiledRule 구현 주의사항]
// 헤더는 CompiledRule 을 전방 선언만 하므로 소멸자/이동 연산은 이 파일에서
// 정의한다. std::regex 는 shared_ptr 로 보관하여 이동 비용을 줄인다.
// ---------------------------------------------------------------------------

#include "analyzer/rule_matcher.hpp"

#include <algorithm>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <spdlog/spdlog.h>

#include "analyzer/rule_catalog.hpp"

struct RuleMatcher::CompiledRule {
    std::shared_ptr<std::regex> trigger;
    std::shared_ptr<std::regex> required;  // nullptr = 생략
    std::shared_ptr<std::regex> unless;    // nullptr = 생략
};

namespace {

constexpr auto kRegexFlags = std::regex_constants::icase | std::regex_constants::ECMAScript;

// 빈 패턴은 "생략" 을 뜻하므로 nullptr 를 돌려준다.
// 잘못된 패턴이면 std::regex_error 를 그대로 던진다.
std::shared_ptr<std::regex> compile_optional(const std::string& pattern) {
    if (pattern.empty()) {
        return nullptr;
    }
    return std::make_shared<std::regex>(pattern, kRegexFlags);
}

// text[from..] 에서 re 의 마지막 매치 끝 offset. 없으면 std::nullopt.
std::optional<std::size_t> last_match_end(const std::string& text,
                                          std::size_t from,
                                          const std::regex& re) {
    const auto begin = text.begin() + static_cast<std::ptrdiff_t>(from);
    const auto flags = from > 0 ? std::regex_constants::match_prev_avail
                                : std::regex_constants::match_default;

    std::optional<std::size_t> last_end;
    for (std::sregex_iterator it(begin, text.end(), re, flags), end; it != end; ++it) {
        last_end = from + static_cast<std::size_t>(it->position(0) + it->length(0));
    }
    return last_end;
}

bool contains_after(const std::string& text, std::size_t from, const std::regex& re) {
    const auto begin = text.begin() + static_cast<std::ptrdiff_t>(from);
    const auto flags = from > 0 ? std::regex_constants::match_prev_avail
                                : std::regex_constants::match_default;
    return std::regex_search(begin, text.end(), re, flags);
}

}  // namespace

// ---------------------------------------------------------------------------
// 생성/소멸
// ---------------------------------------------------------------------------
RuleMatcher::RuleMatcher()
    : RuleMatcher(default_rules())
{}

RuleMatcher::RuleMatcher(std::vector<Rule> rules, const std::vector<std::string>& disabled_ids) {
    const std::unordered_set<std::string> disabled(disabled_ids.begin(), disabled_ids.end());

    for (const auto& id : disabled) {
        const bool known = std::any_of(rules.begin(), rules.end(),
                                       [&id](const Rule& r) { return r.id == id; });
        if (!known) {
            spdlog::warn("rule_matcher: unknown rule id '{}' in disabled list, ignoring", id);
        }
    }

    active_rules_.reserve(rules.size());
    compiled_.reserve(rules.size());

    for (auto& rule : rules) {
        if (disabled.contains(rule.id)) {
            spdlog::debug("rule_matcher: rule {} disabled", rule.id);
            continue;
        }

        try {
            CompiledRule cr{
                std::make_shared<std::regex>(rule.trigger_pattern, kRegexFlags),
                compile_optional(rule.required_pattern),
                compile_optional(rule.unless_pattern),
            };
            compiled_.push_back(std::move(cr));
            active_rules_.push_back(std::move(rule));
        } catch (const std::regex_error& e) {
            // 규칙 하나가 빠지면 해당 위험 유형을 놓친다 (false negative).
            spdlog::error("rule_matcher: rule {} has invalid pattern, skipping: {}",
                          rule.id, e.what());
        }
    }

    if (active_rules_.empty()) {
        spdlog::warn("rule_matcher: no active rules, every script will pass");
    }
}

RuleMatcher::~RuleMatcher() = default;

RuleMatcher::RuleMatcher(RuleMatcher&&) noexcept            = default;
RuleMatcher& RuleMatcher::operator=(RuleMatcher&&) noexcept = default;

// ---------------------------------------------------------------------------
// analyze
// ---------------------------------------------------------------------------
std::vector<Finding> RuleMatcher::analyze(std::string_view sql, std::int64_t rows) const {
    std::vector<Finding> findings;
    for (const auto& stmt : StatementSplitter{sql}) {
        analyze_statement(stmt, rows, findings);
    }
    return findings;
}

void RuleMatcher::analyze_statement(const Statement& stmt, std::int64_t rows,
                                    std::vector<Finding>& out) const {
    // 병적으로 긴 구문은 앞부분만 검색한다.
    const std::string& full = stmt.text;
    std::string truncated;
    if (full.size() > kMaxScanLength) {
        spdlog::warn("rule_matcher: statement at line {} is {} bytes, scanning first {} only",
                     stmt.line, full.size(), kMaxScanLength);
        truncated = full.substr(0, kMaxScanLength);
    }
    const std::string& text = truncated.empty() ? full : truncated;

    for (std::size_t i = 0; i < compiled_.size(); ++i) {
        const auto& cr   = compiled_[i];
        const auto& rule = active_rules_[i];

        bool matched = false;
        try {
            std::smatch first;
            if (!std::regex_search(text, first, *cr.trigger)) {
                continue;
            }

            std::size_t anchor = static_cast<std::size_t>(first.position(0) + first.length(0));
            if (cr.required) {
                const auto req_end = last_match_end(text, anchor, *cr.required);
                if (!req_end) {
                    continue;
                }
                anchor = *req_end;
            } else if (cr.unless) {
                anchor = last_match_end(text, 0, *cr.trigger).value_or(anchor);
            }

            matched = !(cr.unless && contains_after(text, anchor, *cr.unless));
        } catch (const std::regex_error& e) {
            // error_complexity / error_stack: 해당 규칙만 이 구문에서 건너뛴다.
            spdlog::warn("rule_matcher: rule {} aborted on statement at line {}: {}",
                         rule.id, stmt.line, e.what());
            continue;
        }

        if (!matched) {
            continue;
        }

        out.push_back(Finding{
            .rule_id   = rule.id,
            .severity  = rule.severity,
            .message   = rule.message,
            .line      = stmt.line,
            .sql       = full.substr(0, kMaxSnippetLength),
            .lock_type = rule.lock_type,
            .lock_ms   = estimate_lock_ms(rule.base_lock_ms, rows),
        });
    }
}

// ---------------------------------------------------------------------------
// 자유 함수
// ---------------------------------------------------------------------------
std::vector<Finding> analyze(std::string_view sql, std::int64_t rows) {
    static const RuleMatcher kDefaultMatcher;
    return kDefaultMatcher.analyze(sql, rows);
}

std::optional<std::int64_t>
estimate_lock_ms(std::optional<std::int64_t> base_ms, std::int64_t rows) noexcept {
    if (rows <= 0) {
        return base_ms;
    }
    return std::max(base_ms.value_or(1), rows / kRowsPerMs + base_ms.value_or(0));
}

int risk_score(std::span<const Finding> findings) noexcept {
    constexpr int kMaxScore     = 100;
    constexpr int kWeightFactor = 25;

    int total = 0;
    for (const auto& f : findings) {
        total += severity_weight(f.severity) * kWeightFactor;
        if (total >= kMaxScore) {
            return kMaxScore;
        }
    }
    return total;
}
