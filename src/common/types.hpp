#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// Severity
//   규칙 위반의 심각도. 서열형(ordinal)이며 선언 순서가 곧 대소 관계다.
//   low < medium < high < critical
//
//   [주의] 값(enum 정수)은 순서 비교에만 사용한다. 점수 계산에는
//   severity_weight(), 종료 코드 임계값 비교에는 severity_rank() 를 쓴다.
// ---------------------------------------------------------------------------
enum class Severity : std::uint8_t {
    kLow      = 0,
    kMedium   = 1,
    kHigh     = 2,
    kCritical = 3,
};

// severity_rank
//   종료 코드 정책에서 사용하는 1-based 순위. low=1 ... critical=4
[[nodiscard]] constexpr int severity_rank(Severity sev) noexcept {
    return static_cast<int>(sev) + 1;
}

// severity_weight
//   위험 점수 가중치. 현재는 rank 와 같지만 의미가 다르므로 분리한다.
[[nodiscard]] constexpr int severity_weight(Severity sev) noexcept {
    switch (sev) {
        case Severity::kLow:      return 1;
        case Severity::kMedium:   return 2;
        case Severity::kHigh:     return 3;
        case Severity::kCritical: return 4;
    }
    return 1;
}

// to_string
//   출력/직렬화용 소문자 이름. JSON, SARIF, 텍스트 리포트 모두 이 값을 쓴다.
[[nodiscard]] constexpr std::string_view to_string(Severity sev) noexcept {
    switch (sev) {
        case Severity::kLow:      return "low";
        case Severity::kMedium:   return "medium";
        case Severity::kHigh:     return "high";
        case Severity::kCritical: return "critical";
    }
    return "low";
}

// parse_severity
//   대소문자 무관 파싱. 알 수 없는 이름이면 std::nullopt.
[[nodiscard]] inline std::optional<Severity> parse_severity(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "low")      return Severity::kLow;
    if (lower == "medium")   return Severity::kMedium;
    if (lower == "high")     return Severity::kHigh;
    if (lower == "critical") return Severity::kCritical;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// OutputFormat
//   리포트 출력 형식. CLI --format / config format 키와 1:1 대응.
// ---------------------------------------------------------------------------
enum class OutputFormat : std::uint8_t {
    kText  = 0,
    kJson  = 1,
    kSarif = 2,
};

[[nodiscard]] constexpr std::string_view to_string(OutputFormat fmt) noexcept {
    switch (fmt) {
        case OutputFormat::kText:  return "text";
        case OutputFormat::kJson:  return "json";
        case OutputFormat::kSarif: return "sarif";
    }
    return "text";
}

[[nodiscard]] inline std::optional<OutputFormat> parse_output_format(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "text")  return OutputFormat::kText;
    if (lower == "json")  return OutputFormat::kJson;
    if (lower == "sarif") return OutputFormat::kSarif;
    return std::nullopt;
}
