#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "analyzer/rule.hpp"  // Finding

// ---------------------------------------------------------------------------
// FileResult
//   파일 하나의 분석 결과. error 가 있으면 findings 는 비어 있다.
// ---------------------------------------------------------------------------
struct FileResult {
    std::string                path{};
    std::vector<Finding>       findings{};
    std::size_t                statements{0};
    int                        risk_score{0};
    std::optional<std::string> error{};  // 읽기 실패 사유
};
