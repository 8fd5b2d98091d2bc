#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 구조화 이벤트 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - analyzer 헤더를 include 하지 않는다. severity 는 문자열로 받는다.
//   호출자: std::string(to_string(finding.severity))
//
// [민감정보 취급 주의]
// - 구문 원문(sql)은 기록하지 않는다. 마이그레이션에 포함된 기본값/시드 데이터가
//   로그 수집기로 흘러가지 않도록 한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// FileScanLog
//   파일 하나 분석 완료 이벤트. event = "file_scanned"
// ---------------------------------------------------------------------------
struct FileScanLog {
    std::string                           path{};
    std::uint64_t                         statements{0};
    std::uint64_t                         findings{0};
    int                                   risk_score{0};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};

// ---------------------------------------------------------------------------
// FindingLog
//   Finding 하나. event = "finding"
// ---------------------------------------------------------------------------
struct FindingLog {
    std::string                           path{};
    std::string                           rule_id{};
    std::string                           severity{};
    std::uint64_t                         line{0};
    std::string                           lock_type{};
    std::optional<std::int64_t>           lock_ms{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// FileErrorLog
//   파일 읽기 실패. event = "file_error"
// ---------------------------------------------------------------------------
struct FileErrorLog {
    std::string                           path{};
    std::string                           reason{};
    std::chrono::system_clock::time_point timestamp{};
};
