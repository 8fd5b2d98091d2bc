#pragma once

// ---------------------------------------------------------------------------
// file_collector.hpp
//
// CLI 경로 인자를 분석 대상 .sql 파일 목록으로 펼친다.
//
// - 디렉터리: 하위 전체에서 확장자가 정확히 ".sql" 인 일반 파일, 경로순 정렬
// - 일반 파일: 확장자와 무관하게 그대로 포함
// - 그 외: "<path> not found" 오류
//
// 인자 순서는 유지한다. 같은 파일이 여러 번 나오면 (직접 지정 + 디렉터리 스캔,
// "./a.sql" 과 "a.sql" 등) 처음 나온 경로 하나만 남긴다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

[[nodiscard]] std::expected<std::vector<std::filesystem::path>, std::string>
collect_sql_files(const std::vector<std::string>& paths);
