#pragma once

// ---------------------------------------------------------------------------
// cli_options.hpp
//
// 명령행 인자 파싱. boost::program_options 로 argv 를 읽어 CliOptions 로
// 옮기고, 값 검증(형식 이름, 심각도, 음수 등)까지 여기서 끝낸다.
//
// [우선순위]
// 설정 파일 → 환경변수 → CLI 순서로 덮어쓰므로, CliOptions 의 optional
// 멤버는 "사용자가 명시했는가" 를 구분하기 위해 존재한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "config/lint_config.hpp"

struct CliOptions {
    std::vector<std::string>     paths{};

    std::optional<std::int64_t>  rows{};
    std::optional<OutputFormat>  format{};
    std::optional<Severity>      fail_on{};
    std::optional<std::uint32_t> jobs{};
    std::optional<std::string>   log_level{};
    std::optional<std::string>   log_file{};
    std::optional<std::string>   config_path{};

    // --disable 값들을 쉼표로 나눈 결과 (지정 순서 유지)
    std::vector<std::string>     disabled_rules{};

    bool list_rules{false};
    bool show_help{false};
    bool show_version{false};
};

// parse_cli
//   실패: 알 수 없는 옵션, 값 누락, 잘못된 숫자/이름, 경로 없음.
//   --help / --version / --list-rules 가 있으면 경로가 없어도 성공.
[[nodiscard]] std::expected<CliOptions, std::string>
parse_cli(int argc, const char* const argv[]);

// apply_cli
//   명시된 값만 cfg 에 덮어쓴다. disabled_rules 는 기존 목록 뒤에 추가.
void apply_cli(const CliOptions& opts, LintConfig& cfg);

// usage_text
//   --help 및 사용법 오류 시 stderr 에 출력할 문자열.
[[nodiscard]] std::string usage_text();
