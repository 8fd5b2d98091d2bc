#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일과 환경변수를 LintConfig 로 읽어들인다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 부분적으로 읽은
//   설정을 돌려주지 않는다. 실패 원인은 load() 가 error 로그로 한 번 남긴다.
// - 환경변수 값이 잘못되면 경고 로그 후 기존 값을 유지한다 (실패 아님).
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include "lint_config.hpp"

class ConfigLoader {
public:
    // load
    //   config_path 의 YAML 을 base 위에 덮어써서 반환한다.
    //   없는 키는 base 값을 유지한다.
    //
    //   실패: 파일 없음/읽기 불가, YAML 문법 오류, 최상위가 map 아님,
    //         format/fail_on 값이 허용 목록 밖, rows/jobs 가 음수 또는 비숫자.
    [[nodiscard]] static std::expected<LintConfig, std::string>
    load(const std::filesystem::path& config_path, LintConfig base = {});

    // load_for_run
    //   explicit_path 가 있으면 그 파일을, 없으면 현재 디렉터리의
    //   .migsafe.yaml 을 읽는다. 둘 다 없으면 base 를 그대로 돌려준다.
    [[nodiscard]] static std::expected<LintConfig, std::string>
    load_for_run(const std::optional<std::filesystem::path>& explicit_path,
                 LintConfig base = {});

    // apply_env
    //   MIGSAFE_ROWS, MIGSAFE_FORMAT, MIGSAFE_FAIL_ON, MIGSAFE_LOG_LEVEL,
    //   MIGSAFE_LOG_PATH 를 읽어 cfg 에 덮어쓴다.
    static void apply_env(LintConfig& cfg);

    // is_valid_log_level
    //   spdlog 레벨 이름인지 확인한다.
    [[nodiscard]] static bool is_valid_log_level(const std::string& level);
};
