// ---------------------------------------------------------------------------
// config_loader.cpp
//
// .migsafe.yaml 예시:
//
//   rows: 5000000
//   format: sarif
//   fail_on: critical
//   disabled_rules: [BAN003]
//   jobs: 4
//   log_level: info
//   log_path: /var/log/migsafe/events.log
//
// [설계 원칙]
// - All-or-nothing: 한 키라도 값이 잘못되면 std::unexpected 를 반환한다.
//   CI 에서 fail_on 오타가 조용히 기본값으로 바뀌면 게이트가 느슨해진다.
// - 알 수 없는 키는 경고만 하고 무시한다 (상위 버전 설정 파일 호환).
// - 환경변수는 CI 러너에서 주입되므로 잘못된 값이어도 실행은 계속한다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

constexpr std::array<std::string_view, 7> kKnownKeys = {
    "rows", "format", "fail_on", "disabled_rules", "jobs", "log_level", "log_path",
};

constexpr std::array<std::string_view, 9> kLogLevels = {
    "trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off",
};

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 스칼라 하나만 있으면 원소 하나짜리 목록으로 본다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || node.IsNull()) {
        return result;
    }
    if (node.IsScalar()) {
        result.push_back(node.as<std::string>());
        return result;
    }
    if (!node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

// 문자열 전체가 음이 아닌 정수인지 확인하고 변환한다.
template <typename T>
[[nodiscard]] std::optional<T> parse_non_negative(std::string_view raw) {
    T value{};
    const char* begin = raw.data();
    const char* end   = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    if constexpr (std::is_signed_v<T>) {
        if (value < 0) {
            return std::nullopt;
        }
    }
    return value;
}

// 환경변수 읽기. 없거나 빈 값이면 std::nullopt.
[[nodiscard]] std::optional<std::string> env_str(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return std::nullopt;
    }
    return std::string(val);
}

// 실패는 여기서 한 번만 로그로 남긴다. 호출자는 다시 로그를 쓰지 않는다.
[[nodiscard]] std::unexpected<std::string> fail(std::string err) {
    spdlog::error("{}", err);
    return std::unexpected(std::move(err));
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<LintConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path, LintConfig base) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        return fail(fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        ));
    }

    spdlog::debug("config_loader: loading config from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        return fail(fmt::format(
            "config_loader: cannot open file '{}': {}", canonical_path.string(), e.what()
        ));
    } catch (const YAML::ParserException& e) {
        return fail(fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        ));
    } catch (const YAML::Exception& e) {
        return fail(fmt::format(
            "config_loader: YAML error in '{}': {}", canonical_path.string(), e.what()
        ));
    }

    // 빈 파일은 "덮어쓸 키 없음" 으로 본다.
    if (!root || root.IsNull()) {
        return base;
    }
    if (!root.IsMap()) {
        return fail(fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)", canonical_path.string()
        ));
    }

    LintConfig cfg = std::move(base);

    try {
        for (const auto& kv : root) {
            const auto key = kv.first.as<std::string>();
            if (std::find(kKnownKeys.begin(), kKnownKeys.end(), key) == kKnownKeys.end()) {
                spdlog::warn("config_loader: unknown key '{}' ignored", key);
            }
        }

        if (const auto node = root["rows"]; node && !node.IsNull()) {
            const auto raw  = node.as<std::string>();
            const auto rows = parse_non_negative<std::int64_t>(raw);
            if (!rows) {
                return fail(fmt::format(
                    "config_loader: 'rows' must be a non-negative integer, got '{}'", raw));
            }
            cfg.rows = *rows;
        }

        if (const auto node = root["format"]; node && !node.IsNull()) {
            const auto raw    = node.as<std::string>();
            const auto format = parse_output_format(raw);
            if (!format) {
                return fail(fmt::format(
                    "config_loader: 'format' must be text, json or sarif, got '{}'", raw));
            }
            cfg.format = *format;
        }

        if (const auto node = root["fail_on"]; node && !node.IsNull()) {
            const auto raw = node.as<std::string>();
            const auto sev = parse_severity(raw);
            if (!sev) {
                return fail(fmt::format(
                    "config_loader: 'fail_on' must be low, medium, high or critical, got '{}'",
                    raw));
            }
            cfg.fail_on = *sev;
        }

        if (root["disabled_rules"]) {
            cfg.disabled_rules = read_string_sequence(root["disabled_rules"]);
        }

        if (const auto node = root["jobs"]; node && !node.IsNull()) {
            const auto raw  = node.as<std::string>();
            const auto jobs = parse_non_negative<std::uint32_t>(raw);
            if (!jobs) {
                return fail(fmt::format(
                    "config_loader: 'jobs' must be a non-negative integer, got '{}'", raw));
            }
            cfg.jobs = *jobs;
        }

        if (const auto node = root["log_level"]; node && !node.IsNull()) {
            const auto raw = node.as<std::string>();
            if (!is_valid_log_level(raw)) {
                return fail(fmt::format(
                    "config_loader: 'log_level' is not a valid level: '{}'", raw));
            }
            cfg.log_level = raw;
        }

        if (const auto node = root["log_path"]; node && !node.IsNull()) {
            cfg.log_path = node.as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return fail(fmt::format(
            "config_loader: error reading '{}': {}", canonical_path.string(), e.what()
        ));
    }

    spdlog::debug(
        "config_loader: config loaded: rows={}, format={}, fail_on={}, disabled_rules={}",
        cfg.rows, to_string(cfg.format), to_string(cfg.fail_on), cfg.disabled_rules.size()
    );

    return cfg;
}

// ---------------------------------------------------------------------------
// ConfigLoader::load_for_run 구현
// ---------------------------------------------------------------------------
std::expected<LintConfig, std::string>
ConfigLoader::load_for_run(const std::optional<std::filesystem::path>& explicit_path,
                           LintConfig base) {
    if (explicit_path) {
        return load(*explicit_path, std::move(base));
    }

    std::error_code ec;
    if (!std::filesystem::exists(kDefaultConfigFile, ec)) {
        spdlog::debug("config_loader: no {} in working directory, using defaults",
                      kDefaultConfigFile);
        return base;
    }
    return load(kDefaultConfigFile, std::move(base));
}

// ---------------------------------------------------------------------------
// ConfigLoader::apply_env 구현
// ---------------------------------------------------------------------------
void ConfigLoader::apply_env(LintConfig& cfg) {
    if (const auto val = env_str("MIGSAFE_ROWS")) {
        if (const auto rows = parse_non_negative<std::int64_t>(*val)) {
            cfg.rows = *rows;
        } else {
            spdlog::warn("env MIGSAFE_ROWS: invalid value '{}', using {}", *val, cfg.rows);
        }
    }

    if (const auto val = env_str("MIGSAFE_FORMAT")) {
        if (const auto format = parse_output_format(*val)) {
            cfg.format = *format;
        } else {
            spdlog::warn("env MIGSAFE_FORMAT: invalid value '{}', using {}",
                         *val, to_string(cfg.format));
        }
    }

    if (const auto val = env_str("MIGSAFE_FAIL_ON")) {
        if (const auto sev = parse_severity(*val)) {
            cfg.fail_on = *sev;
        } else {
            spdlog::warn("env MIGSAFE_FAIL_ON: invalid value '{}', using {}",
                         *val, to_string(cfg.fail_on));
        }
    }

    if (const auto val = env_str("MIGSAFE_LOG_LEVEL")) {
        if (is_valid_log_level(*val)) {
            cfg.log_level = *val;
        } else {
            spdlog::warn("env MIGSAFE_LOG_LEVEL: invalid value '{}', using {}",
                         *val, cfg.log_level);
        }
    }

    if (const auto val = env_str("MIGSAFE_LOG_PATH")) {
        cfg.log_path = *val;
    }
}

bool ConfigLoader::is_valid_log_level(const std::string& level) {
    return std::find(kLogLevels.begin(), kLogLevels.end(), level) != kLogLevels.end();
}
