// ---------------------------------------------------------------------------
// report_writer.cpp
//
// [text 형식 예]
//   == migrations/001_users.sql ==
//   Rule     Sev        Lock Type              Est.       Message
//   -------- ---------- ---------------------- ---------- -------
//   BAN001   critical   ACCESS EXCLUSIVE       10ms       DROP TABLE permanently ...
//     Risk score: 100/100
//
// [json/sarif]
// JsonWriter(2) 로 2칸 들여쓰기. 파일 경로는 인자로 받은 문자열 그대로 쓴다.
// 읽기 실패 파일은 json 에서 빠지고 sarif 에서는 invocations 에 남는다.
// ---------------------------------------------------------------------------

#include "report/report_writer.hpp"

#include <algorithm>
#include <format>
#include <ostream>
#include <string>

#include "common/json_writer.hpp"

namespace {

constexpr int kJsonIndent = 2;

void write_text_header(std::ostream& out) {
    out << std::format("{:<8} {:<10} {:<22} {:<10} {}\n",
                       "Rule", "Sev", "Lock Type", "Est.", "Message");
    out << std::format("{:-<8} {:-<10} {:-<22} {:-<10} {:-<7}\n", "", "", "", "", "");
}

}  // namespace

std::string_view sarif_level(Severity sev) noexcept {
    switch (sev) {
        case Severity::kCritical:
        case Severity::kHigh:
            return "error";
        case Severity::kMedium:
        case Severity::kLow:
            return "warning";
    }
    return "warning";
}

std::string format_lock_ms(const std::optional<std::int64_t>& lock_ms) {
    if (!lock_ms) {
        return "unknown";
    }
    return std::format("{}ms", *lock_ms);
}

// ---------------------------------------------------------------------------
// text
// ---------------------------------------------------------------------------
void write_text_report(std::ostream& out, std::span<const FileResult> results) {
    for (const auto& r : results) {
        if (r.error) {
            out << std::format("ERR {} - {}\n", r.path, *r.error);
            continue;
        }
        if (r.findings.empty()) {
            out << std::format("OK {} - no issues\n", r.path);
            continue;
        }

        out << std::format("== {} ==\n", r.path);
        write_text_header(out);
        for (const auto& f : r.findings) {
            out << std::format("{:<8} {:<10} {:<22} {:<10} {}\n",
                               f.rule_id, to_string(f.severity), f.lock_type,
                               format_lock_ms(f.lock_ms), f.message);
        }
        out << std::format("  Risk score: {}/100\n\n", r.risk_score);
    }
}

// ---------------------------------------------------------------------------
// json
// ---------------------------------------------------------------------------
void write_json_report(std::ostream& out, std::span<const FileResult> results) {
    JsonWriter json(kJsonIndent);
    json.begin_object();
    for (const auto& r : results) {
        if (r.error) {
            continue;
        }
        json.key(r.path).begin_array();
        for (const auto& f : r.findings) {
            json.begin_object()
                .key("rule_id").value(f.rule_id)
                .key("severity").value(to_string(f.severity))
                .key("message").value(f.message)
                .key("line").value(static_cast<std::int64_t>(f.line))
                .key("lock_type").value(f.lock_type)
                .key("lock_ms").value_or_null(f.lock_ms)
                .end_object();
        }
        json.end_array();
    }
    json.end_object();
    out << json.str() << '\n';
}

// ---------------------------------------------------------------------------
// sarif
// ---------------------------------------------------------------------------
void write_sarif_report(std::ostream& out, std::span<const FileResult> results,
                        std::span<const Rule> rules) {
    JsonWriter json(kJsonIndent);
    json.begin_object()
        .key("$schema").value(kSarifSchema)
        .key("version").value("2.1.0")
        .key("runs").begin_array()
        .begin_object();

    // tool.driver
    json.key("tool").begin_object()
        .key("driver").begin_object()
        .key("name").value(kToolName)
        .key("version").value(kToolVersion)
        .key("rules").begin_array();
    for (const auto& rule : rules) {
        json.begin_object()
            .key("id").value(rule.id)
            .key("shortDescription").begin_object()
                .key("text").value(rule.message)
            .end_object()
            .key("defaultConfiguration").begin_object()
                .key("level").value(sarif_level(rule.severity))
            .end_object()
            .key("properties").begin_object()
                .key("severity").value(to_string(rule.severity))
                .key("lockType").value(rule.lock_type)
            .end_object()
            .end_object();
    }
    json.end_array()   // rules
        .end_object()  // driver
        .end_object(); // tool

    // results
    json.key("results").begin_array();
    for (const auto& r : results) {
        for (const auto& f : r.findings) {
            json.begin_object()
                .key("ruleId").value(f.rule_id)
                .key("level").value(sarif_level(f.severity))
                .key("message").begin_object()
                    .key("text").value(f.message)
                .end_object()
                .key("locations").begin_array()
                    .begin_object()
                    .key("physicalLocation").begin_object()
                        .key("artifactLocation").begin_object()
                            .key("uri").value(r.path)
                        .end_object()
                        .key("region").begin_object()
                            .key("startLine").value(static_cast<std::int64_t>(f.line))
                        .end_object()
                    .end_object()
                    .end_object()
                .end_array()
                .end_object();
        }
    }
    json.end_array();  // results

    // invocations: 읽기 실패 파일을 실행 알림으로 남긴다
    const bool all_read = std::none_of(results.begin(), results.end(),
                                       [](const FileResult& r) { return r.error.has_value(); });
    json.key("invocations").begin_array()
        .begin_object()
        .key("executionSuccessful").bool_value(all_read)
        .key("toolExecutionNotifications").begin_array();
    for (const auto& r : results) {
        if (!r.error) {
            continue;
        }
        json.begin_object()
            .key("level").value("error")
            .key("message").begin_object()
                .key("text").value(*r.error)
            .end_object()
            .key("locations").begin_array()
                .begin_object()
                .key("physicalLocation").begin_object()
                    .key("artifactLocation").begin_object()
                        .key("uri").value(r.path)
                    .end_object()
                .end_object()
                .end_object()
            .end_array()
            .end_object();
    }
    json.end_array()   // toolExecutionNotifications
        .end_object()
        .end_array();  // invocations

    json.end_object()  // run
        .end_array()   // runs
        .end_object();
    out << json.str() << '\n';
}

void write_report(std::ostream& out, OutputFormat format,
                  std::span<const FileResult> results, std::span<const Rule> rules) {
    switch (format) {
        case OutputFormat::kJson:
            write_json_report(out, results);
            return;
        case OutputFormat::kSarif:
            write_sarif_report(out, results, rules);
            return;
        case OutputFormat::kText:
            write_text_report(out, results);
            return;
    }
}

// ---------------------------------------------------------------------------
// --list-rules
// ---------------------------------------------------------------------------
void write_rule_list(std::ostream& out, std::span<const Rule> rules) {
    out << std::format("{:<8} {:<10} {:<22} {:<10} {}\n",
                       "Rule", "Sev", "Lock Type", "Base", "Message");
    for (const auto& rule : rules) {
        out << std::format("{:<8} {:<10} {:<22} {:<10} {}\n",
                           rule.id, to_string(rule.severity), rule.lock_type,
                           format_lock_ms(rule.base_lock_ms), rule.message);
    }
}
