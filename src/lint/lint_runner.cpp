// ---------------------------------------------------------------------------
// lint_runner.cpp
// ---------------------------------------------------------------------------

#include "lint/lint_runner.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include "analyzer/rule_catalog.hpp"
#include "logger/event_logger.hpp"

// ---------------------------------------------------------------------------
// 자유 함수
// ---------------------------------------------------------------------------
std::expected<std::string, std::string> read_sql_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(fmt::format("cannot open '{}'", path.string()));
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(fmt::format("read error on '{}'", path.string()));
    }
    return buffer.str();
}

bool exceeds_threshold(std::span<const FileResult> results, Severity fail_on) noexcept {
    const int threshold = severity_rank(fail_on);
    return std::any_of(results.begin(), results.end(), [threshold](const FileResult& r) {
        return std::any_of(r.findings.begin(), r.findings.end(), [threshold](const Finding& f) {
            return severity_rank(f.severity) >= threshold;
        });
    });
}

bool has_errors(std::span<const FileResult> results) noexcept {
    return std::any_of(results.begin(), results.end(),
                       [](const FileResult& r) { return r.error.has_value(); });
}

// ---------------------------------------------------------------------------
// LintRunner
// ---------------------------------------------------------------------------
LintRunner::LintRunner(const LintConfig& config, EventLogger* event_logger)
    : rows_(config.rows)
    , jobs_(config.jobs)
    , matcher_(default_rules(), config.disabled_rules)
    , event_logger_(event_logger)
{}

std::size_t LintRunner::worker_count(std::size_t file_count) const noexcept {
    std::size_t workers = jobs_ > 0 ? jobs_ : std::thread::hardware_concurrency();
    workers = std::max<std::size_t>(workers, 1);
    return std::min(workers, std::max<std::size_t>(file_count, 1));
}

std::vector<FileResult> LintRunner::run(const std::vector<std::filesystem::path>& files) {
    std::vector<FileResult> results(files.size());
    if (files.empty()) {
        return results;
    }

    const std::size_t workers = worker_count(files.size());
    spdlog::debug("lint_runner: {} file(s), {} worker(s), rows={}", files.size(), workers, rows_);

    if (workers == 1) {
        for (std::size_t i = 0; i < files.size(); ++i) {
            results[i] = lint_file(files[i]);
        }
    } else {
        // 각 작업은 자기 인덱스의 슬롯에만 쓴다. join() 이후 읽는다.
        boost::asio::thread_pool pool(workers);
        for (std::size_t i = 0; i < files.size(); ++i) {
            boost::asio::post(pool, [this, &files, &results, i] {
                // 워커 밖으로 예외가 나가면 프로세스가 종료되므로 결과 슬롯에 담는다.
                try {
                    results[i] = lint_file(files[i]);
                } catch (const std::exception& e) {
                    spdlog::error("lint_runner: '{}' failed: {}", files[i].string(), e.what());
                    stats_.on_file_failed();
                    results[i].path  = files[i].string();
                    results[i].error = e.what();
                }
            });
        }
        pool.join();
    }

    if (event_logger_ != nullptr) {
        event_logger_->flush();
    }
    return results;
}

FileResult LintRunner::lint_file(const std::filesystem::path& path) {
    auto source = read_sql_file(path);
    if (!source) {
        spdlog::error("lint_runner: {}", source.error());
        stats_.on_file_failed();
        if (event_logger_ != nullptr) {
            event_logger_->log_file_error(FileErrorLog{
                .path      = path.string(),
                .reason    = source.error(),
                .timestamp = std::chrono::system_clock::now(),
            });
        }
        FileResult failed;
        failed.path  = path.string();
        failed.error = source.error();
        return failed;
    }
    return lint_source(path.string(), *source);
}

FileResult LintRunner::lint_source(const std::string& path, std::string_view sql) {
    const auto started = std::chrono::steady_clock::now();

    FileResult result;
    result.path = path;

    for (const auto& stmt : StatementSplitter{sql}) {
        ++result.statements;
        matcher_.analyze_statement(stmt, rows_, result.findings);
    }
    result.risk_score = risk_score(result.findings);

    const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    stats_.on_file_scanned(result.statements, result.findings, result.risk_score);
    spdlog::info("lint_runner: {} statements={} findings={} risk={}",
                 path, result.statements, result.findings.size(), result.risk_score);

    if (event_logger_ != nullptr) {
        const auto now = std::chrono::system_clock::now();
        for (const auto& f : result.findings) {
            event_logger_->log_finding(FindingLog{
                .path      = path,
                .rule_id   = f.rule_id,
                .severity  = std::string(to_string(f.severity)),
                .line      = f.line,
                .lock_type = f.lock_type,
                .lock_ms   = f.lock_ms,
                .timestamp = now,
            });
        }
        event_logger_->log_file_scanned(FileScanLog{
            .path       = path,
            .statements = result.statements,
            .findings   = result.findings.size(),
            .risk_score = result.risk_score,
            .timestamp  = now,
            .duration   = duration,
        });
    }

    return result;
}
