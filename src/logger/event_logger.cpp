// ---------------------------------------------------------------------------
// event_logger.cpp
//
// spdlog 기반 구조화 JSON 이벤트 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/event_logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include "common/json_writer.hpp"

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
static std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// EventLogger 생성자
// ---------------------------------------------------------------------------
EventLogger::EventLogger(const std::filesystem::path& log_path)
    : log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        // Rotating file sink (10MB, 3개 파일 유지)
        constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;
        constexpr std::size_t kMaxFiles    = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles);

        // 레지스트리에 등록하지 않는다. 같은 프로세스에서 여러 인스턴스를 허용.
        logger_ = std::make_shared<spdlog::logger>("migsafe_events", file_sink);
        logger_->set_level(spdlog::level::info);

        // 한 줄 = JSON 객체 하나. 타임스탬프는 JSON 안에 넣는다.
        logger_->set_pattern("%v");
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Event logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Event logger initialization failed: ") + ex.what());
    }
}

EventLogger::~EventLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_file_scanned: JSON 직렬화
// ---------------------------------------------------------------------------
void EventLogger::log_file_scanned(const FileScanLog& entry) {
    JsonWriter json;
    json.begin_object()
        .key("event").value("file_scanned")
        .key("path").value(entry.path)
        .key("statements").value(static_cast<std::int64_t>(entry.statements))
        .key("findings").value(static_cast<std::int64_t>(entry.findings))
        .key("risk_score").value(std::int64_t{entry.risk_score})
        .key("timestamp").value(format_iso8601(entry.timestamp))
        .key("duration_us").value(static_cast<std::int64_t>(entry.duration.count()))
        .end_object();

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_finding: JSON 직렬화
// ---------------------------------------------------------------------------
void EventLogger::log_finding(const FindingLog& entry) {
    JsonWriter json;
    json.begin_object()
        .key("event").value("finding")
        .key("path").value(entry.path)
        .key("rule_id").value(entry.rule_id)
        .key("severity").value(entry.severity)
        .key("line").value(static_cast<std::int64_t>(entry.line))
        .key("lock_type").value(entry.lock_type)
        .key("lock_ms").value_or_null(entry.lock_ms)
        .key("timestamp").value(format_iso8601(entry.timestamp))
        .end_object();

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_file_error: JSON 직렬화
// ---------------------------------------------------------------------------
void EventLogger::log_file_error(const FileErrorLog& entry) {
    JsonWriter json;
    json.begin_object()
        .key("event").value("file_error")
        .key("path").value(entry.path)
        .key("reason").value(entry.reason)
        .key("timestamp").value(format_iso8601(entry.timestamp))
        .end_object();

    logger_->warn(json.str());
}

void EventLogger::flush() {
    logger_->flush();
}
