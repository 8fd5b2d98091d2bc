#pragma once

// ---------------------------------------------------------------------------
// event_logger.hpp
//
// spdlog 기반 구조화 JSON 이벤트 로거.
// CI 가 린트 결과를 로그 수집기로 보낼 때 사용한다. 한 줄에 JSON 객체 하나.
//
// [설계 원칙]
// - 싱글턴 금지: 필요한 곳에 참조로 주입한다.
// - stdout 은 리포트 전용이므로 이 로거는 파일 싱크만 가진다.
// - 진단 메시지(사람이 읽는 로그)는 console_logger 의 stderr 로거를 쓴다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>

namespace spdlog {
class logger;
}

class EventLogger {
public:
    // log_path: 로그 파일 경로. 상위 디렉터리가 없으면 만든다.
    // 초기화 실패 시 std::runtime_error 를 던진다.
    explicit EventLogger(const std::filesystem::path& log_path);

    ~EventLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    EventLogger(const EventLogger&)            = delete;
    EventLogger& operator=(const EventLogger&) = delete;

    void log_file_scanned(const FileScanLog& entry);
    void log_finding(const FindingLog& entry);
    void log_file_error(const FileErrorLog& entry);

    void flush();

private:
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
