#pragma once

// ---------------------------------------------------------------------------
// console_logger.hpp
//
// 진단 로그를 stderr 로 보내도록 spdlog 기본 로거를 교체한다.
// stdout 은 리포트(text/json/sarif) 전용이다. JSON 출력을 파이프로 넘길 때
// 로그가 섞이면 안 된다.
// ---------------------------------------------------------------------------

#include <string>

// init_console_logger
//   기본 로거를 stderr 컬러 싱크로 바꾸고 level 을 적용한다.
//   여러 번 호출해도 된다 (마지막 호출의 레벨이 적용됨).
void init_console_logger(const std::string& level);
