// ---------------------------------------------------------------------------
// console_logger.cpp
// ---------------------------------------------------------------------------

#include "logger/console_logger.hpp"

#include <memory>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kLoggerName = "migsafe";

}  // namespace

void init_console_logger(const std::string& level) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern("%^[%l]%$ %v");
        spdlog::set_default_logger(logger);
    }

    // 알 수 없는 이름은 spdlog 가 off 로 해석하므로 warn 으로 보정한다.
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::warn;
    }
    logger->set_level(lvl);
}
