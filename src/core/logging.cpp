/// @file src/core/logging.cpp
/// @brief Shared spdlog logger for the RCDE library.

#include "rcde/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <utility>

namespace rcde::log {

namespace {

spdlog::level::level_enum to_spdlog(Level level) noexcept {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Off:   return spdlog::level::off;
    }
    return spdlog::level::warn;
}

std::shared_ptr<spdlog::logger> make_logger() {
    auto sink   = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("rcde", std::move(sink));
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(spdlog::level::warn);
    return logger;
}

}  // anonymous namespace

spdlog::logger& logger() {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

void set_level(Level level) {
    logger().set_level(to_spdlog(level));
}

}  // namespace rcde::log
