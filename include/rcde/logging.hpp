#pragma once

/// @file include/rcde/logging.hpp
/// @brief Process-wide diagnostic logger for the RCDE library.
///
/// One spdlog logger named "rcde" writes to stderr. It is created on first
/// use and is safe to call from concurrent design() invocations. The default
/// threshold is `warn`, so only numeric-degeneracy clamps and skipped input
/// rows are reported unless the caller lowers it.

#include <spdlog/spdlog.h>

namespace rcde::log {

enum class Level {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

/// The shared "rcde" logger.
[[nodiscard]] spdlog::logger& logger();

/// Change the threshold of the shared logger.
void set_level(Level level);

}  // namespace rcde::log
