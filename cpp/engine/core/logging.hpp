#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by every engine module.
  - Each line carries a component tag ("loads", "optimizer", ...) so a
    design run can be followed from load derivation to the final verdict.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe: concurrent design runs share only this sink.
  - WARN/ERROR go to stderr, everything else to stdout.
===========================================================
*/

#include <string>
#include <string_view>

namespace rwall {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, OFF = 4 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

LogLevel get_log_level() noexcept;

// Accepts "debug", "info", "warn", "error", "off" (case-insensitive).
// Returns false and leaves `out` untouched on anything else.
bool parse_log_level(std::string_view text, LogLevel& out) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept;

inline void log_debug(std::string_view component, const std::string& msg) noexcept {
  log(LogLevel::DEBUG, component, msg);
}
inline void log_info(std::string_view component, const std::string& msg) noexcept {
  log(LogLevel::INFO, component, msg);
}
inline void log_warn(std::string_view component, const std::string& msg) noexcept {
  log(LogLevel::WARN, component, msg);
}

// True when a message at `lvl` would be emitted. Lets callers skip building
// expensive DEBUG strings inside the search loop.
bool log_enabled(LogLevel lvl) noexcept;

} // namespace rwall
