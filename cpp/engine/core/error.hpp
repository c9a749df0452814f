#pragma once
/*
================================================================================
Fragment 1.2 — Core: Error Codes + Contract Exception
FILE: cpp/engine/core/error.hpp

Purpose:
  - One exception type for internal defects (contract violations, broken
    invariants, unparseable configuration).
  - Carries a stable ErrorCode plus file/line/function so a failing run can be
    traced back to the exact check that fired.

Notes:
  - Design infeasibility is NOT an error. It is reported through DesignOutcome.
  - User/config range checks throw ValidationError (errors.hpp) instead.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace rwall {

enum class ErrorCode : int {
  kInvalidArgument   = 1,
  kParseError        = 2,
  kInvariant         = 3,
  kContractViolation = 4,
  kInternal          = 5,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidArgument:   return "InvalidArgument";
    case ErrorCode::kParseError:        return "ParseError";
    case ErrorCode::kInvariant:         return "Invariant";
    case ErrorCode::kContractViolation: return "ContractViolation";
    case ErrorCode::kInternal:          return "Internal";
    default:                            return "Unknown";
  }
}

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code,
        std::string message,
        const char* file,
        int line,
        const char* function)
      : std::runtime_error(build_what(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        file_(file ? file : ""),
        function_(function ? function : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return file_; }
  const std::string& function() const noexcept { return function_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "[rwall::Error " << to_string(code) << "(" << static_cast<int>(code) << ")] " << msg;
    if (file && *file) {
      oss << " @ " << file << ":" << line;
      if (func && *func) oss << " (" << func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  std::string file_;
  std::string function_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                     std::string message,
                                     const char* file,
                                     int line,
                                     const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

inline void ensure(bool ok,
                   ErrorCode code,
                   std::string message,
                   const char* file,
                   int line,
                   const char* function) {
  if (!ok) {
    throw_error(code, std::move(message), file, line, function);
  }
}

}  // namespace rwall

#define RWALL_THROW(CODE, MSG) ::rwall::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define RWALL_ENSURE(EXPR, CODE, MSG) ::rwall::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)
