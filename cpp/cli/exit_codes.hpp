#pragma once
/*
================================================================================
Fragment 6.2 — CLI: Exit Codes
FILE: cpp/cli/exit_codes.hpp

Purpose:
  - Stable process exit codes for CI integration, and the single mapping from
    an escaped exception to its code and message prefix.

Mapping:
  - ValidationError, Error(kParseError) (malformed settings file or value)
      -> VALIDATION_FAILED
  - IOError                           -> IO_ERROR
  - anything else                     -> COMPUTATION_FAILED
================================================================================
*/

#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"

#include <exception>

namespace rwall::cli {

enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4,
  DESIGN_INFEASIBLE = 5
};

inline ExitCode exit_code_for(const std::exception& e) noexcept {
  if (dynamic_cast<const ValidationError*>(&e) != nullptr) return VALIDATION_FAILED;
  if (dynamic_cast<const IOError*>(&e) != nullptr) return IO_ERROR;
  if (const auto* err = dynamic_cast<const Error*>(&e)) {
    if (err->code() == ErrorCode::kParseError) return VALIDATION_FAILED;
  }
  return COMPUTATION_FAILED;
}

inline const char* exit_code_label(ExitCode c) noexcept {
  switch (c) {
    case VALIDATION_FAILED:  return "Validation FAILED";
    case IO_ERROR:           return "I/O error";
    case COMPUTATION_FAILED: return "Error";
    default:                 return "Error";
  }
}

}  // namespace rwall::cli
