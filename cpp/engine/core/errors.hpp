#pragma once
/*
================================================================================
Fragment 1.3 — Core: Error Categories
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Catchable-by-category exceptions for failures that originate OUTSIDE the
    engine: bad request values, bad settings, unreadable files.
  - Internal defects use rwall::Error (error.hpp) instead.
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace rwall {

class WallError : public std::runtime_error {
 public:
  explicit WallError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown by validate_or_throw() on DesignInput and the settings structs.
class ValidationError : public WallError {
 public:
  explicit ValidationError(std::string msg) : WallError(std::move(msg)) {}
};

// Thrown for settings files and report files that cannot be read or written.
class IOError : public WallError {
 public:
  explicit IOError(std::string msg) : WallError(std::move(msg)) {}
};

}  // namespace rwall
