#pragma once
/*
================================================================================
Fragment 1.9 — Core: Selftest Helpers
FILE: cpp/engine/core/selftest.hpp

Purpose:
  - Shared helpers for the framework-free selftest executables
    (one per module, e.g. loads/load_model_selftest.cpp).
  - Each selftest prints [ OK ] / [FAIL] lines to stderr and returns
    selftest::finish(): non-zero when anything failed.
================================================================================
*/

#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/core/error.hpp"

namespace rwall::selftest {

inline int g_fail_count = 0;

inline void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

// Passes iff fn throws rwall::Error with the given code. Any other exception
// is recorded as a failure.
template <class Fn>
void expect_error_code(Fn&& fn, ErrorCode code, std::string_view msg) {
  try {
    fn();
  } catch (const Error& e) {
    if (e.code() == code) {
      pass(msg);
    } else {
      fail(msg);
      std::cerr << "  got: " << to_string(e.code()) << "\n";
    }
    return;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  got: " << e.what() << "\n";
    return;
  }
  fail(msg);
  std::cerr << "  no exception\n";
}

// Passes iff fn throws an exception of type E.
template <class E, class Fn>
void expect_throws(Fn&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const E&) {
    pass(msg);
    return;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  got: " << e.what() << "\n";
    return;
  }
  fail(msg);
  std::cerr << "  no exception\n";
}

inline int finish() {
  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}

}  // namespace rwall::selftest
