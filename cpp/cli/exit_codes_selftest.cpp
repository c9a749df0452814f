/*
  Fragment 6.2 — CLI Exit Code Selftest

  Checks:
    1) A malformed settings file maps to VALIDATION_FAILED, not
       COMPUTATION_FAILED.
    2) Out-of-range settings and inputs map to VALIDATION_FAILED.
    3) IOError maps to IO_ERROR; internal errors to COMPUTATION_FAILED.

  Non-zero return code indicates failure.
*/

#include <stdexcept>
#include <string>

#include "cli/exit_codes.hpp"
#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings_file.hpp"

namespace rwall {
namespace {

using namespace selftest;

// Runs fn and returns the exit code its exception maps to (SUCCESS if none).
template <class Fn>
cli::ExitCode code_of(Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    return cli::exit_code_for(e);
  }
  return cli::SUCCESS;
}

void test_settings_errors() {
  const DesignSettings base = DesignSettings::defaults();

  expect_true(code_of([&] { parse_settings_text("safety.min_sliding = abc\n", base, "bad.ini"); }) ==
                  cli::VALIDATION_FAILED,
              "non-numeric settings value exits with VALIDATION_FAILED");
  expect_true(code_of([&] { parse_settings_text("[safety]\nmin_slidng = 1.6\n", base, "bad.ini"); }) ==
                  cli::VALIDATION_FAILED,
              "unknown settings key exits with VALIDATION_FAILED");
  expect_true(code_of([&] { parse_settings_text("[safety\n", base, "bad.ini"); }) == cli::VALIDATION_FAILED,
              "unterminated section header exits with VALIDATION_FAILED");
  expect_true(code_of([&] { parse_settings_text("safety.min_sliding = 0.5\n", base, "bad.ini"); }) ==
                  cli::VALIDATION_FAILED,
              "out-of-range settings value exits with VALIDATION_FAILED");
  expect_true(code_of([&] { load_settings_file("/nonexistent/rwall/settings.ini"); }) == cli::IO_ERROR,
              "missing settings file exits with IO_ERROR");
}

void test_input_and_internal_errors() {
  DesignInput in;
  in.height_in = 200.0;
  expect_true(code_of([&] { in.validate_or_throw(); }) == cli::VALIDATION_FAILED,
              "out-of-range height exits with VALIDATION_FAILED");

  expect_true(code_of([] { RWALL_THROW(ErrorCode::kInvariant, "broken"); }) == cli::COMPUTATION_FAILED,
              "invariant violation exits with COMPUTATION_FAILED");
  expect_true(code_of([] { throw std::runtime_error("other"); }) == cli::COMPUTATION_FAILED,
              "unclassified exception exits with COMPUTATION_FAILED");
  expect_true(code_of([] {}) == cli::SUCCESS, "no exception maps to SUCCESS");

  expect_eq_str(cli::exit_code_label(cli::VALIDATION_FAILED), "Validation FAILED", "validation label");
}

}  // namespace
}  // namespace rwall

int main() {
  using namespace rwall;
  set_log_level(LogLevel::OFF);

  test_settings_errors();
  test_input_and_internal_errors();

  return selftest::finish();
}
