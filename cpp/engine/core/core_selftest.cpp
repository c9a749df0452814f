/*
  Fragment 1.8 — Core Selftest

  Checks:
    1) Enum parsing accepts the documented spellings and rejects the rest.
    2) DesignInput::validate_or_throw enforces the published ranges.
    3) FNV-1a matches the reference vectors and canonicalizes -0.0 / NaN.
    4) Log level parsing and Error formatting.
    5) Default settings validate; inconsistent ones do not.
    6) The expect helpers record a foreign exception as a failure and keep
       running.

  Non-zero return code indicates failure.
*/

#include <limits>
#include <string>

#include "engine/core/design_input.hpp"
#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/units.hpp"

namespace rwall {
namespace {

using namespace selftest;

void test_enum_parsing() {
  expect_true(parse_material("Concrete") == Material::Concrete, "material: Concrete");
  expect_true(parse_material("block") == Material::CMU, "material: block -> CMU");
  expect_true(parse_surcharge("FLAT") == Surcharge::Flat, "surcharge: case-insensitive flat");
  expect_true(parse_surcharge("1:1") == Surcharge::Slope1_1, "surcharge: 1:1");
  expect_true(parse_surcharge("1:2") == Surcharge::Slope1_2 && parse_surcharge("2:1") == Surcharge::Slope1_2,
              "surcharge: 1:2 and its H:V spelling");
  expect_true(parse_surcharge("Slope1_4") == Surcharge::Slope1_4, "surcharge: enum spelling");
  expect_true(parse_objective("footing") == OptimizationObjective::MinimizeFooting, "objective: footing");
  expect_true(parse_soil("Soft") == SoilStiffness::Soft, "soil: Soft");

  expect_error_code([] { (void)parse_material("steel"); }, ErrorCode::kParseError, "material: unknown rejected");
  expect_error_code([] { (void)parse_surcharge("3:1"); }, ErrorCode::kParseError, "surcharge: unknown rejected");
  expect_error_code([] { (void)parse_surcharge("slab"); }, ErrorCode::kParseError,
                    "surcharge: slab is a separate flag, not a slope");
  expect_error_code([] { (void)parse_soil(""); }, ErrorCode::kParseError, "soil: empty rejected");

  expect_eq_str(to_string(Surcharge::Slope1_2), "Slope1_2", "to_string round trip");
}

void test_input_validation() {
  DesignInput in;
  expect_true([&] {
    try {
      in.validate_or_throw();
      return true;
    } catch (const ValidationError&) {
      return false;
    }
  }(), "default input is valid");

  in.height_in = 23.9;
  expect_throws<ValidationError>([&] { in.validate_or_throw(); }, "height below 24 rejected");
  in.height_in = 144.0;
  in.topping_depth_in = 24.5;
  expect_throws<ValidationError>([&] { in.validate_or_throw(); }, "topping above 24 rejected");
  in.topping_depth_in = 0.0;
  in.toe_length_in = 121.0;
  expect_throws<ValidationError>([&] { in.validate_or_throw(); }, "toe above 120 rejected");
  in.toe_length_in = std::numeric_limits<double>::quiet_NaN();
  expect_throws<ValidationError>([&] { in.validate_or_throw(); }, "NaN toe rejected");
  in.toe_length_in = 0.0;
  in.surcharge = static_cast<Surcharge>(9);
  expect_throws<ValidationError>([&] { in.validate_or_throw(); }, "surcharge outside the enum rejected");
}

void test_hashing() {
  Fnv1a64 empty;
  expect_eq_str(hash_to_hex(Hash64{empty.value()}), "cbf29ce484222325", "FNV-1a offset basis");

  Fnv1a64 a;
  a.update_bytes("a", 1);
  expect_eq_str(hash_to_hex(Hash64{a.value()}), "af63dc4c8601ec8c", "FNV-1a reference vector 'a'");

  Fnv1a64 pz, nz;
  pz.update_f64(0.0);
  nz.update_f64(-0.0);
  expect_true(pz.value() == nz.value(), "-0.0 hashes like 0.0");

  Fnv1a64 n1, n2;
  n1.update_f64(std::numeric_limits<double>::quiet_NaN());
  n2.update_f64(-std::numeric_limits<double>::quiet_NaN());
  expect_true(n1.value() == n2.value(), "NaN payloads canonicalized");

  Fnv1a64 t1, t2;
  t1.update_tag("ab");
  t1.update_tag("c");
  t2.update_tag("a");
  t2.update_tag("bc");
  expect_true(t1.value() != t2.value(), "tags are length-prefixed");
}

void test_logging_and_errors() {
  LogLevel lvl = LogLevel::INFO;
  expect_true(parse_log_level("debug", lvl) && lvl == LogLevel::DEBUG, "log level: debug");
  expect_true(parse_log_level("WARN", lvl) && lvl == LogLevel::WARN, "log level: WARN");
  expect_true(!parse_log_level("verbose", lvl) && lvl == LogLevel::WARN, "log level: unknown leaves value");

  const LogLevel before = get_log_level();
  set_log_level(LogLevel::OFF);
  expect_true(!log_enabled(LogLevel::ERROR), "OFF disables every level");
  set_log_level(before);

  try {
    RWALL_THROW(ErrorCode::kInvariant, "boom");
  } catch (const Error& e) {
    const std::string what = e.what();
    expect_true(e.code() == ErrorCode::kInvariant && e.message() == "boom" && e.line() > 0,
                "Error carries code, message and line");
    expect_true(what.find("Invariant") != std::string::npos && what.find("core_selftest.cpp") != std::string::npos,
                "Error::what names the code and file");
  }

  const ErrorCode codes[] = {ErrorCode::kInvalidArgument, ErrorCode::kParseError, ErrorCode::kInvariant,
                             ErrorCode::kContractViolation, ErrorCode::kInternal};
  int expected = 1;
  bool dense = true;
  for (ErrorCode c : codes) {
    if (static_cast<int>(c) != expected++ || std::string(to_string(c)) == "Unknown") dense = false;
  }
  expect_true(dense, "error codes are 1..5 and each has a name");
}

void test_settings() {
  expect_true([] {
    try {
      DesignSettings::defaults().validate_or_throw();
      return true;
    } catch (const ValidationError&) {
      return false;
    }
  }(), "default settings validate");

  DesignSettings s = DesignSettings::defaults();
  s.search.min_width_step_in = 4.0;  // 8 + 4 * 3 > 16 for CMU
  expect_throws<ValidationError>([&] { s.validate_or_throw(); }, "seed step wider than CMU span rejected");

  const MaterialSettings m;
  expect_near(m.unit_weight_pcf(Material::CMU), 130.0, 0.0, "CMU unit weight");
  expect_near(units::ceil_inch(7.0000000001), 7.0, 0.0, "ceil_inch absorbs float noise");
  expect_near(units::ceil_inch(7.01), 8.0, 0.0, "ceil_inch rounds up real fractions");
}

// A wrong exception type must count as one failure, not escape the test.
void test_expect_helpers() {
  const int before = g_fail_count;
  expect_error_code([] { throw ValidationError("wrong category"); }, ErrorCode::kParseError,
                    "ValidationError is not an Error (expected failure)");
  expect_throws<IOError>([] { RWALL_THROW(ErrorCode::kInternal, "wrong type"); },
                         "Error is not an IOError (expected failure)");
  const int recorded = g_fail_count - before;
  g_fail_count = before;
  expect_true(recorded == 2, "foreign exceptions are recorded as failures");
}

}  // namespace
}  // namespace rwall

int main() {
  using namespace rwall;
  set_log_level(LogLevel::ERROR);

  test_enum_parsing();
  test_input_validation();
  test_hashing();
  test_logging_and_errors();
  test_settings();
  test_expect_helpers();

  return selftest::finish();
}
