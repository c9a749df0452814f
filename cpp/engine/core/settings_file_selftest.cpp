/*
  Fragment 1.7 — Settings File Selftest

  Checks:
    1) [section] headers, comments and key = value overrides apply on top of
       the base settings; untouched fields keep their defaults.
    2) Unknown keys and malformed values fail with kParseError and name the
       offending line.
    3) Values that parse but violate validation raise ValidationError.
    4) Files round-trip through load_settings_file; a missing file is IOError.

  Non-zero return code indicates failure.
*/

#include <filesystem>
#include <fstream>
#include <string>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/settings_file.hpp"

namespace rwall {
namespace {

using namespace selftest;

const char* kSample = R"(# jurisdiction overrides
footing.min_toe_in = 8

[soil.soft]
friction_angle_deg = 26   ; clay-rich site
allowable_bearing_psf = 1200

[safety]
min_sliding = 1.75

[resistance]
include_passive = off
)";

void test_parse_overrides() {
  const DesignSettings s = parse_settings_text(kSample, DesignSettings::defaults(), "sample");
  expect_near(s.soils.soft.friction_angle_deg, 26.0, 0.0, "soft friction angle overridden");
  expect_near(s.soils.soft.allowable_bearing_psf, 1200.0, 0.0, "soft bearing overridden");
  expect_near(s.safety.min_sliding, 1.75, 0.0, "sliding minimum overridden");
  expect_true(!s.resistance.include_passive, "passive resistance switched off");
  expect_near(s.footing.min_toe_in, 8.0, 0.0, "key before any section uses its full name");
  expect_near(s.soils.stiff.friction_angle_deg, 34.0, 0.0, "stiff preset untouched");
  expect_near(s.safety.min_overturning, 1.5, 0.0, "overturning minimum untouched");
}

void test_apply_setting() {
  DesignSettings s = DesignSettings::defaults();
  apply_setting(s, " footing.min_toe_in ", " 9 ");
  expect_near(s.footing.min_toe_in, 9.0, 0.0, "whitespace around key and value trimmed");
  apply_setting(s, "search.max_sections", "2");
  expect_true(s.search.max_sections == 2, "integer setting applied");

  expect_error_code([&] { apply_setting(s, "soil.medium.unit_weight_pcf", "115"); }, ErrorCode::kParseError,
                    "unknown key rejected");
  expect_error_code([&] { apply_setting(s, "safety.min_bearing", "1.0x"); }, ErrorCode::kParseError,
                    "trailing garbage rejected");
  expect_error_code([&] { apply_setting(s, "search.max_sections", "2.5"); }, ErrorCode::kParseError,
                    "fractional integer rejected");
  expect_error_code([&] { apply_setting(s, "resistance.include_passive", "maybe"); }, ErrorCode::kParseError,
                    "bad boolean rejected");

  const auto keys = known_setting_keys();
  bool has_all = !keys.empty();
  for (const auto& k : keys) {
    DesignSettings scratch = DesignSettings::defaults();
    try {
      apply_setting(scratch, k, k == "resistance.include_passive" ? "true" : "1");
    } catch (const Error& e) {
      has_all = false;
      std::cerr << "  " << k << ": " << e.message() << "\n";
    }
  }
  expect_true(has_all, "every known key is accepted by apply_setting");
}

void test_line_errors() {
  try {
    (void)parse_settings_text("[safety]\nmin_sliding = 1.6\nmin_bearing\n", DesignSettings::defaults(), "cfg");
    fail("missing '=' accepted");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kParseError && e.message().find("cfg:3") != std::string::npos,
                "missing '=' reported with origin and line");
  }

  expect_error_code([] { (void)parse_settings_text("[safety\n", DesignSettings::defaults(), "cfg"); },
                    ErrorCode::kParseError, "unterminated section header rejected");

  expect_throws<ValidationError>(
      [] { (void)parse_settings_text("safety.min_sliding = 0.5\n", DesignSettings::defaults(), "cfg"); },
      "value outside validated range raises ValidationError");
  expect_throws<ValidationError>(
      [] { (void)parse_settings_text("soil.soft.friction_angle_deg = 36\n", DesignSettings::defaults(), "cfg"); },
      "soft soil stronger than stiff soil rejected");
}

void test_file_round_trip() {
  const std::filesystem::path path = std::filesystem::temp_directory_path() / "rwall_settings_selftest.ini";
  {
    std::ofstream out(path);
    out << kSample;
  }
  const DesignSettings s = load_settings_file(path.string());
  expect_near(s.safety.min_sliding, 1.75, 0.0, "settings file applied");
  std::error_code ec;
  std::filesystem::remove(path, ec);

  expect_throws<IOError>([] { (void)load_settings_file("/nonexistent/rwall/settings.ini"); },
                         "missing settings file raises IOError");
}

}  // namespace
}  // namespace rwall

int main() {
  using namespace rwall;
  set_log_level(LogLevel::ERROR);

  test_parse_overrides();
  test_apply_setting();
  test_line_errors();
  test_file_round_trip();

  return selftest::finish();
}
