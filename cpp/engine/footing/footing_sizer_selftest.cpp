/*
  Fragment 2.7 — Footing Sizer Selftest

  Checks:
    1) Thickness rule: max(min_thickness, ceil(cover + ratio * H)).
    2) The user toe is a lower bound, rounded up to whole inches.
    3) The sized heel is the smallest whole inch that puts the resultant in
       the middle third.
    4) Bearing-governed walls get a longer toe and end under the ceiling.
    5) One deterministic footing per call.
    6) The thickness range runs from the rule at this height to the rule at
       the tallest wall; sizing at an explicit thickness keeps it.

  Non-zero return code indicates failure.
*/

#include <cmath>

#include "engine/core/design_input.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/footing/footing_sizer.hpp"
#include "engine/loads/load_model.hpp"
#include "engine/sections/section_builder.hpp"
#include "engine/stability/wall_statics.hpp"

namespace rwall {
namespace {

using namespace selftest;

struct Setup {
  DesignSettings settings = DesignSettings::defaults();
  DesignInput input;
  LoadCase lc;
  SectionStack sections;
};

Setup make(double height_in, SoilStiffness soil = SoilStiffness::Stiff) {
  Setup s;
  s.input.height_in = height_in;
  s.input.soil = soil;
  s.lc = derive_load_case(s.input, s.settings);
  SectionPartition p;
  p.width_step_in = s.settings.search.min_width_step_in;
  s.sections = propose_sections(height_in, s.input.material, s.settings.search.max_sections, p, s.settings);
  return s;
}

void test_thickness_rule() {
  const FootingRules r;
  expect_near(footing_thickness_in(24.0, r), 10.0, 0.0, "24 in wall -> 10 in minimum");
  expect_near(footing_thickness_in(48.0, r), 10.0, 0.0, "48 in wall -> 10 in minimum");
  expect_near(footing_thickness_in(120.0, r), 11.0, 0.0, "120 in wall -> ceil(3 + 7.2) = 11 in");
  expect_near(footing_thickness_in(144.0, r), 12.0, 0.0, "144 in wall -> ceil(3 + 8.64) = 12 in");

  FootingRules thin;
  thin.min_thickness_in = 6.0;
  expect_near(footing_thickness_in(48.0, thin), 6.0, 0.0, "cover rule governs above a lower minimum");
}

void test_thickness_range() {
  const FootingRules r;
  const ThicknessRange low = footing_thickness_range(24.0, r);
  expect_near(low.min_in, 10.0, 0.0, "24 in wall range starts at the rule");
  expect_near(low.max_in, 12.0, 0.0, "range ends at the 144 in rule");
  const ThicknessRange top = footing_thickness_range(kMaxWallHeightIn, r);
  expect_true(top.min_in == 12.0 && top.max_in == 12.0, "tallest wall has a single thickness");
  expect_near(footing_thickness_range(120.0, r).min_in, 11.0, 0.0, "120 in wall range starts at 11 in");

  FootingRules thick;
  thick.min_thickness_in = 14.0;
  const ThicknessRange flat = footing_thickness_range(48.0, thick);
  expect_true(flat.min_in == 14.0 && flat.max_in == 14.0, "minimum above the rule collapses the range");

  const Setup s = make(48.0);
  const Footing f = size_footing(s.sections, s.lc, 0.0, 12.0, s.settings);
  expect_near(f.thickness_in, 12.0, 0.0, "explicit thickness kept");
  expect_near(f.toe_in, 6.0, 0.0, "explicit thickness keeps the toe floor");
  expect_near(footing_min_toe_in(7.5, s.settings.footing), 8.0, 0.0, "toe floor rounds the request up");
  expect_error_code([&] { (void)size_footing(s.sections, s.lc, 0.0, 0.0, s.settings); },
                    ErrorCode::kContractViolation, "zero thickness is a contract violation");
}

void test_toe_lower_bound() {
  const Setup s = make(48.0);
  expect_near(size_footing(s.sections, s.lc, 0.0, s.settings).toe_in, 6.0, 0.0, "rules minimum toe applies");
  expect_near(size_footing(s.sections, s.lc, 12.0, s.settings).toe_in, 12.0, 0.0, "user toe honored");
  expect_near(size_footing(s.sections, s.lc, 7.5, s.settings).toe_in, 8.0, 0.0, "user toe rounded up");
}

void test_middle_third_heel() {
  const Setup s = make(48.0);
  const Footing f = size_footing(s.sections, s.lc, 0.0, s.settings);
  expect_near(f.heel_in, 7.0, 0.0, "48 in stiff flat wall sizes a 7 in heel");
  expect_true(f.heel_in == std::floor(f.heel_in), "heel is whole inches");

  const WallStatics at = compute_wall_statics(s.sections, f, s.lc, s.settings.resistance);
  expect_true(at.resultant_in_middle_third, "resultant inside the middle third at the sized heel");

  Footing shorter = f;
  shorter.heel_in -= 1.0;
  const WallStatics below = compute_wall_statics(s.sections, shorter, s.lc, s.settings.resistance);
  expect_true(!below.resultant_in_middle_third, "one inch less heel leaves the middle third");

  const Setup low = make(24.0);
  expect_near(size_footing(low.sections, low.lc, 0.0, low.settings).heel_in, 0.0, 0.0,
              "24 in wall needs no heel for the middle third");
}

void test_bearing_ceiling() {
  const Setup s = make(96.0);
  const Footing f = size_footing(s.sections, s.lc, 0.0, s.settings);
  expect_true(f.toe_in > s.settings.footing.min_toe_in, "bearing-governed 96 in wall extends the toe");
  const WallStatics st = compute_wall_statics(s.sections, f, s.lc, s.settings.resistance);
  expect_true(st.max_bearing_psf <= s.lc.allowable_bearing_psf, "toe pressure within the allowable after extension");
}

void test_determinism_and_contract() {
  const Setup s = make(72.0, SoilStiffness::Soft);
  const Footing a = size_footing(s.sections, s.lc, 3.0, s.settings);
  const Footing b = size_footing(s.sections, s.lc, 3.0, s.settings);
  expect_true(a == b, "same inputs -> same footing");

  expect_error_code([&] { (void)size_footing(s.sections, s.lc, -1.0, s.settings); }, ErrorCode::kContractViolation,
                    "negative minimum toe is a contract violation");
}

}  // namespace
}  // namespace rwall

int main() {
  using namespace rwall;
  set_log_level(LogLevel::ERROR);

  test_thickness_rule();
  test_thickness_range();
  test_toe_lower_bound();
  test_middle_third_heel();
  test_bearing_ceiling();
  test_determinism_and_contract();

  return selftest::finish();
}
