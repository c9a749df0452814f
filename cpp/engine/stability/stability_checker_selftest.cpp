/*
  Fragment 2.6 — Stability Checker Selftest

  Hand-checked wall (per foot of length):
    stem 48 x 12 in, footing toe 12 / heel 24 / thickness 12 in -> B = 4 ft,
    Hb = 5 ft, Ka = 0.3, Kp = 3, gamma = 120 pcf, concrete 150 pcf.
      stem      600 lb @ 1.5 ft   footing 600 lb @ 2 ft   heel soil 960 lb @ 3 ft
      N = 2160 lb, M_r = 4980 ft-lb
      P = 0.5 * 0.3 * 120 * 25 = 450 lb @ 5/3 ft -> M_o = 750 ft-lb
      passive = 0.5 * 3 * 120 * 1 = 180 lb
      x_bar = 4230 / 2160, e = 1/24 ft -> q_max = 573.75 psf

  Non-zero return code indicates failure.
*/

#include <cmath>

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/stability/stability_checker.hpp"

namespace rwall {
namespace {

using namespace selftest;

LoadCase hand_load_case() {
  LoadCase lc;
  lc.active_earth_pressure_coefficient = 0.3;
  lc.passive_earth_pressure_coefficient = 3.0;
  lc.effective_soil_unit_weight_pcf = 120.0;
  lc.friction_angle_deg = 30.0;
  lc.base_friction_coefficient = 0.5;
  lc.allowable_bearing_psf = 2000.0;
  lc.stem_unit_weight_pcf = 150.0;
  lc.footing_unit_weight_pcf = 150.0;
  lc.retained_height_in = 48.0;
  return lc;
}

const SectionStack kStem = {{48.0, 12.0}};

Footing make_footing(double toe, double heel, double t) {
  Footing f;
  f.toe_in = toe;
  f.heel_in = heel;
  f.thickness_in = t;
  return f;
}

void test_hand_checked_wall() {
  const DesignSettings st = DesignSettings::defaults();
  const StabilityResult r = evaluate_stability(kStem, make_footing(12.0, 24.0, 12.0), hand_load_case(), st);

  expect_near(r.statics.dead_load_lb, 2160.0, 1e-9, "dead load");
  expect_near(r.statics.resisting_moment_ftlb, 4980.0, 1e-9, "resisting moment about the toe");
  expect_near(r.statics.overturning_moment_ftlb, 750.0, 1e-9, "overturning moment");
  expect_near(r.statics.passive_resistance_lb, 180.0, 1e-9, "passive resistance");
  expect_near(r.overturning_factor, 6.64, 1e-9, "overturning factor");
  expect_near(r.sliding_factor, 2.8, 1e-9, "sliding factor");
  expect_near(r.statics.max_bearing_psf, 573.75, 1e-9, "trapezoidal toe pressure");
  expect_near(r.bearing_factor, 2000.0 / 573.75, 1e-9, "bearing factor");
  expect_true(r.passed, "hand-checked wall passes");
  expect_true(r.checks.size() == 3 && r.failing_factors().empty(), "three checks, none failing");
}

void test_slab_and_topping() {
  const DesignSettings st = DesignSettings::defaults();
  LoadCase lc = hand_load_case();
  lc.slab_live_load_psf = 100.0;
  lc.surcharge_load_psf = 100.0;
  lc.topping_overburden_psf = 120.0;
  const StabilityResult r = evaluate_stability(kStem, make_footing(12.0, 24.0, 12.0), lc, st);

  expect_near(r.statics.slab_thrust_lb, 150.0, 1e-9, "slab thrust Ka * q * Hb");
  expect_near(r.overturning_factor, 4980.0 / 1125.0, 1e-9, "slab adds overturning at Hb / 2");
  expect_near(r.sliding_factor, 2.1, 1e-9, "live load adds thrust but no friction");
  expect_near(r.statics.bearing_vertical_lb, 2480.0, 1e-9, "slab and topping load the base");
  expect_near(r.statics.max_bearing_psf, 786.875, 1e-9, "toe pressure with slab and topping");
}

void test_single_factor_rejects() {
  DesignSettings st = DesignSettings::defaults();
  st.resistance.include_passive = false;
  LoadCase lc = hand_load_case();
  lc.base_friction_coefficient = 0.2;
  const StabilityResult r = evaluate_stability(kStem, make_footing(12.0, 24.0, 12.0), lc, st);

  expect_near(r.sliding_factor, 0.96, 1e-9, "sliding without passive");
  expect_true(r.overturning_factor >= 1.5 && r.bearing_factor >= 1.0, "other factors still pass");
  expect_true(!r.passed, "one failing factor rejects the candidate");
  const auto failing = r.failing_factors();
  expect_true(failing.size() == 1 && failing[0] == kFactorSliding, "failing factor is named");
}

void test_triangular_and_outside() {
  const DesignSettings st = DesignSettings::defaults();
  const StabilityResult tri = evaluate_stability(kStem, make_footing(12.0, 0.0, 12.0), hand_load_case(), st);
  expect_true(!tri.statics.resultant_in_middle_third && tri.statics.resultant_within_base,
              "resultant outside the middle third but inside the base");
  expect_near(tri.statics.max_bearing_psf, 1200.0, 1e-9, "triangular redistribution 2V / (3 x_bar)");

  const StabilityResult out = evaluate_stability(kStem, make_footing(0.0, 0.0, 12.0), hand_load_case(), st);
  expect_true(!out.statics.resultant_within_base, "resultant leaves the base");
  expect_true(std::isinf(out.statics.max_bearing_psf), "toe pressure unbounded");
  expect_near(out.bearing_factor, 0.0, 0.0, "bearing factor 0 when the resultant leaves the base");
  expect_true(!out.passed, "overturned wall fails");
}

void test_step_soil() {
  const DesignSettings st = DesignSettings::defaults();
  const SectionStack stepped = {{24.0, 14.0}, {24.0, 10.0}};
  const StabilityResult r = evaluate_stability(stepped, make_footing(12.0, 24.0, 12.0), hand_load_case(), st);
  // 120 pcf * 2 ft * (4 / 12) ft
  expect_near(r.statics.step_soil_weight_lb, 80.0, 1e-9, "backfill in the step behind the upper section");
}

}  // namespace
}  // namespace rwall

int main() {
  using namespace rwall;
  set_log_level(LogLevel::ERROR);

  test_hand_checked_wall();
  test_slab_and_topping();
  test_single_factor_rejects();
  test_triangular_and_outside();
  test_step_soil();

  return selftest::finish();
}
