/*
  Fragment 2.1 — Load Model Selftest

  Checks:
    1) Flat backfill reduces to the Rankine tan^2(45 - phi/2) coefficients.
    2) Stiff soil always yields a lower Ka than soft soil.
    3) Ka grows with the backfill slope; slopes steeper than phi clamp.
    4) Slope, slab and topping loads land in the right terms.
    5) Identical inputs give bit-identical load cases.

  Non-zero return code indicates failure.
*/

#include <cstring>

#include "engine/core/design_input.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/loads/load_model.hpp"

namespace rwall {
namespace {

using namespace selftest;

DesignInput make_input(SoilStiffness soil, Surcharge s) {
  DesignInput in;
  in.height_in = 48.0;
  in.soil = soil;
  in.surcharge = s;
  return in;
}

void test_flat_rankine() {
  const DesignSettings st = DesignSettings::defaults();
  const LoadCase stiff = derive_load_case(make_input(SoilStiffness::Stiff, Surcharge::Flat), st);
  const LoadCase soft = derive_load_case(make_input(SoilStiffness::Soft, Surcharge::Flat), st);

  expect_near(stiff.active_earth_pressure_coefficient, 0.282715, 1e-6, "stiff flat Ka = tan^2(28 deg)");
  expect_near(soft.active_earth_pressure_coefficient, 0.361033, 1e-6, "soft flat Ka = tan^2(31 deg)");
  expect_near(stiff.passive_earth_pressure_coefficient, 3.537132, 1e-6, "stiff Kp = tan^2(62 deg)");
  expect_near(stiff.effective_soil_unit_weight_pcf, 120.0, 0.0, "stiff unit weight");
  expect_near(soft.effective_soil_unit_weight_pcf, 110.0, 0.0, "soft unit weight");
  expect_near(stiff.surcharge_load_psf, 0.0, 0.0, "flat backfill without slab has no surcharge");
}

void test_stiff_below_soft() {
  const DesignSettings st = DesignSettings::defaults();
  const Surcharge all[] = {Surcharge::Flat, Surcharge::Slope1_4, Surcharge::Slope1_2, Surcharge::Slope1_1};
  bool ok = true;
  for (Surcharge s : all) {
    const double ka_stiff = derive_load_case(make_input(SoilStiffness::Stiff, s), st).active_earth_pressure_coefficient;
    const double ka_soft = derive_load_case(make_input(SoilStiffness::Soft, s), st).active_earth_pressure_coefficient;
    if (!(ka_stiff < ka_soft)) ok = false;
  }
  expect_true(ok, "stiff Ka < soft Ka for every surcharge class");
}

void test_slope_ordering_and_clamp() {
  const DesignSettings st = DesignSettings::defaults();
  const double flat = derive_load_case(make_input(SoilStiffness::Soft, Surcharge::Flat), st).active_earth_pressure_coefficient;
  const double s14 = derive_load_case(make_input(SoilStiffness::Soft, Surcharge::Slope1_4), st).active_earth_pressure_coefficient;
  const double s12 = derive_load_case(make_input(SoilStiffness::Soft, Surcharge::Slope1_2), st).active_earth_pressure_coefficient;
  const LoadCase s11 = derive_load_case(make_input(SoilStiffness::Soft, Surcharge::Slope1_1), st);

  expect_true(flat < s14 && s14 < s12 && s12 < s11.active_earth_pressure_coefficient,
              "Ka increases flat < 1:4 < 1:2 < 1:1");
  expect_near(s14, 0.401722, 1e-6, "soft 1:4 Ka (sloping Rankine)");
  expect_near(s12, 0.648086, 1e-6, "soft 1:2 Ka (sloping Rankine)");

  expect_true(s11.slope_clamped, "1:1 slope steeper than phi is clamped");
  expect_near(s11.backfill_slope_deg, 45.0, 1e-12, "nominal 1:1 slope stays 45 deg");
  expect_near(s11.design_slope_deg, 28.0, 1e-12, "design slope clamped to phi");
  expect_near(s11.active_earth_pressure_coefficient, 0.882948, 1e-6, "clamped Ka = cos(phi)");

  expect_near(slope_angle_deg(Surcharge::Slope1_2), 26.565051, 1e-6, "1:2 slope angle");
  expect_near(slope_angle_deg(Surcharge::Slope1_4), 14.036243, 1e-6, "1:4 slope angle");
}

void test_surcharge_terms() {
  const DesignSettings st = DesignSettings::defaults();

  DesignInput in = make_input(SoilStiffness::Stiff, Surcharge::Slope1_2);
  LoadCase lc = derive_load_case(in, st);
  // 120 pcf * 0.5 * 4 ft * 0.25
  expect_near(lc.slope_dead_load_psf, 60.0, 1e-9, "1:2 slope dead load over heel");
  expect_near(lc.surcharge_load_psf, 60.0, 1e-9, "surcharge = slope load without slab");

  in.has_adjacent_slab = true;
  in.topping_depth_in = 12.0;
  lc = derive_load_case(in, st);
  expect_near(lc.slab_live_load_psf, 100.0, 0.0, "adjacent slab live load");
  expect_near(lc.surcharge_load_psf, 160.0, 1e-9, "surcharge = slope + slab");
  expect_near(lc.topping_overburden_psf, 120.0, 1e-9, "12 in topping = 120 psf overburden");

  expect_near(lc.stem_unit_weight_pcf, 150.0, 0.0, "concrete stem unit weight");
  in.material = Material::CMU;
  lc = derive_load_case(in, st);
  expect_near(lc.stem_unit_weight_pcf, 130.0, 0.0, "CMU stem unit weight");
}

void test_determinism() {
  const DesignSettings st = DesignSettings::defaults();
  DesignInput in = make_input(SoilStiffness::Soft, Surcharge::Slope1_4);
  in.height_in = 97.5;
  in.topping_depth_in = 6.0;
  in.has_adjacent_slab = true;

  const LoadCase a = derive_load_case(in, st);
  const LoadCase b = derive_load_case(in, st);
  const double va[] = {a.active_earth_pressure_coefficient, a.surcharge_load_psf, a.effective_soil_unit_weight_pcf,
                       a.passive_earth_pressure_coefficient, a.topping_overburden_psf};
  const double vb[] = {b.active_earth_pressure_coefficient, b.surcharge_load_psf, b.effective_soil_unit_weight_pcf,
                       b.passive_earth_pressure_coefficient, b.topping_overburden_psf};
  expect_true(std::memcmp(va, vb, sizeof(va)) == 0, "load case is bit-identical across calls");
}

void test_contract_violations() {
  expect_error_code([] { (void)rankine_active_coefficient(30.0, 35.0); }, ErrorCode::kInvalidArgument,
                    "slope above phi rejected by the raw Ka relation");
  expect_error_code([] { (void)slope_angle_deg(static_cast<Surcharge>(42)); }, ErrorCode::kContractViolation,
                    "unknown surcharge enum is a contract violation");
}

}  // namespace
}  // namespace rwall

int main() {
  using namespace rwall;
  set_log_level(LogLevel::ERROR);

  test_flat_rankine();
  test_stiff_below_soft();
  test_slope_ordering_and_clamp();
  test_surcharge_terms();
  test_determinism();
  test_contract_violations();

  return selftest::finish();
}
