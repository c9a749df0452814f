/*
  Fragment 5.1 — Design Engine Selftest (End-to-End Scenarios)

  Scenarios:
    A) 48 in concrete, flat, stiff, toe 12 -> converges, toe >= 12, floor met.
    B) 144 in, 1:1 slope, soft, toe 0 -> converges with toe > 0 or reports an
       infeasibility that names the failing factor. Never an unsafe design.
    C) 24 in, flat, stiff -> converges with the smallest footprint of the
       valid height range.
  Plus: determinism of the whole run and contract checks at the entry point.

  Non-zero return code indicates failure.
*/

#include <string>

#include "engine/core/design_input.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/pipeline/design_engine.hpp"

namespace rwall {
namespace {

using namespace selftest;

bool meets_floor(const StabilityResult& r) {
  return r.passed && r.overturning_factor >= 1.5 && r.sliding_factor >= 1.5 && r.bearing_factor >= 1.0;
}

void test_scenario_a() {
  DesignInput in;
  in.height_in = 48.0;
  in.material = Material::Concrete;
  in.surcharge = Surcharge::Flat;
  in.soil = SoilStiffness::Stiff;
  in.toe_length_in = 12.0;

  const DesignOutcome out = run_design(in);
  expect_true(out.converged() && out.specification.has_value(), "scenario A converges");
  if (!out.specification) return;

  const WallSpecification& s = *out.specification;
  expect_true(s.footing.toe_in >= 12.0, "scenario A toe >= 12 in");
  expect_true(meets_floor(s.stability), "scenario A meets all three minimums");
  expect_true(s.total_height_in == 48.0 && s.sections.size() == 1, "scenario A is a single 48 in section");
  expect_near(s.footing.thickness_in, 12.0, 0.0, "scenario A takes the thicker footing for passive resistance");
  expect_near(s.footing.toe_in, 12.0, 0.0, "scenario A keeps the requested toe");
  expect_near(s.footing.heel_in, 1.0, 0.0, "scenario A smallest stable heel");
  expect_true(s.material == Material::Concrete, "scenario A material carried through");
  expect_true(s.fingerprint.size() == 16, "scenario A fingerprint is 16 hex chars");
}

void test_scenario_b() {
  DesignInput in;
  in.height_in = 144.0;
  in.surcharge = Surcharge::Slope1_1;
  in.soil = SoilStiffness::Soft;
  in.toe_length_in = 0.0;

  const DesignOutcome out = run_design(in);
  if (out.converged()) {
    expect_true(out.specification->footing.toe_in > 0.0, "scenario B converged with a toe");
    expect_true(meets_floor(out.specification->stability), "scenario B meets all three minimums");
  } else {
    expect_true(!out.specification.has_value(), "scenario B infeasible without a specification");
    expect_true(!out.diagnosis.failing_factors.empty(), "scenario B names the failing factor");
    expect_true(!out.diagnosis.last_evaluated.passed, "scenario B last candidate is the failing one");
    expect_true(!out.diagnosis.reason.empty(), "scenario B carries a reason");
  }
}

void test_scenario_c() {
  DesignInput in;
  in.height_in = 24.0;
  in.surcharge = Surcharge::Flat;
  in.soil = SoilStiffness::Stiff;

  const DesignOutcome low = run_design(in);
  expect_true(low.converged(), "scenario C converges");
  if (!low.specification) return;
  expect_true(meets_floor(low.specification->stability), "scenario C meets all three minimums");

  const double fp_min = low.specification->footing.footprint_in();
  bool smallest = true;
  for (double h = 30.0; h <= 144.0; h += 6.0) {
    DesignInput taller = in;
    taller.height_in = h;
    const DesignOutcome o = run_design(taller);
    if (o.converged() && o.specification->footing.footprint_in() < fp_min) smallest = false;
  }
  expect_true(smallest, "scenario C footprint is the smallest across 24..144 in");
}

void test_determinism() {
  DesignInput in;
  in.height_in = 84.0;
  in.material = Material::CMU;
  in.surcharge = Surcharge::Slope1_2;
  in.objective = OptimizationObjective::MinimizeFooting;
  in.topping_depth_in = 4.0;
  in.has_adjacent_slab = true;
  in.toe_length_in = 10.0;

  const DesignOutcome a = run_design(in);
  const DesignOutcome b = run_design(in);
  expect_true(a.status == b.status, "status repeats");
  if (a.specification && b.specification) {
    expect_eq_str(a.specification->fingerprint, b.specification->fingerprint, "fingerprint repeats");
  }
  expect_eq_str(a.summary(), b.summary(), "summary text repeats byte for byte");

  DesignInput bad;
  bad.height_in = 144.0;
  bad.surcharge = Surcharge::Slope1_1;
  bad.soil = SoilStiffness::Soft;
  const DesignOutcome x = run_design(bad);
  const DesignOutcome y = run_design(bad);
  expect_true(x.diagnosis.failing_factors == y.diagnosis.failing_factors &&
                  x.diagnosis.reason == y.diagnosis.reason,
              "infeasibility diagnosis repeats");
}

void test_entry_contract() {
  DesignInput in;
  in.height_in = 200.0;
  expect_error_code([&] { (void)run_design(in); }, ErrorCode::kContractViolation,
                    "out-of-range height at the engine is a contract violation");

  in.height_in = 48.0;
  in.toe_length_in = -1.0;
  expect_error_code([&] { (void)run_design(in); }, ErrorCode::kContractViolation,
                    "negative toe at the engine is a contract violation");

  DesignSettings st = DesignSettings::defaults();
  st.safety.min_sliding = 0.5;
  in.toe_length_in = 0.0;
  expect_throws<ValidationError>([&] { (void)run_design(in, st); }, "invalid settings rejected");
}

}  // namespace
}  // namespace rwall

int main() {
  using namespace rwall;
  set_log_level(LogLevel::ERROR);

  test_scenario_a();
  test_scenario_b();
  test_scenario_c();
  test_determinism();
  test_entry_contract();

  return selftest::finish();
}
