/*
  Fragment 3.3 — Optimizer Selftest

  Properties checked over a grid of inputs:
    1) Every converged design meets the safety floor (1.5 / 1.5 / 1.0).
    2) Every candidate ever evaluated has section heights summing exactly to
       the input height (observer sees all of them).
    3) Output toe >= requested toe.
    4) MinimizeFooting footprint <= MinimizeExcavation footprint.
    5) Footprint never decreases as height grows (other inputs fixed), on a
       1 in height grid with toe, slab and topping variations.
    6) The sweep respects max_sweep_steps.
    7) Infeasible runs name the failing factors of the widest footing tried.
    8) Short walls search the thicker footings as well.

  Non-zero return code indicates failure.
*/

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "engine/core/design_input.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/loads/load_model.hpp"
#include "engine/optimization/objective.hpp"
#include "engine/optimization/optimizer.hpp"
#include "engine/sections/section_builder.hpp"

namespace rwall {
namespace {

using namespace selftest;

OptimizationResult run(const DesignInput& in, const DesignSettings& st = DesignSettings::defaults(),
                       const CandidateObserver& obs = {}) {
  const LoadCase lc = derive_load_case(in, st);
  return optimize(in, lc, st, obs);
}

DesignInput input(double h, OptimizationObjective obj = OptimizationObjective::MinimizeExcavation) {
  DesignInput in;
  in.height_in = h;
  in.objective = obj;
  return in;
}

void test_safety_floor_and_candidates() {
  const Material materials[] = {Material::Concrete, Material::CMU};
  const Surcharge slopes[] = {Surcharge::Flat, Surcharge::Slope1_4, Surcharge::Slope1_2, Surcharge::Slope1_1};
  const SoilStiffness soils[] = {SoilStiffness::Stiff, SoilStiffness::Soft};
  const OptimizationObjective objectives[] = {OptimizationObjective::MinimizeExcavation,
                                              OptimizationObjective::MinimizeFooting};

  bool floor_ok = true;
  bool sections_ok = true;
  bool index_ok = true;
  bool winner_seen = true;
  int converged = 0;
  int infeasible = 0;

  for (Material m : materials) {
    for (Surcharge s : slopes) {
      for (SoilStiffness soil : soils) {
        for (OptimizationObjective obj : objectives) {
          for (double h = 24.0; h <= 144.0; h += 20.0) {
            DesignInput in = input(h, obj);
            in.material = m;
            in.surcharge = s;
            in.soil = soil;

            int seen = 0;
            bool winner_in_stream = false;
            std::vector<Footing> accepted;
            const OptimizationResult r = run(in, DesignSettings::defaults(), [&](const Candidate& c) {
              ++seen;
              if (c.evaluation_index != seen) index_ok = false;
              if (stack_height_in(c.sections) != in.height_in) sections_ok = false;
              if (c.accepted()) accepted.push_back(c.footing);
            });

            if (r.evaluations != seen) index_ok = false;
            if (r.state == SearchState::Converged) {
              ++converged;
              const StabilityResult& fs = r.best->stability;
              if (!(fs.overturning_factor >= 1.5 && fs.sliding_factor >= 1.5 && fs.bearing_factor >= 1.0 &&
                    fs.passed)) {
                floor_ok = false;
              }
              for (const auto& f : accepted) winner_in_stream = winner_in_stream || (f == r.best->footing);
              if (!winner_in_stream) winner_seen = false;
            } else {
              ++infeasible;
              if (r.best.has_value() || r.reason.empty()) floor_ok = false;
            }
          }
        }
      }
    }
  }

  expect_true(converged > 0 && infeasible > 0, "grid covers converged and infeasible inputs");
  expect_true(floor_ok, "every converged design meets 1.5 / 1.5 / 1.0");
  expect_true(sections_ok, "every evaluated candidate sums exactly to the input height");
  expect_true(index_ok, "observer sees every evaluation in order");
  expect_true(winner_seen, "the winner is one of the observed accepted candidates");
}

void test_toe_lower_bound() {
  bool ok = true;
  const double toes[] = {0.0, 5.0, 12.0, 60.0, 120.0};
  for (double toe : toes) {
    for (double h = 24.0; h <= 96.0; h += 24.0) {
      for (auto obj : {OptimizationObjective::MinimizeExcavation, OptimizationObjective::MinimizeFooting}) {
        DesignInput in = input(h, obj);
        in.toe_length_in = toe;
        const OptimizationResult r = run(in);
        if (r.state == SearchState::Converged && r.best->footing.toe_in < toe) ok = false;
      }
    }
  }
  expect_true(ok, "output toe is never below the requested toe");
}

void test_objective_effect() {
  bool ok = true;
  int compared = 0;
  for (auto soil : {SoilStiffness::Stiff, SoilStiffness::Soft}) {
    for (auto s : {Surcharge::Flat, Surcharge::Slope1_2}) {
      for (double h = 24.0; h <= 144.0; h += 12.0) {
        DesignInput ex = input(h, OptimizationObjective::MinimizeExcavation);
        ex.soil = soil;
        ex.surcharge = s;
        DesignInput ft = ex;
        ft.objective = OptimizationObjective::MinimizeFooting;

        const OptimizationResult a = run(ex);
        const OptimizationResult b = run(ft);
        if (a.state != b.state) ok = false;
        if (a.state == SearchState::Converged && b.state == SearchState::Converged) {
          ++compared;
          if (b.best->footing.footprint_in() > a.best->footing.footprint_in()) ok = false;
        }
      }
    }
  }
  expect_true(compared > 0, "objective comparison has converged pairs");
  expect_true(ok, "MinimizeFooting footprint <= MinimizeExcavation footprint");
}

// Walks height one inch at a time. Thickness-rule steps (10 -> 11 -> 12 in)
// and toe/slab/topping combinations are where a footprint could drop.
void test_monotone_footprint() {
  struct Surface {
    bool slab;
    double topping_in;
  };
  const Material materials[] = {Material::Concrete, Material::CMU};
  const Surcharge slopes[] = {Surcharge::Flat, Surcharge::Slope1_4};
  const SoilStiffness soils[] = {SoilStiffness::Stiff, SoilStiffness::Soft};
  const Surface surfaces[] = {{false, 0.0}, {true, 0.0}, {true, 24.0}};
  const double toes[] = {0.0, 60.0};

  bool ok = true;
  int series = 0;
  for (Material m : materials) {
    for (Surcharge s : slopes) {
      for (SoilStiffness soil : soils) {
        for (const Surface& surf : surfaces) {
          for (double toe : toes) {
            for (auto obj : {OptimizationObjective::MinimizeExcavation, OptimizationObjective::MinimizeFooting}) {
              ++series;
              double prev = -1.0;
              for (double h = kMinWallHeightIn; h <= kMaxWallHeightIn; h += 1.0) {
                DesignInput in = input(h, obj);
                in.material = m;
                in.surcharge = s;
                in.soil = soil;
                in.has_adjacent_slab = surf.slab;
                in.topping_depth_in = surf.topping_in;
                in.toe_length_in = toe;
                const OptimizationResult r = run(in);
                if (r.state != SearchState::Converged) continue;
                const double fp = r.best->footing.footprint_in();
                if (fp < prev) {
                  ok = false;
                  std::cerr << "  footprint dropped from " << prev << " to " << fp << " at " << in.describe()
                            << "\n";
                }
                prev = fp;
              }
            }
          }
        }
      }
    }
  }
  expect_true(series == 96, "monotonicity grid covers every combination");
  expect_true(ok, "footprint is non-decreasing in height at 1 in resolution");
}

// One inch across the thickness-rule steps (133 -> 134 in and 116 -> 117 in
// with a slab) with a 60 in toe.
void test_monotone_at_thickness_steps() {
  struct Case {
    Material material;
    Surcharge surcharge;
    bool slab;
    double h_low;
    OptimizationObjective objective;
  };
  const Case cases[] = {
      {Material::Concrete, Surcharge::Flat, false, 133.0, OptimizationObjective::MinimizeFooting},
      {Material::Concrete, Surcharge::Flat, true, 116.0, OptimizationObjective::MinimizeFooting},
      {Material::CMU, Surcharge::Slope1_4, true, 116.0, OptimizationObjective::MinimizeExcavation},
      {Material::CMU, Surcharge::Slope1_4, true, 116.0, OptimizationObjective::MinimizeFooting},
  };
  for (const Case& c : cases) {
    DesignInput lo = input(c.h_low, c.objective);
    lo.material = c.material;
    lo.surcharge = c.surcharge;
    lo.has_adjacent_slab = c.slab;
    lo.toe_length_in = 60.0;
    DesignInput hi = lo;
    hi.height_in = c.h_low + 1.0;

    const OptimizationResult a = run(lo);
    const OptimizationResult b = run(hi);
    expect_true(a.state == SearchState::Converged && b.state == SearchState::Converged,
                "both heights converge: " + lo.describe());
    if (a.best && b.best) {
      expect_true(b.best->footing.footprint_in() >= a.best->footing.footprint_in(),
                  "one inch taller keeps the footprint: " + lo.describe());
    }
  }
}

// The thicker footings are in play for short walls too: the 48 in wall with a
// 12 in toe takes the 12 in footing for its passive resistance.
void test_thickness_window() {
  DesignInput in = input(48.0);
  in.toe_length_in = 12.0;
  int thinnest = 0;
  int thickest = 0;
  const OptimizationResult r = run(in, DesignSettings::defaults(), [&](const Candidate& c) {
    if (c.footing.thickness_in == 10.0) ++thinnest;
    if (c.footing.thickness_in == 12.0) ++thickest;
  });
  expect_true(thinnest > 0 && thickest > 0, "48 in wall tries 10 through 12 in footings");
  expect_true(r.state == SearchState::Converged, "48 in wall converges");
  if (r.best) {
    expect_near(r.best->footing.thickness_in, 12.0, 0.0, "12 in footing wins on base width");
    expect_near(r.best->footing.toe_in, 12.0, 0.0, "requested toe kept");
    expect_near(r.best->footing.heel_in, 1.0, 0.0, "1 in heel");
  }
}

void test_sweep_bound() {
  DesignSettings st = DesignSettings::defaults();
  st.search.max_sweep_steps = 1;
  const OptimizationResult r = run(input(72.0, OptimizationObjective::MinimizeFooting), st);
  expect_true(r.sweep_steps == 1, "footing sweep stops at max_sweep_steps");
  expect_true(r.state == SearchState::Converged && r.best->width_step_in == st.search.min_width_step_in,
              "single-step sweep keeps the seed step");

  const OptimizationResult full = run(input(72.0, OptimizationObjective::MinimizeFooting));
  expect_true(full.sweep_steps == 2, "concrete sweep covers steps 2 and 4 in");
}

void test_infeasible_diagnosis() {
  DesignInput in = input(144.0);
  in.surcharge = Surcharge::Slope1_1;
  in.soil = SoilStiffness::Soft;
  const OptimizationResult r = run(in);

  expect_true(r.state == SearchState::Infeasible, "144 in 1:1 soft wall is infeasible within 240 in of footing");
  expect_true(!r.best.has_value(), "no candidate on infeasibility");
  expect_true(!r.last_evaluated.passed, "diagnosed candidate failed");
  const auto failing = r.last_evaluated.failing_factors();
  bool has_sliding = false;
  for (const auto& id : failing) has_sliding = has_sliding || id == kFactorSliding;
  expect_true(has_sliding, "sliding named among the failing factors");
}

void test_determinism() {
  DesignInput in = input(90.0, OptimizationObjective::MinimizeFooting);
  in.surcharge = Surcharge::Slope1_4;
  in.has_adjacent_slab = true;
  in.topping_depth_in = 6.0;
  const OptimizationResult a = run(in);
  const OptimizationResult b = run(in);
  bool same = a.state == b.state && a.evaluations == b.evaluations && a.best.has_value() == b.best.has_value();
  if (same && a.best) {
    same = a.best->footing == b.best->footing && a.best->width_step_in == b.best->width_step_in &&
           std::memcmp(&a.best->stability.overturning_factor, &b.best->stability.overturning_factor,
                       sizeof(double)) == 0;
  }
  expect_true(same, "identical input gives identical search result");
}

void test_objective_ranking() {
  Candidate a;
  a.sections = {{48.0, 14.0}};
  a.footing = Footing{12.0, 10.0, 10.0};
  a.stability.passed = true;
  Candidate b = a;
  b.footing = Footing{14.0, 8.0, 10.0};

  expect_true(better_candidate(a, b, OptimizationObjective::MinimizeFooting) ==
                  better_candidate(a, b, OptimizationObjective::MinimizeFooting) &&
                  !better_candidate(a, b, OptimizationObjective::MinimizeFooting) &&
                  !better_candidate(b, a, OptimizationObjective::MinimizeFooting),
              "equal footprint and thickness tie under MinimizeFooting");
  expect_true(better_candidate(a, b, OptimizationObjective::MinimizeExcavation),
              "equal base width breaks the tie on the smaller toe");

  b.footing.thickness_in = 12.0;
  expect_true(better_candidate(a, b, OptimizationObjective::MinimizeFooting), "thinner footing wins a footprint tie");

  Candidate rejected = a;
  rejected.stability.passed = false;
  rejected.footing = Footing{6.0, 0.0, 10.0};
  expect_true(better_candidate(a, rejected, OptimizationObjective::MinimizeFooting),
              "accepted candidate beats a smaller rejected one");
}

}  // namespace
}  // namespace rwall

int main() {
  using namespace rwall;
  set_log_level(LogLevel::ERROR);

  test_safety_floor_and_candidates();
  test_toe_lower_bound();
  test_objective_effect();
  test_monotone_footprint();
  test_monotone_at_thickness_steps();
  test_thickness_window();
  test_sweep_bound();
  test_infeasible_diagnosis();
  test_determinism();
  test_objective_ranking();

  return selftest::finish();
}
