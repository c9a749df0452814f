/*
================================================================================
Fragment 3.2 — Optimization: Objective Implementation
FILE: cpp/engine/optimization/objective.cpp
================================================================================
*/

#include "engine/optimization/objective.hpp"

#include "engine/core/error.hpp"

namespace rwall {

ObjectiveScore score_candidate(const Candidate& c, OptimizationObjective objective) {
  ObjectiveScore s;
  s.is_feasible = c.accepted();

  switch (objective) {
    case OptimizationObjective::MinimizeExcavation:
      s.primary = c.footing.width_in(stack_base_width_in(c.sections));
      s.secondary = c.footing.toe_in;
      s.tertiary = c.footing.thickness_in;
      break;
    case OptimizationObjective::MinimizeFooting:
      s.primary = c.footing.footprint_in();
      s.secondary = c.footing.thickness_in;
      s.tertiary = c.width_step_in;
      break;
    default:
      RWALL_THROW(ErrorCode::kContractViolation, "score_candidate: unhandled OptimizationObjective");
  }

  return s;
}

bool better_candidate(const Candidate& a, const Candidate& b, OptimizationObjective objective) {
  const ObjectiveScore sa = score_candidate(a, objective);
  const ObjectiveScore sb = score_candidate(b, objective);

  if (sa.is_feasible != sb.is_feasible) return sa.is_feasible;
  if (sa.primary != sb.primary) return sa.primary < sb.primary;
  if (sa.secondary != sb.secondary) return sa.secondary < sb.secondary;
  return sa.tertiary < sb.tertiary;
}

}  // namespace rwall
