#pragma once
/*
================================================================================
Fragment 3.2 — Optimization: Objective (Lexicographic Candidate Score)
FILE: cpp/engine/optimization/objective.hpp

Purpose:
  - Rank accepted candidates for the chosen objective.

Keys (smaller is better, compared in order):
  - MinimizeExcavation: footing base width, then toe length, then thickness.
  - MinimizeFooting:    footprint (toe + heel), then thickness, then width step.

Hardening:
  - Rejected candidates never win against accepted ones.
  - Exact comparisons: every key is a whole number of inches or a step from a
    fixed grid, so equal designs compare equal.
================================================================================
*/

#include "engine/core/design_input.hpp"
#include "engine/optimization/candidate.hpp"

namespace rwall {

struct ObjectiveScore {
  double primary = 0.0;
  double secondary = 0.0;
  double tertiary = 0.0;
  bool is_feasible = false;
};

ObjectiveScore score_candidate(const Candidate& c, OptimizationObjective objective);

// True when a is strictly better than b for the objective.
bool better_candidate(const Candidate& a, const Candidate& b, OptimizationObjective objective);

}  // namespace rwall
