#pragma once
/*
================================================================================
Fragment 3.3 — Optimization: Bounded One-Dimensional Design Search
FILE: cpp/engine/optimization/optimizer.hpp

Purpose:
  - Drive the section builder, footing sizer and stability checker to the
    minimal stable candidate for the requested objective.

State machine (over candidates, not time):
  Searching --(stable candidate found)--> Converged
  Searching --(nothing stable within bounds)--> Infeasible

Search:
  - Seed: the smallest section width step (search.min_width_step_in).
  - Footing resolution for a fixed section (shared by both objectives), per
    admissible thickness (footing_thickness_range):
      scan footprints upward in whole inches from the toe floor; within a
      footprint try splits from the smallest toe. The first pass is the
      smallest stable footprint. A passing closed-form sized footing caps the
      scan; max_footing_width caps it otherwise. The best thickness by
      objective.hpp is kept.
  - MinimizeExcavation: section fixed at the seed step; one footing resolution.
  - MinimizeFooting: ascending sweep of the width step from the seed while the
    base section stays within the material maximum; each step gets its own
    footing resolution; the best by objective.hpp wins. The seed step is part
    of the sweep.
  - The width-step sweep is bounded by search.max_sweep_steps; the footprint
    scan by max_footing_width.
  - Footprint never decreases as the wall gets taller: the thickness ceiling
    is fixed and the scan is exact.

Outcome:
  - Converged: best holds the winning candidate.
  - Infeasible: best is empty; last_evaluated is the widest footing tried at
    the requested toe and reason explains which bound was hit.
================================================================================
*/

#include "engine/core/design_input.hpp"
#include "engine/core/settings.hpp"
#include "engine/loads/load_model.hpp"
#include "engine/optimization/candidate.hpp"

#include <optional>
#include <string>

namespace rwall {

enum class SearchState : int { Searching = 0, Converged = 1, Infeasible = 2 };

const char* to_string(SearchState s) noexcept;

struct OptimizationResult {
  SearchState state = SearchState::Searching;
  std::optional<Candidate> best;
  StabilityResult last_evaluated;

  int evaluations = 0;   // stability evaluations in the run
  int sweep_steps = 0;   // width-step iterations of the outer sweep
  std::string reason;    // set when Infeasible
};

OptimizationResult optimize(const DesignInput& input,
                            const LoadCase& lc,
                            const DesignSettings& settings,
                            const CandidateObserver& observer = {});

}  // namespace rwall
