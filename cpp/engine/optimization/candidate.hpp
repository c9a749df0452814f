#pragma once
/*
================================================================================
Fragment 3.1 — Optimization: Candidate Design
FILE: cpp/engine/optimization/candidate.hpp

Purpose:
  - One evaluated (sections, footing) pair plus the parameters that produced
    it. Candidates are created and dropped freely during a search; only the
    winner is promoted to a WallSpecification.
================================================================================
*/

#include "engine/footing/footing.hpp"
#include "engine/sections/wall_section.hpp"
#include "engine/stability/stability_checker.hpp"

#include <functional>

namespace rwall {

struct Candidate {
  SectionStack sections;
  Footing footing;
  StabilityResult stability;

  double width_step_in = 0.0;  // section partition parameter
  int evaluation_index = 0;    // 1-based order of evaluation within the run

  bool accepted() const noexcept { return stability.passed; }
};

// Called once for every candidate evaluated, in evaluation order.
using CandidateObserver = std::function<void(const Candidate&)>;

}  // namespace rwall
