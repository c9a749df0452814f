#pragma once
/*
================================================================================
Fragment 4.1 — Specification: Wall Specification Record
FILE: cpp/engine/specification/wall_specification.hpp

Purpose:
  - The final artifact of a converged run: total height, ordered sections,
    exactly one footing, material and the stability result of the accepted
    candidate. Handed to the caller for rendering / serialization.

Ownership:
  - Built once by build_specification() and never mutated afterwards; callers
    receive it by value (const members are avoided so it stays movable).
================================================================================
*/

#include "engine/core/design_input.hpp"
#include "engine/footing/footing.hpp"
#include "engine/loads/load_model.hpp"
#include "engine/sections/wall_section.hpp"
#include "engine/stability/stability_checker.hpp"

#include <string>

namespace rwall {

struct WallSpecification {
  double total_height_in = 0.0;
  SectionStack sections;
  Footing footing;
  Material material = Material::Concrete;
  StabilityResult stability;

  // Provenance
  OptimizationObjective objective = OptimizationObjective::MinimizeExcavation;
  LoadCase load_case;
  double width_step_in = 0.0;
  int evaluations = 0;
  std::string fingerprint;  // 16 hex chars, see spec_fingerprint.hpp
};

}  // namespace rwall
