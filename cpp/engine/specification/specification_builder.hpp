#pragma once
/*
================================================================================
Fragment 4.2 — Specification: Builder
FILE: cpp/engine/specification/specification_builder.hpp

Purpose:
  - Pure assembly of a WallSpecification from the input and the accepted
    candidate. No calculation happens here.

Hardening:
  - A candidate that did not pass stability, or whose sections do not match
    the input height, is a contract violation (Error kContractViolation).
================================================================================
*/

#include "engine/core/design_input.hpp"
#include "engine/loads/load_model.hpp"
#include "engine/optimization/candidate.hpp"
#include "engine/specification/wall_specification.hpp"

namespace rwall {

WallSpecification build_specification(const DesignInput& input,
                                      const LoadCase& lc,
                                      const Candidate& winner,
                                      int evaluations);

}  // namespace rwall
