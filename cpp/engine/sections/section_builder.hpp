#pragma once
/*
================================================================================
Fragment 2.3 — Sections: Section Builder
FILE: cpp/engine/sections/section_builder.hpp

Purpose:
  - Build ONE geometrically valid stem cross-section from explicit partition
    parameters. This component never searches; the optimizer owns the step.

Rules:
  - Section count n = clamp(ceil(H / max_section_height), 1, max_sections).
  - Widths bottom to top: w_i = min_width(material) + step * (max_sections - i)
    for i = 0..n-1. The base width depends only on the step, never on n, so a
    taller wall that needs one more section keeps its base and gains a
    narrower top. Widths never increase upward.
  - Lower sections take floor(H / n) inches each; the top section takes the
    remainder. The sum is then exact in floating point and is verified.

Hardening:
  - A base width above the material maximum is a contract violation: callers
    must bound the step with max_width_step_in().
  - Sum mismatch throws Error(kInvariant).
================================================================================
*/

#include "engine/core/design_input.hpp"
#include "engine/core/settings.hpp"
#include "engine/sections/wall_section.hpp"

namespace rwall {

struct SectionPartition {
  // Width increment between adjacent sections (inches, >= 0).
  double width_step_in = 2.0;
};

int section_count_for_height(double total_height_in, const SearchSettings& search,
                             int max_sections);

// Largest step whose base section still fits within the material maximum.
double max_width_step_in(Material material, int max_sections, const DesignSettings& settings);

SectionStack propose_sections(double total_height_in, Material material, int max_sections,
                              const SectionPartition& partition, const DesignSettings& settings);

// Throws Error(kInvariant) unless heights are positive, sum exactly to the
// total, and widths are positive and non-increasing upward.
void verify_section_stack(const SectionStack& sections, double total_height_in);

}  // namespace rwall
