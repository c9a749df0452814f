#pragma once
/*
================================================================================
Fragment 2.7 — Footing: Closed-Form Footing Sizer
FILE: cpp/engine/footing/footing_sizer.hpp

Purpose:
  - Return exactly one footing for a candidate stem, deterministically:
      thickness = max(min_thickness, ceil(cover + ratio * H))
      toe       = max(min_toe (user), rules.min_toe)
      heel      = smallest h >= rules.min_heel that keeps the bearing
                  resultant inside the middle third (no tension under the base)
  - If the resulting toe pressure exceeds q_allow / min_bearing, extend the toe
    by the closed-form amount that brings 2V/B under the ceiling.

Notes:
  - The middle-third condition x_bar >= B/3 is 3*M_net(h) - B(h)*V(h) >= 0,
    a quadratic in the heel length h. Its coefficients are recovered exactly
    from three statics evaluations (h = 0, 1, 2 ft).
  - All lengths returned are whole inches.
  - This is sizing, not acceptance: the optimizer still runs the stability
    checker on every candidate.
  - The thickness rule is a minimum. The optimizer may thicken a footing up to
    the rule's value at the tallest admissible wall; that ceiling does not
    depend on the wall being designed, so a taller wall never has more
    thickness options than a shorter one.
================================================================================
*/

#include "engine/core/design_input.hpp"
#include "engine/core/settings.hpp"
#include "engine/footing/footing.hpp"
#include "engine/loads/load_model.hpp"
#include "engine/sections/wall_section.hpp"

namespace rwall {

double footing_thickness_in(double total_height_in, const FootingRules& rules);

// Admissible thicknesses for a wall of this height, whole inches apart:
// [rule at this height, rule at kMaxWallHeightIn].
struct ThicknessRange {
  double min_in = 0.0;
  double max_in = 0.0;
};

ThicknessRange footing_thickness_range(double total_height_in, const FootingRules& rules);

// Toe floor for a request: the user's minimum or the rule, whole inches.
double footing_min_toe_in(double min_toe_in, const FootingRules& rules);

Footing size_footing(const SectionStack& sections,
                     const LoadCase& lc,
                     double min_toe_in,
                     const DesignSettings& settings);

// Same sizing at an explicit thickness (from footing_thickness_range).
Footing size_footing(const SectionStack& sections,
                     const LoadCase& lc,
                     double min_toe_in,
                     double thickness_in,
                     const DesignSettings& settings);

}  // namespace rwall
