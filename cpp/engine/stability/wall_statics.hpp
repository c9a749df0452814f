#pragma once
/*
================================================================================
Fragment 2.5 — Stability: Wall Statics (Forces + Moments About the Toe)
FILE: cpp/engine/stability/wall_statics.hpp

Purpose:
  - Single source of the force/moment bookkeeping used by both the footing
    sizer (closed-form heel) and the stability checker (factors of safety).

Frame (per foot of wall length, ft / lb / ft-lb):
  - x = 0 at the front edge of the toe, positive toward the heel.
  - Stem sections share the front (toe-side) face at x = toe.
  - Base height Hb = stem height + footing thickness.

Resisting (dead) loads, each with its arm about the toe:
  - stem sections, footing slab, soil over the heel, soil filling the steps
    behind narrower upper sections, slope surcharge over the heel.
Driving loads:
  - P_soil = 1/2 Ka gamma Hb^2 at Hb/3
  - P_slab = Ka q_slab Hb at Hb/2
Bearing-only vertical loads:
  - slab live load over the heel, topping overburden over the toe.

Notes:
  - Live load and topping are excluded from the sliding and overturning
    resistance (they are not reliable resisting loads).
================================================================================
*/

#include "engine/footing/footing.hpp"
#include "engine/loads/load_model.hpp"
#include "engine/sections/wall_section.hpp"

namespace rwall {

struct WallStatics {
  // Geometry (ft)
  double base_width_ft = 0.0;
  double base_height_ft = 0.0;   // Hb
  double stem_height_ft = 0.0;

  // Dead loads (lb/ft) and their moment about the toe (ft-lb/ft)
  double stem_weight_lb = 0.0;
  double footing_weight_lb = 0.0;
  double heel_soil_weight_lb = 0.0;
  double step_soil_weight_lb = 0.0;
  double slope_surcharge_lb = 0.0;
  double dead_load_lb = 0.0;          // N for sliding
  double resisting_moment_ftlb = 0.0;

  // Lateral
  double soil_thrust_lb = 0.0;
  double slab_thrust_lb = 0.0;
  double driving_force_lb = 0.0;
  double overturning_moment_ftlb = 0.0;
  double passive_resistance_lb = 0.0;

  // Bearing-only vertical loads
  double slab_vertical_lb = 0.0;
  double topping_weight_lb = 0.0;
  double bearing_extra_moment_ftlb = 0.0;

  // Bearing resultant
  double bearing_vertical_lb = 0.0;   // V
  double net_moment_ftlb = 0.0;       // M_r + extra - M_o
  double resultant_from_toe_ft = 0.0; // x_bar
  double eccentricity_ft = 0.0;       // B/2 - x_bar (> 0: toward the toe)
  bool resultant_within_base = false;
  bool resultant_in_middle_third = false;
  double max_bearing_psf = 0.0;       // +inf when the resultant leaves the base
};

WallStatics compute_wall_statics(const SectionStack& sections,
                                 const Footing& footing,
                                 const LoadCase& lc,
                                 const ResistanceSettings& resistance);

}  // namespace rwall
