#pragma once
/*
================================================================================
Fragment 2.1 — Loads: Earth Pressure + Surcharge Load Case
FILE: cpp/engine/loads/load_model.hpp

Purpose:
  - Derive, once per design run, every soil/load quantity the candidates
    share: active and passive coefficients, soil unit weight, base friction,
    allowable bearing, slope and slab surcharges, topping overburden.

Model:
  - Friction angle and unit weight come from the soil stiffness preset.
  - Active coefficient: Rankine with sloping backfill
        Ka = cos(b) * (cos(b) - sqrt(cos^2 b - cos^2 phi))
                    / (cos(b) + sqrt(cos^2 b - cos^2 phi))
    which reduces to tan^2(45 - phi/2) for flat backfill. A slope steeper
    than phi is clamped to phi (Ka = cos(phi)).
  - Passive coefficient (level ground in front of the toe): tan^2(45 + phi/2).
  - Slope surcharge: equivalent uniform dead load over the heel,
        q_slope = gamma * tan(b) * H * slope_load_fraction
    Its lateral effect is already inside Ka.
  - Adjacent slab: uniform live surcharge q_slab, lateral (Ka * q_slab) and
    vertical over the heel (bearing only).
  - Topping: gamma * topping depth over the toe (bearing only).

Hardening:
  - Pure and deterministic: identical input + settings -> identical bits.
  - Enum values outside the declared set are contract violations.
================================================================================
*/

#include "engine/core/design_input.hpp"
#include "engine/core/settings.hpp"

#include <string>

namespace rwall {

struct LoadCase {
  // Primary terms.
  double active_earth_pressure_coefficient = 0.0;  // Ka
  double surcharge_load_psf = 0.0;                 // slope dead + slab live
  double effective_soil_unit_weight_pcf = 0.0;

  // Terms shared by every candidate of the run.
  double friction_angle_deg = 0.0;
  double backfill_slope_deg = 0.0;      // nominal slope of the surcharge class
  double design_slope_deg = 0.0;        // slope used in Ka (clamped to phi)
  bool slope_clamped = false;
  double passive_earth_pressure_coefficient = 0.0;  // Kp
  double base_friction_coefficient = 0.0;
  double allowable_bearing_psf = 0.0;
  double slope_dead_load_psf = 0.0;
  double slab_live_load_psf = 0.0;
  double topping_overburden_psf = 0.0;

  double retained_height_in = 0.0;
  Material material = Material::Concrete;
  double stem_unit_weight_pcf = 0.0;
  double footing_unit_weight_pcf = 0.0;

  std::string describe() const;
};

// Nominal slope angle of a surcharge class (degrees). Flat = 0.
double slope_angle_deg(Surcharge s);

// Rankine active coefficient for a backfill slope beta <= phi (degrees).
double rankine_active_coefficient(double friction_angle_deg, double slope_deg);

// Rankine passive coefficient for level ground (degrees).
double rankine_passive_coefficient(double friction_angle_deg);

LoadCase derive_load_case(const DesignInput& input, const DesignSettings& settings);

}  // namespace rwall
