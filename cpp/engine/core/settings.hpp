#pragma once
/*
================================================================================
Fragment 1.6 — Core: Design Settings (Jurisdiction Knobs)
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every assumption the engine does not get from the request:
      * soil presets (friction angle, unit weight, base friction, allowable
        bearing) for the two stiffness classes
      * material unit weights and practical section widths
      * minimum factors of safety
      * footing proportioning rules
      * search bounds
  - Jurisdiction-specific values belong here, never as literals in the
    physics code.

Hardening:
  - validate_or_throw() rejects nonsensical values before a run starts.
  - Defaults are conservative residential-practice values; override them
    through a settings file (settings_file.hpp).
================================================================================
*/

#include "engine/core/design_input.hpp"
#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"

#include <string>

namespace rwall {

// ----------------------------- Soil ------------------------------------------
struct SoilPreset {
  double friction_angle_deg = 30.0;
  double unit_weight_pcf = 120.0;
  double base_friction_coeff = 0.35;   // soil-to-footing friction
  double allowable_bearing_psf = 1500.0;

  void validate_or_throw(const std::string& name) const {
    if (friction_angle_deg < 15.0 || friction_angle_deg > 45.0) {
      throw ValidationError("SoilPreset(" + name + "): friction_angle_deg outside [15, 45]");
    }
    if (unit_weight_pcf < 80.0 || unit_weight_pcf > 150.0) {
      throw ValidationError("SoilPreset(" + name + "): unit_weight_pcf outside [80, 150]");
    }
    if (base_friction_coeff <= 0.0 || base_friction_coeff > 1.0) {
      throw ValidationError("SoilPreset(" + name + "): base_friction_coeff must be (0,1]");
    }
    if (allowable_bearing_psf < 500.0 || allowable_bearing_psf > 12000.0) {
      throw ValidationError("SoilPreset(" + name + "): allowable_bearing_psf outside [500, 12000]");
    }
  }
};

struct SoilPresets {
  SoilPreset stiff{34.0, 120.0, 0.40, 2000.0};
  SoilPreset soft{28.0, 110.0, 0.30, 1500.0};

  void validate_or_throw() const {
    stiff.validate_or_throw("stiff");
    soft.validate_or_throw("soft");
    // Stiff soil must produce the lower active coefficient.
    if (!(stiff.friction_angle_deg > soft.friction_angle_deg)) {
      throw ValidationError("SoilPresets: stiff friction angle must exceed soft friction angle");
    }
  }

  const SoilPreset& get(SoilStiffness s) const {
    switch (s) {
      case SoilStiffness::Stiff: return stiff;
      case SoilStiffness::Soft:  return soft;
    }
    RWALL_THROW(ErrorCode::kContractViolation, "SoilPresets: unhandled SoilStiffness");
  }
};

// ----------------------------- Materials -------------------------------------
struct MaterialSettings {
  double concrete_unit_weight_pcf = 150.0;
  double cmu_unit_weight_pcf = 130.0;      // fully grouted CMU
  double footing_unit_weight_pcf = 150.0;  // footings are cast concrete

  // Practical stem widths (inches).
  double concrete_min_width_in = 8.0;
  double concrete_max_width_in = 24.0;
  double cmu_min_width_in = 8.0;
  double cmu_max_width_in = 16.0;

  void validate_or_throw() const {
    if (concrete_unit_weight_pcf < 90.0 || concrete_unit_weight_pcf > 160.0) {
      throw ValidationError("MaterialSettings: concrete_unit_weight_pcf outside [90, 160]");
    }
    if (cmu_unit_weight_pcf < 60.0 || cmu_unit_weight_pcf > 150.0) {
      throw ValidationError("MaterialSettings: cmu_unit_weight_pcf outside [60, 150]");
    }
    if (footing_unit_weight_pcf < 90.0 || footing_unit_weight_pcf > 160.0) {
      throw ValidationError("MaterialSettings: footing_unit_weight_pcf outside [90, 160]");
    }
    if (concrete_min_width_in < 4.0 || concrete_max_width_in <= concrete_min_width_in ||
        concrete_max_width_in > 48.0) {
      throw ValidationError("MaterialSettings: invalid concrete width bounds");
    }
    if (cmu_min_width_in < 4.0 || cmu_max_width_in <= cmu_min_width_in || cmu_max_width_in > 48.0) {
      throw ValidationError("MaterialSettings: invalid CMU width bounds");
    }
  }

  double unit_weight_pcf(Material m) const {
    switch (m) {
      case Material::Concrete: return concrete_unit_weight_pcf;
      case Material::CMU:      return cmu_unit_weight_pcf;
    }
    RWALL_THROW(ErrorCode::kContractViolation, "MaterialSettings: unhandled Material");
  }

  double min_width_in(Material m) const {
    switch (m) {
      case Material::Concrete: return concrete_min_width_in;
      case Material::CMU:      return cmu_min_width_in;
    }
    RWALL_THROW(ErrorCode::kContractViolation, "MaterialSettings: unhandled Material");
  }

  double max_width_in(Material m) const {
    switch (m) {
      case Material::Concrete: return concrete_max_width_in;
      case Material::CMU:      return cmu_max_width_in;
    }
    RWALL_THROW(ErrorCode::kContractViolation, "MaterialSettings: unhandled Material");
  }
};

// ----------------------------- Safety ----------------------------------------
struct SafetySettings {
  double min_overturning = 1.5;
  double min_sliding = 1.5;
  double min_bearing = 1.0;

  void validate_or_throw() const {
    if (min_overturning < 1.0 || min_overturning > 5.0) {
      throw ValidationError("SafetySettings: min_overturning outside [1, 5]");
    }
    if (min_sliding < 1.0 || min_sliding > 5.0) {
      throw ValidationError("SafetySettings: min_sliding outside [1, 5]");
    }
    if (min_bearing < 1.0 || min_bearing > 5.0) {
      throw ValidationError("SafetySettings: min_bearing outside [1, 5]");
    }
  }
};

// ----------------------------- Surcharge -------------------------------------
struct SurchargeSettings {
  // Uniform live load from an adjacent slab or driveway.
  double slab_surcharge_psf = 100.0;

  // Slope dead load over the heel: gamma * tan(beta) * H * fraction.
  // 0.25 is the average rise of the slope over a run of H/2.
  double slope_load_fraction = 0.25;

  void validate_or_throw() const {
    if (slab_surcharge_psf < 0.0 || slab_surcharge_psf > 1000.0) {
      throw ValidationError("SurchargeSettings: slab_surcharge_psf outside [0, 1000]");
    }
    if (slope_load_fraction < 0.0 || slope_load_fraction > 1.0) {
      throw ValidationError("SurchargeSettings: slope_load_fraction outside [0, 1]");
    }
  }
};

// ----------------------------- Resistance ------------------------------------
struct ResistanceSettings {
  // Passive soil in front of the footing (embedment = footing thickness).
  bool include_passive = true;
  double passive_factor = 1.0;  // reduction applied to the passive resultant

  void validate_or_throw() const {
    if (passive_factor < 0.0 || passive_factor > 1.0) {
      throw ValidationError("ResistanceSettings: passive_factor must be [0,1]");
    }
  }
};

// ----------------------------- Footing rules ---------------------------------
struct FootingRules {
  double min_thickness_in = 10.0;
  double cover_in = 3.0;                 // minimum cover added to the height term
  double thickness_height_ratio = 0.06;  // thickness grows with wall height
  double min_toe_in = 6.0;
  double min_heel_in = 0.0;
  double max_footing_width_in = 240.0;   // toe + stem + heel

  void validate_or_throw() const {
    if (min_thickness_in < 6.0 || min_thickness_in > 48.0) {
      throw ValidationError("FootingRules: min_thickness_in outside [6, 48]");
    }
    if (cover_in < 0.0 || cover_in > 12.0) {
      throw ValidationError("FootingRules: cover_in outside [0, 12]");
    }
    if (thickness_height_ratio < 0.0 || thickness_height_ratio > 0.5) {
      throw ValidationError("FootingRules: thickness_height_ratio outside [0, 0.5]");
    }
    if (min_toe_in < 0.0 || min_toe_in > 120.0) {
      throw ValidationError("FootingRules: min_toe_in outside [0, 120]");
    }
    if (min_heel_in < 0.0 || min_heel_in > 120.0) {
      throw ValidationError("FootingRules: min_heel_in outside [0, 120]");
    }
    if (max_footing_width_in < 24.0 || max_footing_width_in > 600.0) {
      throw ValidationError("FootingRules: max_footing_width_in outside [24, 600]");
    }
  }
};

// ----------------------------- Search ----------------------------------------
struct SearchSettings {
  int max_sections = 3;
  double max_section_height_in = 48.0;
  double min_width_step_in = 2.0;        // seed of the width-step sweep
  double width_step_increment_in = 2.0;
  int max_sweep_steps = 50;

  void validate_or_throw() const {
    if (max_sections < 1 || max_sections > 3) {
      throw ValidationError("SearchSettings: max_sections must be 1..3");
    }
    if (max_section_height_in < 12.0 || max_section_height_in > 144.0) {
      throw ValidationError("SearchSettings: max_section_height_in outside [12, 144]");
    }
    if (min_width_step_in < 0.0 || min_width_step_in > 12.0) {
      throw ValidationError("SearchSettings: min_width_step_in outside [0, 12]");
    }
    if (width_step_increment_in <= 0.0 || width_step_increment_in > 12.0) {
      throw ValidationError("SearchSettings: width_step_increment_in must be (0, 12]");
    }
    if (max_sweep_steps < 1 || max_sweep_steps > 1000) {
      throw ValidationError("SearchSettings: max_sweep_steps must be 1..1000");
    }
  }
};

// ----------------------------- DesignSettings --------------------------------
struct DesignSettings {
  SoilPresets soils;
  MaterialSettings materials;
  SafetySettings safety;
  SurchargeSettings surcharge;
  ResistanceSettings resistance;
  FootingRules footing;
  SearchSettings search;

  void validate_or_throw() const {
    soils.validate_or_throw();
    materials.validate_or_throw();
    safety.validate_or_throw();
    surcharge.validate_or_throw();
    resistance.validate_or_throw();
    footing.validate_or_throw();
    search.validate_or_throw();

    // The seed step must produce a stem that fits every material.
    const double seed_base = search.min_width_step_in * static_cast<double>(search.max_sections);
    if (materials.concrete_min_width_in + seed_base > materials.concrete_max_width_in ||
        materials.cmu_min_width_in + seed_base > materials.cmu_max_width_in) {
      throw ValidationError("DesignSettings: min_width_step_in * max_sections exceeds the material width span");
    }
  }

  static DesignSettings defaults() {
    DesignSettings s;
    return s;
  }
};

}  // namespace rwall
