#pragma once
/*
================================================================================
Fragment 1.5 — Core: Design Input Schema
FILE: cpp/engine/core/design_input.hpp

Purpose:
  - The single request record the engine consumes for one design run:
    wall height, material, backfill slope class, objective, soil class,
    topping depth, adjacent slab flag and the user's minimum toe.
  - Enum <-> string helpers shared by the CLI, the settings loader and the
    exporters.

Hardening:
  - Explicit units (inches) in every field name.
  - validate_or_throw() enforces the published ranges; the engine entry point
    refuses to start on an input that fails it.
================================================================================
*/

#include <string>
#include <string_view>

#include "engine/core/errors.hpp"

namespace rwall {

enum class Material : int { Concrete = 0, CMU = 1 };

// Backfill slope above the wall, expressed as horizontal:vertical (H:V).
enum class Surcharge : int { Flat = 0, Slope1_1 = 1, Slope1_2 = 2, Slope1_4 = 3 };

enum class OptimizationObjective : int { MinimizeExcavation = 0, MinimizeFooting = 1 };

enum class SoilStiffness : int { Stiff = 0, Soft = 1 };

const char* to_string(Material m) noexcept;
const char* to_string(Surcharge s) noexcept;
const char* to_string(OptimizationObjective o) noexcept;
const char* to_string(SoilStiffness s) noexcept;

// Case-insensitive. Accept the enum spelling plus the short forms used on the
// command line ("concrete", "cmu", "flat", "1:1", "2:1", "excavation", ...).
// Throw rwall::Error(kParseError) on anything else.
Material parse_material(std::string_view text);
Surcharge parse_surcharge(std::string_view text);
OptimizationObjective parse_objective(std::string_view text);
SoilStiffness parse_soil(std::string_view text);

// Input limits (inches).
inline constexpr double kMinWallHeightIn = 24.0;
inline constexpr double kMaxWallHeightIn = 144.0;
inline constexpr double kMaxToppingDepthIn = 24.0;
inline constexpr double kMaxToeLengthIn = 120.0;

struct DesignInput {
  double height_in = 48.0;
  Material material = Material::Concrete;
  Surcharge surcharge = Surcharge::Flat;
  OptimizationObjective objective = OptimizationObjective::MinimizeExcavation;
  SoilStiffness soil = SoilStiffness::Stiff;
  double topping_depth_in = 0.0;
  bool has_adjacent_slab = false;

  // Lower bound on the footing toe, never a fixed value.
  double toe_length_in = 0.0;

  void validate_or_throw() const;

  // One-line summary for logs and CLI output.
  std::string describe() const;
};

}  // namespace rwall
