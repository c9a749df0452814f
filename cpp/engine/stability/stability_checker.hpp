#pragma once
/*
================================================================================
Fragment 2.6 — Stability: Overturning / Sliding / Bearing Checks
FILE: cpp/engine/stability/stability_checker.hpp

Purpose:
  - Evaluate one (sections, footing) candidate against the load case and
    return the three factors of safety plus a pass/fail verdict.

Factors:
  - overturning = resisting moment / overturning moment (about the toe)
  - sliding     = (mu * N_dead + passive) / (P_soil + P_slab)
  - bearing     = q_allow / q_max (trapezoidal or triangular distribution;
                  0 when the resultant leaves the base)

Verdict:
  - passed iff every factor meets its configured minimum. No averaging and
    no partial credit: one failing factor rejects the candidate.
  - Each factor also appears as a FactorCheck with a stable id
    ("FS.OVERTURNING", "FS.SLIDING", "FS.BEARING") for diagnostics.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/footing/footing.hpp"
#include "engine/loads/load_model.hpp"
#include "engine/sections/wall_section.hpp"
#include "engine/stability/wall_statics.hpp"

#include <string>
#include <vector>

namespace rwall {

inline constexpr const char* kFactorOverturning = "FS.OVERTURNING";
inline constexpr const char* kFactorSliding = "FS.SLIDING";
inline constexpr const char* kFactorBearing = "FS.BEARING";

enum class FactorVerdict : int { Pass = 0, Fail = 1 };

struct FactorCheck final {
  std::string id;
  FactorVerdict verdict = FactorVerdict::Fail;
  double value = 0.0;
  double minimum = 0.0;
  std::string message;
};

struct StabilityResult {
  double overturning_factor = 0.0;
  double sliding_factor = 0.0;
  double bearing_factor = 0.0;
  bool passed = false;

  std::vector<FactorCheck> checks;
  WallStatics statics{};

  // Ids of the factors below their minimum, in check order.
  std::vector<std::string> failing_factors() const;
};

const char* to_string(FactorVerdict v) noexcept;

StabilityResult evaluate_stability(const SectionStack& sections,
                                   const Footing& footing,
                                   const LoadCase& lc,
                                   const DesignSettings& settings);

}  // namespace rwall
