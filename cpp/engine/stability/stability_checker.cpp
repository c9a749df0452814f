#include "engine/stability/stability_checker.hpp"

#include "engine/core/error.hpp"

#include <cmath>
#include <sstream>

namespace rwall {

namespace {

FactorCheck check_min(const char* id, double value, double minimum) {
  FactorCheck c;
  c.id = id;
  c.value = value;
  c.minimum = minimum;
  if (value >= minimum) {
    c.verdict = FactorVerdict::Pass;
  } else {
    c.verdict = FactorVerdict::Fail;
    std::ostringstream oss;
    oss << id << " " << value << " < " << minimum;
    c.message = oss.str();
  }
  return c;
}

}  // namespace

const char* to_string(FactorVerdict v) noexcept {
  switch (v) {
    case FactorVerdict::Pass: return "PASS";
    case FactorVerdict::Fail: return "FAIL";
  }
  return "UNKNOWN";
}

std::vector<std::string> StabilityResult::failing_factors() const {
  std::vector<std::string> out;
  for (const auto& c : checks) {
    if (c.verdict == FactorVerdict::Fail) out.push_back(c.id);
  }
  return out;
}

StabilityResult evaluate_stability(const SectionStack& sections,
                                   const Footing& footing,
                                   const LoadCase& lc,
                                   const DesignSettings& settings) {
  StabilityResult r;
  r.statics = compute_wall_statics(sections, footing, lc, settings.resistance);
  const WallStatics& s = r.statics;

  RWALL_ENSURE(s.overturning_moment_ftlb > 0.0 && s.driving_force_lb > 0.0, ErrorCode::kInternal,
               "evaluate_stability: lateral load must be positive");

  r.overturning_factor = s.resisting_moment_ftlb / s.overturning_moment_ftlb;
  r.sliding_factor = (lc.base_friction_coefficient * s.dead_load_lb + s.passive_resistance_lb) /
                     s.driving_force_lb;
  r.bearing_factor = std::isfinite(s.max_bearing_psf) ? lc.allowable_bearing_psf / s.max_bearing_psf : 0.0;

  const SafetySettings& fs = settings.safety;
  r.checks.push_back(check_min(kFactorOverturning, r.overturning_factor, fs.min_overturning));
  r.checks.push_back(check_min(kFactorSliding, r.sliding_factor, fs.min_sliding));
  r.checks.push_back(check_min(kFactorBearing, r.bearing_factor, fs.min_bearing));

  r.passed = true;
  for (const auto& c : r.checks) {
    if (c.verdict != FactorVerdict::Pass) r.passed = false;
  }
  return r;
}

}  // namespace rwall
