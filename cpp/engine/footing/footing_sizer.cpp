#include "engine/footing/footing_sizer.hpp"

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/units.hpp"
#include "engine/stability/wall_statics.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace rwall {

namespace {

// 3*M_net - B*V for a heel of h_ft feet. >= 0 means x_bar >= B/3.
double middle_third_margin(const SectionStack& sections, const LoadCase& lc, double toe_in,
                           double thickness_in, double h_ft, const ResistanceSettings& resistance) {
  Footing f;
  f.toe_in = toe_in;
  f.heel_in = units::feet_to_inches(h_ft);
  f.thickness_in = thickness_in;
  const WallStatics s = compute_wall_statics(sections, f, lc, resistance);
  return 3.0 * s.net_moment_ftlb - s.base_width_ft * s.bearing_vertical_lb;
}

// Smallest heel (ft) >= h_min with a non-negative margin.
double solve_heel_ft(const SectionStack& sections, const LoadCase& lc, double toe_in,
                     double thickness_in, double h_min_ft, const ResistanceSettings& resistance) {
  auto f = [&](double h) {
    return middle_third_margin(sections, lc, toe_in, thickness_in, h, resistance);
  };

  if (f(h_min_ft) >= 0.0) return h_min_ft;

  const double f0 = f(0.0);
  const double f1 = f(1.0);
  const double f2 = f(2.0);
  const double a = 0.5 * (f2 - 2.0 * f1 + f0);
  const double b = f1 - f0 - a;
  const double c = f0;

  if (std::fabs(a) < 1e-12) {
    RWALL_ENSURE(b > 0.0, ErrorCode::kInternal, "solve_heel_ft: margin does not grow with heel");
    return std::max(h_min_ft, -c / b);
  }

  // Leading coefficient is half the uniform heel load: always positive.
  RWALL_ENSURE(a > 0.0, ErrorCode::kInternal, "solve_heel_ft: unexpected margin curvature");
  const double disc = b * b - 4.0 * a * c;
  RWALL_ENSURE(disc >= 0.0, ErrorCode::kInternal, "solve_heel_ft: no real root");
  const double root = (-b + std::sqrt(disc)) / (2.0 * a);
  return std::max(h_min_ft, root);
}

}  // namespace

double footing_thickness_in(double total_height_in, const FootingRules& rules) {
  const double scaled = units::ceil_inch(rules.cover_in + rules.thickness_height_ratio * total_height_in);
  return std::max(rules.min_thickness_in, scaled);
}

ThicknessRange footing_thickness_range(double total_height_in, const FootingRules& rules) {
  ThicknessRange r;
  r.min_in = footing_thickness_in(total_height_in, rules);
  r.max_in = std::max(r.min_in, footing_thickness_in(kMaxWallHeightIn, rules));
  return r;
}

double footing_min_toe_in(double min_toe_in, const FootingRules& rules) {
  return units::ceil_inch(std::max(min_toe_in, rules.min_toe_in));
}

Footing size_footing(const SectionStack& sections,
                     const LoadCase& lc,
                     double min_toe_in,
                     const DesignSettings& settings) {
  RWALL_ENSURE(!sections.empty(), ErrorCode::kContractViolation, "size_footing: no sections");
  return size_footing(sections, lc, min_toe_in,
                      footing_thickness_in(stack_height_in(sections), settings.footing), settings);
}

Footing size_footing(const SectionStack& sections,
                     const LoadCase& lc,
                     double min_toe_in,
                     double thickness_in,
                     const DesignSettings& settings) {
  RWALL_ENSURE(std::isfinite(min_toe_in) && min_toe_in >= 0.0, ErrorCode::kContractViolation,
               "size_footing: min_toe_in must be >= 0");
  RWALL_ENSURE(!sections.empty(), ErrorCode::kContractViolation, "size_footing: no sections");
  RWALL_ENSURE(std::isfinite(thickness_in) && thickness_in > 0.0, ErrorCode::kContractViolation,
               "size_footing: thickness must be positive");

  const FootingRules& rules = settings.footing;

  Footing f;
  f.thickness_in = thickness_in;
  f.toe_in = footing_min_toe_in(min_toe_in, rules);

  const double heel_ft = solve_heel_ft(sections, lc, f.toe_in, f.thickness_in,
                                       units::inches_to_feet(rules.min_heel_in), settings.resistance);
  f.heel_in = units::ceil_inch(units::feet_to_inches(heel_ft));

  // Bearing ceiling: with the resultant in the middle third q_max <= 2V/B.
  const double ceiling = lc.allowable_bearing_psf / settings.safety.min_bearing;
  const WallStatics s = compute_wall_statics(sections, f, lc, settings.resistance);
  if (s.max_bearing_psf > ceiling) {
    // Each foot of toe adds footing weight and topping; B grows by the same foot.
    const double k = lc.footing_unit_weight_pcf * units::inches_to_feet(f.thickness_in) +
                     lc.topping_overburden_psf;
    const double denom = 1.0 - 2.0 * k / ceiling;
    if (denom > 0.0) {
      const double need_ft = (2.0 * s.bearing_vertical_lb / ceiling - s.base_width_ft) / denom;
      if (need_ft > 0.0) f.toe_in += units::ceil_inch(units::feet_to_inches(need_ft));
    } else {
      log_debug("footing", "toe extension cannot lower bearing below the ceiling");
    }
  }

  if (log_enabled(LogLevel::DEBUG)) {
    std::ostringstream oss;
    oss << "sized toe=" << f.toe_in << "in heel=" << f.heel_in << "in t=" << f.thickness_in << "in";
    log_debug("footing", oss.str());
  }
  return f;
}

}  // namespace rwall
