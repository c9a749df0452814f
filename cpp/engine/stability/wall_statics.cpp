#include "engine/stability/wall_statics.hpp"

#include "engine/core/error.hpp"
#include "engine/core/units.hpp"

#include <cmath>
#include <limits>

namespace rwall {

namespace {

struct Load {
  double w = 0.0;    // lb/ft
  double arm = 0.0;  // ft from toe
};

}  // namespace

WallStatics compute_wall_statics(const SectionStack& sections,
                                 const Footing& footing,
                                 const LoadCase& lc,
                                 const ResistanceSettings& resistance) {
  RWALL_ENSURE(!sections.empty(), ErrorCode::kContractViolation, "compute_wall_statics: no sections");
  RWALL_ENSURE(footing.thickness_in > 0.0 && footing.toe_in >= 0.0 && footing.heel_in >= 0.0,
               ErrorCode::kContractViolation, "compute_wall_statics: invalid footing");

  using units::inches_to_feet;

  const double toe = inches_to_feet(footing.toe_in);
  const double heel = inches_to_feet(footing.heel_in);
  const double t = inches_to_feet(footing.thickness_in);
  const double w0 = inches_to_feet(stack_base_width_in(sections));
  const double H = inches_to_feet(stack_height_in(sections));
  const double gamma = lc.effective_soil_unit_weight_pcf;

  WallStatics s;
  s.base_width_ft = toe + w0 + heel;
  s.base_height_ft = H + t;
  s.stem_height_ft = H;

  const double B = s.base_width_ft;
  const double heel_start = toe + w0;
  const double heel_arm = heel_start + heel / 2.0;

  double M_r = 0.0;
  auto add = [&](const Load& l) { M_r += l.w * l.arm; };

  for (const auto& sec : sections) {
    const double w = inches_to_feet(sec.width_in);
    const double h = inches_to_feet(sec.height_above_footing_in);
    const Load stem{lc.stem_unit_weight_pcf * w * h, toe + w / 2.0};
    s.stem_weight_lb += stem.w;
    add(stem);

    // Backfill occupying the step behind a section narrower than the base.
    const double gap = w0 - w;
    if (gap > 0.0) {
      const Load step{gamma * h * gap, toe + w + gap / 2.0};
      s.step_soil_weight_lb += step.w;
      add(step);
    }
  }

  const Load slab_w{lc.footing_unit_weight_pcf * t * B, B / 2.0};
  s.footing_weight_lb = slab_w.w;
  add(slab_w);

  const Load heel_soil{gamma * H * heel, heel_arm};
  s.heel_soil_weight_lb = heel_soil.w;
  add(heel_soil);

  const Load slope{lc.slope_dead_load_psf * heel, heel_arm};
  s.slope_surcharge_lb = slope.w;
  add(slope);

  s.dead_load_lb = s.stem_weight_lb + s.step_soil_weight_lb + s.footing_weight_lb +
                   s.heel_soil_weight_lb + s.slope_surcharge_lb;
  s.resisting_moment_ftlb = M_r;

  // Lateral thrust over the full base height.
  const double Ka = lc.active_earth_pressure_coefficient;
  const double Hb = s.base_height_ft;
  s.soil_thrust_lb = 0.5 * Ka * gamma * Hb * Hb;
  s.slab_thrust_lb = Ka * lc.slab_live_load_psf * Hb;
  s.driving_force_lb = s.soil_thrust_lb + s.slab_thrust_lb;
  s.overturning_moment_ftlb = s.soil_thrust_lb * Hb / 3.0 + s.slab_thrust_lb * Hb / 2.0;

  if (resistance.include_passive) {
    s.passive_resistance_lb = 0.5 * lc.passive_earth_pressure_coefficient * gamma * t * t *
                              resistance.passive_factor;
  }

  // Bearing-only loads.
  s.slab_vertical_lb = lc.slab_live_load_psf * heel;
  s.topping_weight_lb = lc.topping_overburden_psf * toe;
  s.bearing_extra_moment_ftlb = s.slab_vertical_lb * heel_arm + s.topping_weight_lb * toe / 2.0;

  s.bearing_vertical_lb = s.dead_load_lb + s.slab_vertical_lb + s.topping_weight_lb;
  s.net_moment_ftlb = s.resisting_moment_ftlb + s.bearing_extra_moment_ftlb - s.overturning_moment_ftlb;

  const double V = s.bearing_vertical_lb;
  RWALL_ENSURE(V > 0.0 && B > 0.0, ErrorCode::kInternal, "compute_wall_statics: non-positive base load");

  const double x_bar = s.net_moment_ftlb / V;
  s.resultant_from_toe_ft = x_bar;
  s.eccentricity_ft = B / 2.0 - x_bar;
  s.resultant_within_base = (x_bar > 0.0 && x_bar < B);

  const double e_abs = std::fabs(s.eccentricity_ft);
  s.resultant_in_middle_third = (e_abs <= B / 6.0);

  if (!s.resultant_within_base) {
    s.max_bearing_psf = std::numeric_limits<double>::infinity();
  } else if (s.resultant_in_middle_third) {
    // Trapezoidal distribution.
    s.max_bearing_psf = V / B * (1.0 + 6.0 * e_abs / B);
  } else if (s.eccentricity_ft > 0.0) {
    // Triangular, compressed toward the toe.
    s.max_bearing_psf = 2.0 * V / (3.0 * x_bar);
  } else {
    s.max_bearing_psf = 2.0 * V / (3.0 * (B - x_bar));
  }

  return s;
}

}  // namespace rwall
