#include "engine/loads/load_model.hpp"

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/units.hpp"

#include <cmath>
#include <sstream>

namespace rwall {

double slope_angle_deg(Surcharge s) {
  // atan(rise / run) for H:V slopes.
  switch (s) {
    case Surcharge::Flat:     return 0.0;
    case Surcharge::Slope1_1: return std::atan(1.0) * units::rad_to_deg;
    case Surcharge::Slope1_2: return std::atan(0.5) * units::rad_to_deg;
    case Surcharge::Slope1_4: return std::atan(0.25) * units::rad_to_deg;
  }
  RWALL_THROW(ErrorCode::kContractViolation, "slope_angle_deg: unhandled Surcharge");
}

double rankine_active_coefficient(double friction_angle_deg, double slope_deg) {
  RWALL_ENSURE(friction_angle_deg > 0.0 && friction_angle_deg < 90.0, ErrorCode::kInvalidArgument,
               "rankine_active_coefficient: friction angle must be (0, 90)");
  RWALL_ENSURE(slope_deg >= 0.0 && slope_deg <= friction_angle_deg, ErrorCode::kInvalidArgument,
               "rankine_active_coefficient: slope must be within [0, phi]");

  const double phi = friction_angle_deg * units::deg_to_rad;
  if (slope_deg == 0.0) {
    const double t = std::tan(units::kPi / 4.0 - phi / 2.0);
    return t * t;
  }

  const double beta = slope_deg * units::deg_to_rad;
  const double cb = std::cos(beta);
  const double cp = std::cos(phi);
  const double root = std::sqrt(std::fmax(0.0, cb * cb - cp * cp));
  return cb * (cb - root) / (cb + root);
}

double rankine_passive_coefficient(double friction_angle_deg) {
  RWALL_ENSURE(friction_angle_deg > 0.0 && friction_angle_deg < 90.0, ErrorCode::kInvalidArgument,
               "rankine_passive_coefficient: friction angle must be (0, 90)");
  const double phi = friction_angle_deg * units::deg_to_rad;
  const double t = std::tan(units::kPi / 4.0 + phi / 2.0);
  return t * t;
}

LoadCase derive_load_case(const DesignInput& input, const DesignSettings& settings) {
  const SoilPreset& soil = settings.soils.get(input.soil);

  LoadCase lc;
  lc.friction_angle_deg = soil.friction_angle_deg;
  lc.effective_soil_unit_weight_pcf = soil.unit_weight_pcf;
  lc.base_friction_coefficient = soil.base_friction_coeff;
  lc.allowable_bearing_psf = soil.allowable_bearing_psf;

  lc.backfill_slope_deg = slope_angle_deg(input.surcharge);
  lc.design_slope_deg = lc.backfill_slope_deg;
  if (lc.design_slope_deg > lc.friction_angle_deg) {
    lc.design_slope_deg = lc.friction_angle_deg;
    lc.slope_clamped = true;
  }

  lc.active_earth_pressure_coefficient =
      rankine_active_coefficient(lc.friction_angle_deg, lc.design_slope_deg);
  lc.passive_earth_pressure_coefficient = rankine_passive_coefficient(lc.friction_angle_deg);

  const double H_ft = units::inches_to_feet(input.height_in);
  const double tan_beta = std::tan(lc.backfill_slope_deg * units::deg_to_rad);
  lc.slope_dead_load_psf =
      lc.effective_soil_unit_weight_pcf * tan_beta * H_ft * settings.surcharge.slope_load_fraction;
  lc.slab_live_load_psf = input.has_adjacent_slab ? settings.surcharge.slab_surcharge_psf : 0.0;
  lc.surcharge_load_psf = lc.slope_dead_load_psf + lc.slab_live_load_psf;

  lc.topping_overburden_psf =
      lc.effective_soil_unit_weight_pcf * units::inches_to_feet(input.topping_depth_in);

  lc.retained_height_in = input.height_in;
  lc.material = input.material;
  lc.stem_unit_weight_pcf = settings.materials.unit_weight_pcf(input.material);
  lc.footing_unit_weight_pcf = settings.materials.footing_unit_weight_pcf;

  if (lc.slope_clamped) {
    std::ostringstream w;
    w << "backfill slope " << lc.backfill_slope_deg << " deg exceeds friction angle "
      << lc.friction_angle_deg << " deg; Ka uses the limit value at beta = phi";
    log_warn("loads", w.str());
  }
  if (log_enabled(LogLevel::DEBUG)) log_debug("loads", lc.describe());

  return lc;
}

std::string LoadCase::describe() const {
  std::ostringstream oss;
  oss << "Ka=" << active_earth_pressure_coefficient
      << " Kp=" << passive_earth_pressure_coefficient
      << " gamma=" << effective_soil_unit_weight_pcf << "pcf"
      << " phi=" << friction_angle_deg << "deg"
      << " beta=" << design_slope_deg << "deg"
      << " q=" << surcharge_load_psf << "psf"
      << " (slope " << slope_dead_load_psf << ", slab " << slab_live_load_psf << ")"
      << " topping=" << topping_overburden_psf << "psf"
      << " mu=" << base_friction_coefficient
      << " q_allow=" << allowable_bearing_psf << "psf";
  return oss.str();
}

}  // namespace rwall
