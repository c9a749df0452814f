#include "engine/specification/spec_fingerprint.hpp"

#include <cstdint>

namespace rwall {

Hash64 fingerprint_specification(const WallSpecification& spec) {
  Fnv1a64 h;
  h.update_tag("WallSpecification/v1");

  h.update_tag("Wall");
  h.update_f64(spec.total_height_in);
  h.update_enum(spec.material);
  h.update_enum(spec.objective);

  h.update_tag("Sections");
  h.update_u64(static_cast<uint64_t>(spec.sections.size()));
  for (const auto& s : spec.sections) {
    h.update_f64(s.height_above_footing_in);
    h.update_f64(s.width_in);
    h.update_u8(0x1E);
  }

  h.update_tag("Footing");
  h.update_f64(spec.footing.toe_in);
  h.update_f64(spec.footing.heel_in);
  h.update_f64(spec.footing.thickness_in);

  h.update_tag("LoadCase");
  h.update_f64(spec.load_case.active_earth_pressure_coefficient);
  h.update_f64(spec.load_case.surcharge_load_psf);
  h.update_f64(spec.load_case.effective_soil_unit_weight_pcf);
  h.update_f64(spec.load_case.topping_overburden_psf);

  h.update_tag("Stability");
  h.update_f64(spec.stability.overturning_factor);
  h.update_f64(spec.stability.sliding_factor);
  h.update_f64(spec.stability.bearing_factor);
  h.update_bool(spec.stability.passed);

  return Hash64{h.value()};
}

std::string fingerprint_specification_hex(const WallSpecification& spec) {
  return hash_to_hex(fingerprint_specification(spec));
}

}  // namespace rwall
