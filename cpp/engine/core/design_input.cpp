#include "engine/core/design_input.hpp"

#include "engine/core/error.hpp"

#include <cctype>
#include <cmath>
#include <sstream>

namespace rwall {

namespace {

std::string lower_copy(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

[[noreturn]] void unknown_value(const char* what, std::string_view text) {
  RWALL_THROW(ErrorCode::kParseError,
              std::string("unknown ") + what + " '" + std::string(text) + "'");
}

bool in_range(double v, double lo, double hi) {
  return std::isfinite(v) && v >= lo && v <= hi;
}

}  // namespace

const char* to_string(Material m) noexcept {
  switch (m) {
    case Material::Concrete: return "Concrete";
    case Material::CMU:      return "CMU";
    default:                 return "Unknown";
  }
}

const char* to_string(Surcharge s) noexcept {
  switch (s) {
    case Surcharge::Flat:     return "Flat";
    case Surcharge::Slope1_1: return "Slope1_1";
    case Surcharge::Slope1_2: return "Slope1_2";
    case Surcharge::Slope1_4: return "Slope1_4";
    default:                  return "Unknown";
  }
}

const char* to_string(OptimizationObjective o) noexcept {
  switch (o) {
    case OptimizationObjective::MinimizeExcavation: return "MinimizeExcavation";
    case OptimizationObjective::MinimizeFooting:    return "MinimizeFooting";
    default:                                        return "Unknown";
  }
}

const char* to_string(SoilStiffness s) noexcept {
  switch (s) {
    case SoilStiffness::Stiff: return "Stiff";
    case SoilStiffness::Soft:  return "Soft";
    default:                   return "Unknown";
  }
}

Material parse_material(std::string_view text) {
  const std::string t = lower_copy(text);
  if (t == "concrete") return Material::Concrete;
  if (t == "cmu" || t == "block") return Material::CMU;
  unknown_value("material", text);
}

Surcharge parse_surcharge(std::string_view text) {
  const std::string t = lower_copy(text);
  if (t == "flat" || t == "none") return Surcharge::Flat;
  if (t == "slope1_1" || t == "1:1") return Surcharge::Slope1_1;
  // Rise over run; the H:V spelling (2:1, 4:1) is accepted as well.
  if (t == "slope1_2" || t == "1:2" || t == "2:1") return Surcharge::Slope1_2;
  if (t == "slope1_4" || t == "1:4" || t == "4:1") return Surcharge::Slope1_4;
  unknown_value("surcharge", text);
}

OptimizationObjective parse_objective(std::string_view text) {
  const std::string t = lower_copy(text);
  if (t == "minimizeexcavation" || t == "excavation") return OptimizationObjective::MinimizeExcavation;
  if (t == "minimizefooting" || t == "footing") return OptimizationObjective::MinimizeFooting;
  unknown_value("objective", text);
}

SoilStiffness parse_soil(std::string_view text) {
  const std::string t = lower_copy(text);
  if (t == "stiff") return SoilStiffness::Stiff;
  if (t == "soft") return SoilStiffness::Soft;
  unknown_value("soil stiffness", text);
}

void DesignInput::validate_or_throw() const {
  if (!in_range(height_in, kMinWallHeightIn, kMaxWallHeightIn)) {
    throw ValidationError("DesignInput: height_in must be within [24, 144]");
  }
  if (!in_range(topping_depth_in, 0.0, kMaxToppingDepthIn)) {
    throw ValidationError("DesignInput: topping_depth_in must be within [0, 24]");
  }
  if (!in_range(toe_length_in, 0.0, kMaxToeLengthIn)) {
    throw ValidationError("DesignInput: toe_length_in must be within [0, 120]");
  }
  if (material != Material::Concrete && material != Material::CMU) {
    throw ValidationError("DesignInput: material out of enum range");
  }
  switch (surcharge) {
    case Surcharge::Flat:
    case Surcharge::Slope1_1:
    case Surcharge::Slope1_2:
    case Surcharge::Slope1_4:
      break;
    default:
      throw ValidationError("DesignInput: surcharge out of enum range");
  }
  if (objective != OptimizationObjective::MinimizeExcavation &&
      objective != OptimizationObjective::MinimizeFooting) {
    throw ValidationError("DesignInput: objective out of enum range");
  }
  if (soil != SoilStiffness::Stiff && soil != SoilStiffness::Soft) {
    throw ValidationError("DesignInput: soil out of enum range");
  }
}

std::string DesignInput::describe() const {
  std::ostringstream oss;
  oss << "height=" << height_in << "in"
      << " material=" << to_string(material)
      << " surcharge=" << to_string(surcharge)
      << " soil=" << to_string(soil)
      << " objective=" << to_string(objective)
      << " topping=" << topping_depth_in << "in"
      << " slab=" << (has_adjacent_slab ? "yes" : "no")
      << " min_toe=" << toe_length_in << "in";
  return oss.str();
}

}  // namespace rwall
