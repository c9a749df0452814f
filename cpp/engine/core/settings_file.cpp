#include "engine/core/settings_file.hpp"

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace rwall {

namespace {

using DoubleField = double* (*)(DesignSettings&);
using IntField = int* (*)(DesignSettings&);
using BoolField = bool* (*)(DesignSettings&);

struct DoubleEntry { const char* key; DoubleField field; };
struct IntEntry { const char* key; IntField field; };
struct BoolEntry { const char* key; BoolField field; };

const DoubleEntry kDoubleKeys[] = {
    {"soil.stiff.friction_angle_deg", [](DesignSettings& s) { return &s.soils.stiff.friction_angle_deg; }},
    {"soil.stiff.unit_weight_pcf", [](DesignSettings& s) { return &s.soils.stiff.unit_weight_pcf; }},
    {"soil.stiff.base_friction_coeff", [](DesignSettings& s) { return &s.soils.stiff.base_friction_coeff; }},
    {"soil.stiff.allowable_bearing_psf", [](DesignSettings& s) { return &s.soils.stiff.allowable_bearing_psf; }},
    {"soil.soft.friction_angle_deg", [](DesignSettings& s) { return &s.soils.soft.friction_angle_deg; }},
    {"soil.soft.unit_weight_pcf", [](DesignSettings& s) { return &s.soils.soft.unit_weight_pcf; }},
    {"soil.soft.base_friction_coeff", [](DesignSettings& s) { return &s.soils.soft.base_friction_coeff; }},
    {"soil.soft.allowable_bearing_psf", [](DesignSettings& s) { return &s.soils.soft.allowable_bearing_psf; }},

    {"materials.concrete_unit_weight_pcf", [](DesignSettings& s) { return &s.materials.concrete_unit_weight_pcf; }},
    {"materials.cmu_unit_weight_pcf", [](DesignSettings& s) { return &s.materials.cmu_unit_weight_pcf; }},
    {"materials.footing_unit_weight_pcf", [](DesignSettings& s) { return &s.materials.footing_unit_weight_pcf; }},
    {"materials.concrete_min_width_in", [](DesignSettings& s) { return &s.materials.concrete_min_width_in; }},
    {"materials.concrete_max_width_in", [](DesignSettings& s) { return &s.materials.concrete_max_width_in; }},
    {"materials.cmu_min_width_in", [](DesignSettings& s) { return &s.materials.cmu_min_width_in; }},
    {"materials.cmu_max_width_in", [](DesignSettings& s) { return &s.materials.cmu_max_width_in; }},

    {"safety.min_overturning", [](DesignSettings& s) { return &s.safety.min_overturning; }},
    {"safety.min_sliding", [](DesignSettings& s) { return &s.safety.min_sliding; }},
    {"safety.min_bearing", [](DesignSettings& s) { return &s.safety.min_bearing; }},

    {"surcharge.slab_surcharge_psf", [](DesignSettings& s) { return &s.surcharge.slab_surcharge_psf; }},
    {"surcharge.slope_load_fraction", [](DesignSettings& s) { return &s.surcharge.slope_load_fraction; }},

    {"resistance.passive_factor", [](DesignSettings& s) { return &s.resistance.passive_factor; }},

    {"footing.min_thickness_in", [](DesignSettings& s) { return &s.footing.min_thickness_in; }},
    {"footing.cover_in", [](DesignSettings& s) { return &s.footing.cover_in; }},
    {"footing.thickness_height_ratio", [](DesignSettings& s) { return &s.footing.thickness_height_ratio; }},
    {"footing.min_toe_in", [](DesignSettings& s) { return &s.footing.min_toe_in; }},
    {"footing.min_heel_in", [](DesignSettings& s) { return &s.footing.min_heel_in; }},
    {"footing.max_footing_width_in", [](DesignSettings& s) { return &s.footing.max_footing_width_in; }},

    {"search.max_section_height_in", [](DesignSettings& s) { return &s.search.max_section_height_in; }},
    {"search.min_width_step_in", [](DesignSettings& s) { return &s.search.min_width_step_in; }},
    {"search.width_step_increment_in", [](DesignSettings& s) { return &s.search.width_step_increment_in; }},
};

const IntEntry kIntKeys[] = {
    {"search.max_sections", [](DesignSettings& s) { return &s.search.max_sections; }},
    {"search.max_sweep_steps", [](DesignSettings& s) { return &s.search.max_sweep_steps; }},
};

const BoolEntry kBoolKeys[] = {
    {"resistance.include_passive", [](DesignSettings& s) { return &s.resistance.include_passive; }},
};

std::string_view trim(std::string_view s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

double parse_double(std::string_view key, std::string_view value) {
  const std::string buf(value);
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(buf.c_str(), &end);
  if (buf.empty() || end != buf.c_str() + buf.size() || errno == ERANGE) {
    RWALL_THROW(ErrorCode::kParseError,
                "setting '" + std::string(key) + "': not a number: '" + buf + "'");
  }
  return v;
}

int parse_int(std::string_view key, std::string_view value) {
  const std::string buf(value);
  errno = 0;
  char* end = nullptr;
  const long v = std::strtol(buf.c_str(), &end, 10);
  if (buf.empty() || end != buf.c_str() + buf.size() || errno == ERANGE ||
      v < -1000000L || v > 1000000L) {
    RWALL_THROW(ErrorCode::kParseError,
                "setting '" + std::string(key) + "': not an integer: '" + buf + "'");
  }
  return static_cast<int>(v);
}

bool parse_bool(std::string_view key, std::string_view value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  RWALL_THROW(ErrorCode::kParseError,
              "setting '" + std::string(key) + "': not a boolean: '" + std::string(value) + "'");
}

}  // namespace

void apply_setting(DesignSettings& s, std::string_view key, std::string_view value) {
  key = trim(key);
  value = trim(value);

  for (const auto& e : kDoubleKeys) {
    if (key == e.key) { *e.field(s) = parse_double(key, value); return; }
  }
  for (const auto& e : kIntKeys) {
    if (key == e.key) { *e.field(s) = parse_int(key, value); return; }
  }
  for (const auto& e : kBoolKeys) {
    if (key == e.key) { *e.field(s) = parse_bool(key, value); return; }
  }
  RWALL_THROW(ErrorCode::kParseError, "unknown setting '" + std::string(key) + "'");
}

DesignSettings parse_settings_text(std::string_view text,
                                   const DesignSettings& base,
                                   const std::string& origin) {
  DesignSettings out = base;
  std::string section;
  int line_no = 0;
  size_t applied = 0;

  size_t pos = 0;
  while (pos <= text.size()) {
    const size_t nl = text.find('\n', pos);
    const size_t stop = (nl == std::string_view::npos) ? text.size() : nl;
    std::string_view line = text.substr(pos, stop - pos);
    pos = stop + 1;
    ++line_no;

    const size_t comment = line.find_first_of("#;");
    if (comment != std::string_view::npos) line = line.substr(0, comment);
    line = trim(line);
    if (line.empty()) {
      if (nl == std::string_view::npos) break;
      continue;
    }

    if (line.front() == '[') {
      if (line.back() != ']') {
        RWALL_THROW(ErrorCode::kParseError,
                    origin + ":" + std::to_string(line_no) + ": unterminated section header");
      }
      section = std::string(trim(line.substr(1, line.size() - 2)));
      continue;
    }

    const size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
      RWALL_THROW(ErrorCode::kParseError,
                  origin + ":" + std::to_string(line_no) + ": expected 'key = value'");
    }

    const std::string_view raw_key = trim(line.substr(0, eq));
    const std::string key = section.empty() ? std::string(raw_key)
                                            : section + "." + std::string(raw_key);
    try {
      apply_setting(out, key, line.substr(eq + 1));
    } catch (const Error& e) {
      RWALL_THROW(ErrorCode::kParseError,
                  origin + ":" + std::to_string(line_no) + ": " + e.message());
    }
    ++applied;

    if (nl == std::string_view::npos) break;
  }

  out.validate_or_throw();

  std::ostringstream msg;
  msg << "applied " << applied << " override(s) from " << origin;
  log_debug("settings", msg.str());
  return out;
}

DesignSettings load_settings_file(const std::string& path, const DesignSettings& base) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IOError("load_settings_file: cannot open '" + path + "'");
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad()) {
    throw IOError("load_settings_file: read failed for '" + path + "'");
  }
  return parse_settings_text(buf.str(), base, path);
}

std::vector<std::string> known_setting_keys() {
  std::vector<std::string> keys;
  for (const auto& e : kDoubleKeys) keys.emplace_back(e.key);
  for (const auto& e : kIntKeys) keys.emplace_back(e.key);
  for (const auto& e : kBoolKeys) keys.emplace_back(e.key);
  return keys;
}

}  // namespace rwall
