/*
================================================================================
Fragment 5.2 — Exports: Design Outcome CSV Implementation
FILE: cpp/engine/exports/design_report_csv.cpp
================================================================================
*/

#include "engine/exports/design_report_csv.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace rwall {

namespace {

constexpr int kSectionColumns = 3;

std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }
  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

std::string join_ids(const std::vector<std::string>& ids) {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += ';';
    out += id;
  }
  return out;
}

}  // namespace

std::string design_csv_header(const CsvExportOptions& opt) {
  std::ostringstream h;
  const char d = opt.delimiter;

  h << "height_in" << d << "material" << d << "surcharge" << d << "objective" << d << "soil" << d
    << "topping_depth_in" << d << "adjacent_slab" << d << "min_toe_in" << d;

  h << "Ka" << d << "surcharge_psf" << d << "soil_unit_weight_pcf" << d;

  h << "status" << d << "section_count" << d;
  for (int i = 1; i <= kSectionColumns; ++i) {
    h << "s" << i << "_height_in" << d << "s" << i << "_width_in" << d;
  }
  h << "toe_in" << d << "heel_in" << d << "thickness_in" << d << "footprint_in" << d;

  h << "fs_overturning" << d << "fs_sliding" << d << "fs_bearing" << d << "failing_factors" << d
    << "evaluations" << d << "fingerprint" << d << "reason";
  return h.str();
}

std::string design_to_csv_row(const DesignOutcome& o, const CsvExportOptions& opt) {
  std::ostringstream row;
  const char d = opt.delimiter;
  const int p = opt.precision;
  const DesignInput& in = o.input;

  row << csv_double(in.height_in, p) << d << to_string(in.material) << d << to_string(in.surcharge) << d
      << to_string(in.objective) << d << to_string(in.soil) << d << csv_double(in.topping_depth_in, p) << d
      << (in.has_adjacent_slab ? "1" : "0") << d << csv_double(in.toe_length_in, p) << d;

  row << csv_double(o.load_case.active_earth_pressure_coefficient, p) << d
      << csv_double(o.load_case.surcharge_load_psf, p) << d
      << csv_double(o.load_case.effective_soil_unit_weight_pcf, p) << d;

  row << to_string(o.status) << d;

  const StabilityResult* fs = nullptr;
  if (o.specification) {
    const WallSpecification& s = *o.specification;
    fs = &s.stability;
    row << s.sections.size() << d;
    for (int i = 0; i < kSectionColumns; ++i) {
      if (static_cast<std::size_t>(i) < s.sections.size()) {
        row << csv_double(s.sections[i].height_above_footing_in, p) << d << csv_double(s.sections[i].width_in, p)
            << d;
      } else {
        row << d << d;
      }
    }
    row << csv_double(s.footing.toe_in, p) << d << csv_double(s.footing.heel_in, p) << d
        << csv_double(s.footing.thickness_in, p) << d << csv_double(s.footing.footprint_in(), p) << d;
  } else {
    fs = &o.diagnosis.last_evaluated;
    row << d;
    for (int i = 0; i < kSectionColumns; ++i) row << d << d;
    row << d << d << d << d;
  }

  row << csv_double(fs->overturning_factor, p) << d << csv_double(fs->sliding_factor, p) << d
      << csv_double(fs->bearing_factor, p) << d << csv_escape(join_ids(fs->failing_factors()), d) << d
      << o.evaluations << d << (o.specification ? o.specification->fingerprint : std::string()) << d
      << csv_escape(o.diagnosis.reason, d);
  return row.str();
}

bool write_design_csv_file(const std::vector<DesignOutcome>& outcomes,
                           const std::string& file_path,
                           const CsvExportOptions& opt) {
  std::ofstream ofs(file_path);
  if (!ofs.is_open()) return false;

  if (opt.include_header) ofs << design_csv_header(opt) << "\n";
  for (const auto& o : outcomes) ofs << design_to_csv_row(o, opt) << "\n";

  return ofs.good();
}

}  // namespace rwall
