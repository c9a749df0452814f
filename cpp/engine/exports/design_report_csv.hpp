#pragma once
/*
================================================================================
Fragment 5.2 — Exports: Design Outcome CSV
FILE: cpp/engine/exports/design_report_csv.hpp

Purpose:
  - One CSV row per design run (converged or infeasible) for batch sweeps and
    review spreadsheets.

Hardening:
  - Explicit CSV escaping for strings with delimiters/quotes/newlines.
  - Non-finite values and absent fields export as empty cells.
  - Units in column names; fixed column order (diff-friendly).
  - Sections are flattened to three (height, width) column pairs,
    bottom to top; unused pairs stay empty.

Columns:
  - Input: height_in, material, surcharge, objective, soil, topping_depth_in,
    adjacent_slab, min_toe_in
  - Load case: Ka, surcharge_psf, soil_unit_weight_pcf
  - Result: status, section_count, s{1..3}_height_in, s{1..3}_width_in,
    toe_in, heel_in, thickness_in, footprint_in
  - Factors: fs_overturning, fs_sliding, fs_bearing, failing_factors,
    evaluations, fingerprint, reason
================================================================================
*/

#include "engine/pipeline/design_engine.hpp"

#include <string>
#include <vector>

namespace rwall {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
  int precision = 4;
};

std::string design_csv_header(const CsvExportOptions& opt = CsvExportOptions());

// Row without trailing newline.
std::string design_to_csv_row(const DesignOutcome& o, const CsvExportOptions& opt = CsvExportOptions());

// Returns false on I/O error.
bool write_design_csv_file(const std::vector<DesignOutcome>& outcomes,
                           const std::string& file_path,
                           const CsvExportOptions& opt = CsvExportOptions());

}  // namespace rwall
