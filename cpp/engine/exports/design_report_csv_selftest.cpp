/*
  Fragment 5.2 — Design CSV Selftest

  Checks:
    1) Header and rows have the same column count, converged or infeasible.
    2) Converged rows carry the footing and fingerprint; infeasible rows leave
       geometry empty but keep the failing factors.
    3) The file writer emits header + one line per outcome.

  Non-zero return code indicates failure.
*/

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/exports/design_report_csv.hpp"
#include "engine/pipeline/design_engine.hpp"

namespace rwall {
namespace {

using namespace selftest;

std::size_t count_columns(const std::string& line) {
  std::size_t n = 1;
  bool quoted = false;
  for (char c : line) {
    if (c == '"') quoted = !quoted;
    else if (c == ',' && !quoted) ++n;
  }
  return n;
}

std::vector<std::string> split(const std::string& line) {
  std::vector<std::string> out(1);
  for (char c : line) {
    if (c == ',') out.emplace_back();
    else out.back() += c;
  }
  return out;
}

DesignOutcome converged_outcome() {
  DesignInput in;
  in.height_in = 48.0;
  in.toe_length_in = 12.0;
  return run_design(in);
}

DesignOutcome infeasible_outcome() {
  DesignInput in;
  in.height_in = 144.0;
  in.surcharge = Surcharge::Slope1_1;
  in.soil = SoilStiffness::Soft;
  return run_design(in);
}

void test_columns() {
  const std::string header = design_csv_header();
  const DesignOutcome ok = converged_outcome();
  const DesignOutcome bad = infeasible_outcome();
  expect_true(ok.converged() && !bad.converged(), "fixtures cover both outcomes");

  const std::size_t n = count_columns(header);
  expect_true(n == 30, "header has 30 columns");
  expect_true(count_columns(design_to_csv_row(ok)) == n, "converged row matches the header");
  expect_true(count_columns(design_to_csv_row(bad)) == n, "infeasible row matches the header");
}

void test_cells() {
  const std::vector<std::string> header = split(design_csv_header());
  const std::vector<std::string> ok = split(design_to_csv_row(converged_outcome()));
  const std::vector<std::string> bad = split(design_to_csv_row(infeasible_outcome()));

  auto col = [&header](const std::string& name) {
    for (std::size_t i = 0; i < header.size(); ++i)
      if (header[i] == name) return i;
    return header.size();
  };

  expect_eq_str(ok[col("status")], "Converged", "converged status cell");
  expect_eq_str(ok[col("toe_in")], "12.0000", "toe cell with fixed precision");
  expect_eq_str(ok[col("section_count")], "1", "section count cell");
  expect_eq_str(ok[col("s2_height_in")], "", "unused section pair left empty");
  expect_true(ok[col("fingerprint")].size() == 16, "fingerprint cell");

  expect_eq_str(bad[col("status")], "Infeasible", "infeasible status cell");
  expect_eq_str(bad[col("toe_in")], "", "infeasible row has no footing");
  expect_true(bad[col("failing_factors")].find("FS.SLIDING") != std::string::npos,
              "infeasible row names the failing factors");
}

void test_file_writer() {
  const std::filesystem::path path = std::filesystem::temp_directory_path() / "rwall_design_csv_selftest.csv";
  const std::vector<DesignOutcome> outcomes = {converged_outcome(), infeasible_outcome()};
  expect_true(write_design_csv_file(outcomes, path.string()), "csv file written");

  std::ifstream in(path);
  std::string line;
  int lines = 0;
  while (std::getline(in, line)) ++lines;
  expect_true(lines == 3, "header + two rows");
  in.close();

  std::error_code ec;
  std::filesystem::remove(path, ec);

  expect_true(!write_design_csv_file(outcomes, "/nonexistent/rwall/out.csv"), "unwritable path reports failure");
}

}  // namespace
}  // namespace rwall

int main() {
  using namespace rwall;
  set_log_level(LogLevel::ERROR);

  test_columns();
  test_cells();
  test_file_writer();

  return selftest::finish();
}
