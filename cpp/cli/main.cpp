/*
================================================================================
Fragment 6.1 — CLI: Main Entry Point (rwall_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line harness for the retaining wall design engine:
    * design  - run one design and print the specification or diagnosis
    * sweep   - run a height range and write one CSV row per height
    * loads   - print the derived load case for an input
    * help    - show usage

Usage:
  rwall_cli <command> [--height <in>] [--material concrete|cmu]
            [--surcharge flat|1:1|1:2|1:4] [--objective excavation|footing]
            [--soil stiff|soft] [--topping <in>] [--slab 0|1] [--toe <in>]
            [--settings <file>] [--log-level debug|info|warn|error|off]
  sweep only: [--from <in>] [--to <in>] [--step <in>] [--out <csv>]

Hardening:
  - Explicit exit codes for CI integration (cli/exit_codes.hpp); infeasible
    designs exit with 5, a malformed settings file with 2.
  - Input is validated here, before the engine sees it.
================================================================================
*/

#include "cli/exit_codes.hpp"
#include "engine/core/design_input.hpp"
#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/settings_file.hpp"
#include "engine/exports/design_report_csv.hpp"
#include "engine/loads/load_model.hpp"
#include "engine/pipeline/design_engine.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace rwall;

using cli::ExitCode;

struct Args {
  DesignInput input;
  std::string settings_path;
  std::string log_level;

  // sweep
  double from_in = kMinWallHeightIn;
  double to_in = kMaxWallHeightIn;
  double step_in = 12.0;
  std::string out_path;
};

static void print_help() {
  std::cout << R"(
rwall_cli - Retaining Wall Design Engine

Usage:
  rwall_cli <command> [options]

Commands:
  design        Design one wall and print the specification
  sweep         Design a range of heights and write a CSV report
  loads         Print the derived load case
  help          Show this help message

Options:
  --height <in>          Retained height, 24..144 (default 48)
  --material <m>         concrete | cmu
  --surcharge <s>        flat | 1:1 | 1:2 | 1:4
  --objective <o>        excavation | footing
  --soil <s>             stiff | soft
  --topping <in>         Topping depth over the toe, 0..24
  --slab <0|1>           Adjacent slab surcharge
  --toe <in>             Minimum toe length, 0..120
  --settings <file>      key = value settings overrides
  --log-level <level>    debug | info | warn | error | off

Sweep options:
  --from <in> --to <in> --step <in> --out <file.csv>

Examples:
  rwall_cli design --height 48 --material concrete --toe 12
  rwall_cli sweep --from 24 --to 144 --step 12 --out sweep.csv

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
  4 - I/O error
  5 - No compliant design for these parameters
)";
}

static bool parse_bool01(const char* s, bool* out) {
  if (!s || !out) return false;
  if (std::strcmp(s, "1") == 0) { *out = true; return true; }
  if (std::strcmp(s, "0") == 0) { *out = false; return true; }
  return false;
}

static bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

static bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

static bool parse_args(int argc, char** argv, int first, Args* a, std::string* err) {
  struct NumberFlag {
    const char* name;
    double* target;
  };
  const NumberFlag numbers[] = {
      {"--height", &a->input.height_in},     {"--topping", &a->input.topping_depth_in},
      {"--toe", &a->input.toe_length_in},    {"--from", &a->from_in},
      {"--to", &a->to_in},                   {"--step", &a->step_in},
  };

  for (int i = first; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    bool matched = false;
    for (const auto& f : numbers) {
      if (std::strcmp(k, f.name) != 0) continue;
      matched = true;
      if (!get_next(i, argc, argv, &v)) { *err = std::string(k) + " requires a value"; return false; }
      if (!parse_double(v, f.target)) { *err = std::string(k) + " must be a finite number"; return false; }
      break;
    }
    if (matched) continue;

    if (std::strcmp(k, "--slab") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--slab requires 0|1"; return false; }
      if (!parse_bool01(v, &a->input.has_adjacent_slab)) { *err = "--slab must be 0 or 1"; return false; }
      continue;
    }

    const bool is_enum = std::strcmp(k, "--material") == 0 || std::strcmp(k, "--surcharge") == 0 ||
                         std::strcmp(k, "--objective") == 0 || std::strcmp(k, "--soil") == 0;
    if (is_enum) {
      if (!get_next(i, argc, argv, &v)) { *err = std::string(k) + " requires a value"; return false; }
      try {
        if (std::strcmp(k, "--material") == 0) a->input.material = parse_material(v);
        else if (std::strcmp(k, "--surcharge") == 0) a->input.surcharge = parse_surcharge(v);
        else if (std::strcmp(k, "--objective") == 0) a->input.objective = parse_objective(v);
        else a->input.soil = parse_soil(v);
      } catch (const Error& e) {
        *err = e.message();
        return false;
      }
      continue;
    }

    if (std::strcmp(k, "--settings") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--settings requires a path"; return false; }
      a->settings_path = v;
      continue;
    }

    if (std::strcmp(k, "--log-level") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--log-level requires a value"; return false; }
      a->log_level = v;
      continue;
    }

    if (std::strcmp(k, "--out") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--out requires a path"; return false; }
      a->out_path = v;
      continue;
    }

    *err = std::string("Unknown argument: ") + k;
    return false;
  }
  return true;
}

static int report_failure(const std::exception& e) {
  const ExitCode code = cli::exit_code_for(e);
  std::cerr << cli::exit_code_label(code) << ": " << e.what() << "\n";
  return code;
}

static DesignSettings resolve_settings(const Args& a) {
  if (a.settings_path.empty()) return DesignSettings::defaults();
  return load_settings_file(a.settings_path);
}

static int cmd_design(const Args& a) {
  try {
    const DesignSettings settings = resolve_settings(a);
    a.input.validate_or_throw();

    const DesignOutcome out = run_design(a.input, settings);
    std::cout << out.summary();
    if (!out.converged()) {
      std::cout << "\nUnable to generate a compliant design for these parameters.\n";
      return ExitCode::DESIGN_INFEASIBLE;
    }
    return ExitCode::SUCCESS;

  } catch (const std::exception& e) {
    return report_failure(e);
  }
}

static int cmd_loads(const Args& a) {
  try {
    const DesignSettings settings = resolve_settings(a);
    a.input.validate_or_throw();

    const LoadCase lc = derive_load_case(a.input, settings);
    std::cout << "input: " << a.input.describe() << "\n";
    std::cout << "Ka:                 " << lc.active_earth_pressure_coefficient << "\n";
    std::cout << "Kp:                 " << lc.passive_earth_pressure_coefficient << "\n";
    std::cout << "soil unit weight:   " << lc.effective_soil_unit_weight_pcf << " pcf\n";
    std::cout << "friction angle:     " << lc.friction_angle_deg << " deg\n";
    std::cout << "backfill slope:     " << lc.backfill_slope_deg << " deg"
              << (lc.slope_clamped ? " (clamped to friction angle for Ka)" : "") << "\n";
    std::cout << "surcharge load:     " << lc.surcharge_load_psf << " psf (slope "
              << lc.slope_dead_load_psf << ", slab " << lc.slab_live_load_psf << ")\n";
    std::cout << "topping overburden: " << lc.topping_overburden_psf << " psf\n";
    std::cout << "base friction:      " << lc.base_friction_coefficient << "\n";
    std::cout << "allowable bearing:  " << lc.allowable_bearing_psf << " psf\n";
    return ExitCode::SUCCESS;

  } catch (const std::exception& e) {
    return report_failure(e);
  }
}

static int cmd_sweep(const Args& a) {
  if (a.out_path.empty()) {
    std::cerr << "sweep requires --out <file.csv>\n";
    return ExitCode::INVALID_ARGS;
  }
  if (a.step_in <= 0.0 || a.to_in < a.from_in) {
    std::cerr << "sweep requires --step > 0 and --to >= --from\n";
    return ExitCode::INVALID_ARGS;
  }

  try {
    const DesignSettings settings = resolve_settings(a);

    std::vector<DesignOutcome> outcomes;
    int infeasible = 0;
    for (double h = a.from_in; h <= a.to_in + 1e-9; h += a.step_in) {
      DesignInput in = a.input;
      in.height_in = h;
      in.validate_or_throw();
      outcomes.push_back(run_design(in, settings));
      if (!outcomes.back().converged()) ++infeasible;
    }

    if (!write_design_csv_file(outcomes, a.out_path)) {
      std::cerr << "Failed to write " << a.out_path << "\n";
      return ExitCode::IO_ERROR;
    }
    std::cout << "Wrote " << outcomes.size() << " rows (" << infeasible << " infeasible) to " << a.out_path
              << "\n";
    return ExitCode::SUCCESS;

  } catch (const std::exception& e) {
    return report_failure(e);
  }
}

int main(int argc, char** argv) {
  const std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  Args a;
  std::string err;
  if (!parse_args(argc, argv, 2, &a, &err)) {
    std::cerr << "Argument error: " << err << "\n";
    std::cerr << "Run 'rwall_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }

  if (!a.log_level.empty()) {
    LogLevel lvl = LogLevel::INFO;
    if (!parse_log_level(a.log_level, lvl)) {
      std::cerr << "Argument error: unknown log level '" << a.log_level << "'\n";
      return ExitCode::INVALID_ARGS;
    }
    set_log_level(lvl);
  }

  if (cmd == "design") {
    return cmd_design(a);
  }

  if (cmd == "sweep") {
    return cmd_sweep(a);
  }

  if (cmd == "loads") {
    return cmd_loads(a);
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'rwall_cli help' for usage information.\n";
  return ExitCode::INVALID_ARGS;
}
