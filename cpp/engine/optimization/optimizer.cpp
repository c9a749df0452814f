#include "engine/optimization/optimizer.hpp"

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/units.hpp"
#include "engine/footing/footing_sizer.hpp"
#include "engine/optimization/objective.hpp"
#include "engine/sections/section_builder.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace rwall {

const char* to_string(SearchState s) noexcept {
  switch (s) {
    case SearchState::Searching: return "Searching";
    case SearchState::Converged: return "Converged";
    case SearchState::Infeasible: return "Infeasible";
  }
  return "Unknown";
}

namespace {

class SearchRun {
 public:
  SearchRun(const DesignInput& input, const LoadCase& lc, const DesignSettings& settings,
            const CandidateObserver& observer)
      : input_(input), lc_(lc), settings_(settings), observer_(observer) {}

  OptimizationResult run() {
    switch (input_.objective) {
      case OptimizationObjective::MinimizeExcavation:
        run_excavation();
        break;
      case OptimizationObjective::MinimizeFooting:
        run_footing();
        break;
      default:
        RWALL_THROW(ErrorCode::kContractViolation, "optimize: unhandled OptimizationObjective");
    }

    if (result_.best) {
      result_.state = SearchState::Converged;
      result_.reason.clear();
    } else {
      result_.state = SearchState::Infeasible;
      if (result_.reason.empty()) result_.reason = "no stable candidate within geometric bounds";
    }
    return std::move(result_);
  }

 private:
  SectionStack sections_for(double step) const {
    SectionPartition p;
    p.width_step_in = step;
    return propose_sections(input_.height_in, input_.material, settings_.search.max_sections, p, settings_);
  }

  Candidate evaluate(const SectionStack& sections, const Footing& footing, double step) {
    Candidate c;
    c.sections = sections;
    c.footing = footing;
    c.width_step_in = step;
    c.stability = evaluate_stability(c.sections, c.footing, lc_, settings_);
    c.evaluation_index = ++result_.evaluations;
    result_.last_evaluated = c.stability;
    if (observer_) observer_(c);
    return c;
  }

  Candidate evaluate_split(const SectionStack& sections, double toe, double heel, double t, double step) {
    Footing f;
    f.toe_in = toe;
    f.heel_in = heel;
    f.thickness_in = t;
    return evaluate(sections, f, step);
  }

  // Smallest stable footprint at thickness t, smallest toe within it, or nothing.
  // Passing footprints do not form an interval, so the scan is linear. A passing
  // sized footing caps it. Sliding resistance at a fixed footprint peaks at the
  // smallest toe (only the heel carries backfill); a sliding failure there rules
  // out the whole footprint.
  std::optional<Candidate> resolve_at(const SectionStack& sections, double t, double step) {
    const FootingRules& rules = settings_.footing;
    const double stem = stack_base_width_in(sections);
    const double toe0 = footing_min_toe_in(input_.toe_length_in, rules);
    const double heel0 = units::ceil_inch(rules.min_heel_in);

    double cap = std::floor(rules.max_footing_width_in - stem);
    if (toe0 + heel0 > cap) {
      evaluate_split(sections, toe0, heel0, t, step);
      note_reason("requested toe leaves no room within the maximum footing width");
      return std::nullopt;
    }

    const Footing sized = size_footing(sections, lc_, input_.toe_length_in, t, settings_);
    if (sized.width_in(stem) <= rules.max_footing_width_in) {
      Candidate c = evaluate(sections, sized, step);
      if (c.accepted()) cap = sized.footprint_in();
    }

    StabilityResult widest;
    for (double fp = toe0 + heel0; fp <= cap; fp += 1.0) {
      Candidate first = evaluate_split(sections, toe0, fp - toe0, t, step);
      if (first.accepted()) return first;
      widest = first.stability;
      if (first.stability.sliding_factor < settings_.safety.min_sliding) continue;

      for (double toe = toe0 + 1.0; toe <= fp - heel0; toe += 1.0) {
        Candidate c = evaluate_split(sections, toe, fp - toe, t, step);
        if (c.accepted()) return c;
      }
    }
    // Diagnose with the widest footing at the requested toe.
    result_.last_evaluated = widest;
    note_reason("no stable footing within the maximum footing width");
    return std::nullopt;
  }

  // Best stable footing for a fixed section over the admissible thicknesses.
  std::optional<Candidate> resolve_footing(const SectionStack& sections, double step) {
    const ThicknessRange tr = footing_thickness_range(stack_height_in(sections), settings_.footing);
    std::optional<Candidate> best;
    StabilityResult diagnosis;
    for (double t = tr.min_in; t <= tr.max_in; t += 1.0) {
      auto c = resolve_at(sections, t, step);
      if (!c) {
        diagnosis = result_.last_evaluated;
        continue;
      }
      if (!best || better_candidate(*c, *best, input_.objective)) best = std::move(c);
    }
    // Report the winner last so last_evaluated matches the returned candidate.
    result_.last_evaluated = best ? best->stability : diagnosis;
    return best;
  }

  void run_excavation() {
    const double step = settings_.search.min_width_step_in;
    result_.sweep_steps = 1;
    auto c = resolve_footing(sections_for(step), step);
    if (c) result_.best = std::move(c);
    log_step(step);
  }

  void run_footing() {
    const double seed = settings_.search.min_width_step_in;
    const double inc = settings_.search.width_step_increment_in;
    const double max_step = max_width_step_in(input_.material, settings_.search.max_sections, settings_);

    StabilityResult diagnosis;
    for (int i = 0; i < settings_.search.max_sweep_steps; ++i) {
      const double step = seed + inc * static_cast<double>(i);
      if (step > max_step) break;
      ++result_.sweep_steps;

      auto c = resolve_footing(sections_for(step), step);
      if (!c) diagnosis = result_.last_evaluated;
      if (c && (!result_.best ||
                better_candidate(*c, *result_.best, OptimizationObjective::MinimizeFooting))) {
        result_.best = std::move(c);
      }
      log_step(step);
    }
    result_.last_evaluated = result_.best ? result_.best->stability : diagnosis;
  }

  void note_reason(const char* why) {
    if (result_.reason.empty()) result_.reason = why;
  }

  void log_step(double step) const {
    if (!log_enabled(LogLevel::DEBUG)) return;
    std::ostringstream oss;
    oss << "step=" << step << "in evaluations=" << result_.evaluations;
    if (result_.best) {
      oss << " best toe=" << result_.best->footing.toe_in << " heel=" << result_.best->footing.heel_in
          << " t=" << result_.best->footing.thickness_in;
    } else {
      oss << " no stable candidate yet";
    }
    log_debug("optimizer", oss.str());
  }

  const DesignInput& input_;
  const LoadCase& lc_;
  const DesignSettings& settings_;
  const CandidateObserver& observer_;
  OptimizationResult result_;
};

}  // namespace

OptimizationResult optimize(const DesignInput& input,
                            const LoadCase& lc,
                            const DesignSettings& settings,
                            const CandidateObserver& observer) {
  SearchRun run(input, lc, settings, observer);
  OptimizationResult r = run.run();

  std::ostringstream oss;
  oss << to_string(input.objective) << ": " << to_string(r.state) << " after " << r.evaluations
      << " evaluations";
  if (r.state == SearchState::Infeasible) {
    oss << " (" << r.reason << ")";
    for (const auto& id : r.last_evaluated.failing_factors()) oss << " " << id;
  }
  log_info("optimizer", oss.str());
  return r;
}

}  // namespace rwall
