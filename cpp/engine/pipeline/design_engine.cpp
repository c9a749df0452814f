#include "engine/pipeline/design_engine.hpp"

#include "engine/core/error.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/optimization/optimizer.hpp"
#include "engine/specification/specification_builder.hpp"

#include <sstream>

namespace rwall {

const char* to_string(DesignStatus s) noexcept {
  switch (s) {
    case DesignStatus::Converged: return "Converged";
    case DesignStatus::Infeasible: return "Infeasible";
  }
  return "Unknown";
}

DesignOutcome run_design(const DesignInput& input,
                         const DesignSettings& settings,
                         const CandidateObserver& observer) {
  settings.validate_or_throw();
  try {
    input.validate_or_throw();
  } catch (const ValidationError& e) {
    // Input reaching the engine must already be valid.
    RWALL_THROW(ErrorCode::kContractViolation, std::string("run_design: ") + e.what());
  }

  log_info("engine", "design run: " + input.describe());

  DesignOutcome out;
  out.input = input;
  out.load_case = derive_load_case(input, settings);

  OptimizationResult opt = optimize(input, out.load_case, settings, observer);
  out.evaluations = opt.evaluations;

  if (opt.state == SearchState::Converged) {
    RWALL_ENSURE(opt.best.has_value(), ErrorCode::kInternal, "run_design: converged without a candidate");
    out.status = DesignStatus::Converged;
    out.specification = build_specification(input, out.load_case, *opt.best, opt.evaluations);
    log_info("engine", "converged, fingerprint " + out.specification->fingerprint);
  } else {
    out.status = DesignStatus::Infeasible;
    out.diagnosis.reason = opt.reason;
    out.diagnosis.last_evaluated = opt.last_evaluated;
    out.diagnosis.failing_factors = opt.last_evaluated.failing_factors();
    log_warn("engine", "unable to generate a compliant design: " + opt.reason);
  }
  return out;
}

std::string DesignOutcome::summary() const {
  std::ostringstream oss;
  oss << "input: " << input.describe() << "\n";
  oss << "status: " << to_string(status) << " (" << evaluations << " evaluations)\n";

  auto factors = [&oss](const StabilityResult& r) {
    for (const auto& c : r.checks) {
      oss << "  " << c.id << " = " << c.value << " (min " << c.minimum << ") " << to_string(c.verdict)
          << "\n";
    }
  };

  if (specification) {
    const WallSpecification& s = *specification;
    oss << "material: " << to_string(s.material) << "\n";
    oss << "sections (bottom to top):\n";
    for (const auto& sec : s.sections) {
      oss << "  height " << sec.height_above_footing_in << " in, width " << sec.width_in << " in\n";
    }
    oss << "footing: toe " << s.footing.toe_in << " in, heel " << s.footing.heel_in << " in, thickness "
        << s.footing.thickness_in << " in\n";
    factors(s.stability);
    oss << "fingerprint: " << s.fingerprint << "\n";
  } else {
    oss << "reason: " << diagnosis.reason << "\n";
    oss << "failing:";
    for (const auto& id : diagnosis.failing_factors) oss << " " << id;
    oss << "\n";
    factors(diagnosis.last_evaluated);
  }
  return oss.str();
}

}  // namespace rwall
