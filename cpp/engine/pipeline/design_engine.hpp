#pragma once
/*
================================================================================
Fragment 5.1 — Pipeline: Design Engine Entry Point
FILE: cpp/engine/pipeline/design_engine.hpp

Purpose:
  - One call per design request:
      validate (contract) -> derive load case -> optimize -> build specification
  - Return a DesignOutcome that distinguishes success from infeasibility
    without exceptions.

Error tiers:
  - Invalid DesignInput or settings reaching the engine: Error(kContractViolation)
    / ValidationError. These are caller defects; the boundary validates first.
  - Infeasible design: a normal outcome with a diagnosis (last evaluated
    stability result + failing factor ids). Never an exception.

Concurrency:
  - Stateless and pure over (input, settings). Independent runs may execute
    on separate threads; only the logger is shared (and internally locked).
================================================================================
*/

#include "engine/core/design_input.hpp"
#include "engine/core/settings.hpp"
#include "engine/loads/load_model.hpp"
#include "engine/optimization/candidate.hpp"
#include "engine/specification/wall_specification.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rwall {

enum class DesignStatus : int { Converged = 0, Infeasible = 1 };

const char* to_string(DesignStatus s) noexcept;

struct InfeasibilityDiagnosis {
  std::string reason;
  StabilityResult last_evaluated;
  std::vector<std::string> failing_factors;
};

struct DesignOutcome {
  DesignStatus status = DesignStatus::Infeasible;
  DesignInput input;
  LoadCase load_case;
  std::optional<WallSpecification> specification;  // set iff Converged
  InfeasibilityDiagnosis diagnosis;                 // meaningful iff Infeasible
  int evaluations = 0;

  bool converged() const noexcept { return status == DesignStatus::Converged; }

  // Human-readable multi-line summary (CLI output, logs).
  std::string summary() const;
};

DesignOutcome run_design(const DesignInput& input,
                         const DesignSettings& settings = DesignSettings::defaults(),
                         const CandidateObserver& observer = {});

}  // namespace rwall
