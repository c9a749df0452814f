#include "engine/specification/specification_builder.hpp"

#include "engine/core/error.hpp"
#include "engine/specification/spec_fingerprint.hpp"

namespace rwall {

WallSpecification build_specification(const DesignInput& input,
                                      const LoadCase& lc,
                                      const Candidate& winner,
                                      int evaluations) {
  RWALL_ENSURE(winner.accepted(), ErrorCode::kContractViolation,
               "build_specification: candidate did not pass stability");
  RWALL_ENSURE(!winner.sections.empty() && stack_height_in(winner.sections) == input.height_in,
               ErrorCode::kContractViolation, "build_specification: sections do not match input height");

  WallSpecification spec;
  spec.total_height_in = input.height_in;
  spec.sections = winner.sections;
  spec.footing = winner.footing;
  spec.material = input.material;
  spec.stability = winner.stability;

  spec.objective = input.objective;
  spec.load_case = lc;
  spec.width_step_in = winner.width_step_in;
  spec.evaluations = evaluations;
  spec.fingerprint = fingerprint_specification_hex(spec);
  return spec;
}

}  // namespace rwall
