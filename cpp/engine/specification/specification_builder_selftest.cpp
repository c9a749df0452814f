/*
  Fragment 4.2 — Specification Builder + Fingerprint Selftest

  Checks:
    1) build_specification copies the accepted candidate without recomputing.
    2) Unaccepted or mismatched candidates are contract violations.
    3) The fingerprint is stable, 16 hex chars, and tracks design content.

  Non-zero return code indicates failure.
*/

#include <cctype>
#include <string>

#include "engine/core/design_input.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/loads/load_model.hpp"
#include "engine/optimization/optimizer.hpp"
#include "engine/specification/spec_fingerprint.hpp"
#include "engine/specification/specification_builder.hpp"

namespace rwall {
namespace {

using namespace selftest;

struct Fixture {
  DesignInput input;
  LoadCase lc;
  OptimizationResult result;
};

Fixture converged_fixture() {
  Fixture f;
  f.input.height_in = 60.0;
  f.input.toe_length_in = 8.0;
  const DesignSettings st = DesignSettings::defaults();
  f.lc = derive_load_case(f.input, st);
  f.result = optimize(f.input, f.lc, st);
  return f;
}

void test_assembly() {
  const Fixture f = converged_fixture();
  expect_true(f.result.state == SearchState::Converged, "60 in fixture converges");
  if (!f.result.best) return;
  const Candidate& c = *f.result.best;

  const WallSpecification s = build_specification(f.input, f.lc, c, f.result.evaluations);
  expect_true(s.total_height_in == 60.0, "total height copied");
  expect_true(s.sections.size() == c.sections.size() && s.sections[0].width_in == c.sections[0].width_in,
              "sections copied in order");
  expect_true(s.footing == c.footing, "footing copied");
  expect_true(s.stability.overturning_factor == c.stability.overturning_factor &&
                  s.stability.sliding_factor == c.stability.sliding_factor &&
                  s.stability.bearing_factor == c.stability.bearing_factor,
              "factors copied without recomputation");
  expect_true(s.material == f.input.material && s.objective == f.input.objective, "provenance copied");
  expect_true(s.evaluations == f.result.evaluations, "evaluation count recorded");
}

void test_contract() {
  const Fixture f = converged_fixture();
  if (!f.result.best) {
    fail("fixture did not converge");
    return;
  }

  Candidate rejected = *f.result.best;
  rejected.stability.passed = false;
  expect_error_code([&] { (void)build_specification(f.input, f.lc, rejected, 1); }, ErrorCode::kContractViolation,
                    "unaccepted candidate is a contract violation");

  DesignInput other = f.input;
  other.height_in = 61.0;
  expect_error_code([&] { (void)build_specification(other, f.lc, *f.result.best, 1); },
                    ErrorCode::kContractViolation, "height mismatch is a contract violation");
}

void test_fingerprint() {
  const Fixture f = converged_fixture();
  if (!f.result.best) {
    fail("fixture did not converge");
    return;
  }
  const WallSpecification a = build_specification(f.input, f.lc, *f.result.best, f.result.evaluations);
  const WallSpecification b = build_specification(f.input, f.lc, *f.result.best, f.result.evaluations + 7);

  bool hex = a.fingerprint.size() == 16;
  for (char c : a.fingerprint) hex = hex && std::isxdigit(static_cast<unsigned char>(c)) != 0;
  expect_true(hex, "fingerprint is 16 hex chars");
  expect_eq_str(a.fingerprint, b.fingerprint, "evaluation count does not change the fingerprint");
  expect_eq_str(a.fingerprint, fingerprint_specification_hex(a), "stored fingerprint matches recomputation");

  WallSpecification changed = a;
  changed.footing.heel_in += 1.0;
  expect_true(fingerprint_specification_hex(changed) != a.fingerprint, "heel change moves the fingerprint");

  changed = a;
  changed.material = Material::CMU;
  expect_true(fingerprint_specification_hex(changed) != a.fingerprint, "material change moves the fingerprint");
}

}  // namespace
}  // namespace rwall

int main() {
  using namespace rwall;
  set_log_level(LogLevel::ERROR);

  test_assembly();
  test_contract();
  test_fingerprint();

  return selftest::finish();
}
