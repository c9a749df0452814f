/*
  Fragment 2.3 — Section Builder Selftest

  Checks:
    1) Section count follows ceil(H / 48) capped at max_sections.
    2) Heights sum exactly to the total for integral and fractional heights.
    3) Widths never increase upward; the base width depends only on the step.
    4) Steps that overflow the material width are contract violations.
    5) verify_section_stack rejects malformed stacks.

  Non-zero return code indicates failure.
*/

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/sections/section_builder.hpp"

namespace rwall {
namespace {

using namespace selftest;

SectionStack build(double h, Material m, double step, int max_sections = 3) {
  SectionPartition p;
  p.width_step_in = step;
  return propose_sections(h, m, max_sections, p, DesignSettings::defaults());
}

void test_section_count() {
  const SearchSettings s;
  expect_true(section_count_for_height(24.0, s, 3) == 1, "24 in -> 1 section");
  expect_true(section_count_for_height(48.0, s, 3) == 1, "48 in -> 1 section");
  expect_true(section_count_for_height(49.0, s, 3) == 2, "49 in -> 2 sections");
  expect_true(section_count_for_height(144.0, s, 3) == 3, "144 in -> 3 sections");
  expect_true(section_count_for_height(144.0, s, 2) == 2, "max_sections caps the count");
  expect_true(section_count_for_height(144.0, s, 1) == 1, "single-section cap");
}

void test_exact_sum() {
  bool ok = true;
  for (double h = 24.0; h <= 144.0; h += 0.25) {
    const SectionStack st = build(h, Material::Concrete, 2.0);
    if (stack_height_in(st) != h) ok = false;
  }
  expect_true(ok, "heights sum exactly for every quarter inch 24..144");

  const SectionStack odd = build(100.3, Material::CMU, 2.0);
  expect_true(odd.size() == 3, "100.3 in -> 3 sections");
  expect_true(odd[0].height_above_footing_in == 33.0 && odd[1].height_above_footing_in == 33.0,
              "lower sections take floor(H / n)");
  expect_true(stack_height_in(odd) == 100.3, "top section takes the remainder exactly");
}

void test_widths() {
  const SectionStack three = build(144.0, Material::Concrete, 4.0);
  expect_true(three.size() == 3, "144 in concrete has three sections");
  expect_true(three[0].width_in == 20.0 && three[1].width_in == 16.0 && three[2].width_in == 12.0,
              "widths step down by the partition step");

  const SectionStack one = build(36.0, Material::Concrete, 4.0);
  expect_true(one.size() == 1 && one[0].width_in == three[0].width_in,
              "base width is independent of the section count");

  const SectionStack flat = build(120.0, Material::CMU, 0.0);
  bool equal = true;
  for (const auto& s : flat) equal = equal && (s.width_in == 8.0);
  expect_true(equal, "zero step gives a uniform stem at the minimum width");

  const DesignSettings st = DesignSettings::defaults();
  expect_near(max_width_step_in(Material::Concrete, 3, st), 16.0 / 3.0, 1e-12, "concrete max step");
  expect_near(max_width_step_in(Material::CMU, 3, st), 8.0 / 3.0, 1e-12, "CMU max step");
}

void test_contract_violations() {
  expect_error_code([] { (void)build(96.0, Material::CMU, 4.0); }, ErrorCode::kContractViolation,
                    "CMU base width beyond 16 in rejected");
  expect_error_code([] { (void)build(96.0, Material::Concrete, -1.0); }, ErrorCode::kContractViolation,
                    "negative step rejected");

  SectionStack bad = {{40.0, 12.0}, {10.0, 10.0}};
  expect_error_code([&] { verify_section_stack(bad, 48.0); }, ErrorCode::kInvariant,
                    "sum mismatch is an invariant failure");
  bad = {{24.0, 10.0}, {24.0, 12.0}};
  expect_error_code([&] { verify_section_stack(bad, 48.0); }, ErrorCode::kInvariant,
                    "width increasing upward is an invariant failure");
  bad = {{48.0, 10.0}, {0.0, 8.0}};
  expect_error_code([&] { verify_section_stack(bad, 48.0); }, ErrorCode::kInvariant,
                    "zero-height section is an invariant failure");
}

}  // namespace
}  // namespace rwall

int main() {
  using namespace rwall;
  set_log_level(LogLevel::ERROR);

  test_section_count();
  test_exact_sum();
  test_widths();
  test_contract_violations();

  return selftest::finish();
}
