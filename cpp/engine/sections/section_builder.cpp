#include "engine/sections/section_builder.hpp"

#include "engine/core/error.hpp"

#include <algorithm>
#include <cmath>

namespace rwall {

int section_count_for_height(double total_height_in, const SearchSettings& search,
                             int max_sections) {
  RWALL_ENSURE(std::isfinite(total_height_in) && total_height_in > 0.0, ErrorCode::kContractViolation,
               "section_count_for_height: total height must be positive");
  RWALL_ENSURE(max_sections >= 1, ErrorCode::kContractViolation,
               "section_count_for_height: max_sections must be >= 1");

  const double raw = std::ceil(total_height_in / search.max_section_height_in);
  const int n = static_cast<int>(raw);
  return std::clamp(n, 1, max_sections);
}

double max_width_step_in(Material material, int max_sections, const DesignSettings& settings) {
  RWALL_ENSURE(max_sections >= 1, ErrorCode::kContractViolation, "max_width_step_in: max_sections must be >= 1");
  const double span = settings.materials.max_width_in(material) - settings.materials.min_width_in(material);
  return span / static_cast<double>(max_sections);
}

SectionStack propose_sections(double total_height_in, Material material, int max_sections,
                              const SectionPartition& partition, const DesignSettings& settings) {
  RWALL_ENSURE(std::isfinite(partition.width_step_in) && partition.width_step_in >= 0.0,
               ErrorCode::kContractViolation, "propose_sections: width step must be finite and >= 0");

  const int n = section_count_for_height(total_height_in, settings.search, max_sections);
  const double w_min = settings.materials.min_width_in(material);
  const double w_max = settings.materials.max_width_in(material);

  const double base_width = w_min + partition.width_step_in * static_cast<double>(max_sections);
  RWALL_ENSURE(base_width <= w_max + 1e-9, ErrorCode::kContractViolation,
               "propose_sections: base width exceeds material maximum");

  const double lower_h = std::floor(total_height_in / static_cast<double>(n));

  SectionStack out;
  out.reserve(static_cast<std::size_t>(n));
  double placed = 0.0;
  for (int i = 0; i < n; ++i) {
    WallSection s;
    s.width_in = w_min + partition.width_step_in * static_cast<double>(max_sections - i);
    if (i + 1 < n) {
      s.height_above_footing_in = lower_h;
      placed += lower_h;
    } else {
      s.height_above_footing_in = total_height_in - placed;
    }
    out.push_back(s);
  }

  verify_section_stack(out, total_height_in);
  return out;
}

void verify_section_stack(const SectionStack& sections, double total_height_in) {
  RWALL_ENSURE(!sections.empty(), ErrorCode::kInvariant, "section stack is empty");

  double prev_width = sections.front().width_in;
  for (const auto& s : sections) {
    RWALL_ENSURE(s.height_above_footing_in > 0.0, ErrorCode::kInvariant,
                 "section height must be positive");
    RWALL_ENSURE(s.width_in > 0.0, ErrorCode::kInvariant, "section width must be positive");
    RWALL_ENSURE(s.width_in <= prev_width, ErrorCode::kInvariant,
                 "section widths must not increase upward");
    prev_width = s.width_in;
  }

  // Exact comparison: the partition is built so the sum is representable.
  RWALL_ENSURE(stack_height_in(sections) == total_height_in, ErrorCode::kInvariant,
               "section heights do not sum to the total height");
}

}  // namespace rwall
