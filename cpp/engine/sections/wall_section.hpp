#pragma once
/*
================================================================================
Fragment 2.2 — Sections: Wall Section Record
FILE: cpp/engine/sections/wall_section.hpp

Purpose:
  - One stacked stem segment above the footing. A wall cross-section is an
    ordered vector of these, bottom to top. Order carries meaning (the lowest
    section carries the largest moment) and is never changed after creation.
================================================================================
*/

#include <vector>

namespace rwall {

struct WallSection {
  double height_above_footing_in = 0.0;
  double width_in = 0.0;
};

using SectionStack = std::vector<WallSection>;

// Sum of section heights (exact for the partitions produced by the builder).
inline double stack_height_in(const SectionStack& s) noexcept {
  double h = 0.0;
  for (const auto& w : s) h += w.height_above_footing_in;
  return h;
}

// Width at the base of the stem; 0 for an empty stack.
inline double stack_base_width_in(const SectionStack& s) noexcept {
  return s.empty() ? 0.0 : s.front().width_in;
}

}  // namespace rwall
