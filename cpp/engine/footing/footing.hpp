#pragma once
/*
================================================================================
Fragment 2.4 — Footing: Footing Record
FILE: cpp/engine/footing/footing.hpp

Purpose:
  - Spread footing under the stem: toe (front, away from the retained soil),
    heel (back, under the retained soil) and thickness, all in inches.
  - Owned by exactly one candidate / specification; copied, never shared.
================================================================================
*/

namespace rwall {

struct Footing {
  double toe_in = 0.0;
  double heel_in = 0.0;
  double thickness_in = 0.0;

  // Toe + heel: the quantity the footing objective minimizes.
  double footprint_in() const noexcept { return toe_in + heel_in; }

  // Full base width including the stem bearing on the footing.
  double width_in(double stem_base_width_in) const noexcept {
    return toe_in + stem_base_width_in + heel_in;
  }
};

inline bool operator==(const Footing& a, const Footing& b) noexcept {
  return a.toe_in == b.toe_in && a.heel_in == b.heel_in && a.thickness_in == b.thickness_in;
}

}  // namespace rwall
