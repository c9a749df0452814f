#pragma once
/*
================================================================================
Fragment 1.4 — Core: Units + Conversions
FILE: cpp/engine/core/units.hpp

Purpose:
  - Geometry enters and leaves the engine in inches; statics run in feet and
    pounds per foot of wall length. Every conversion goes through here.

Conventions:
  - Unit weights in pcf (lb/ft^3), pressures in psf (lb/ft^2), forces in lb per
    foot of wall, moments in ft-lb per foot of wall.
================================================================================
*/

#include <cmath>

namespace rwall::units {

inline constexpr double kPi = 3.141592653589793238462643383279502884;

// Length
inline constexpr double in_to_ft = 1.0 / 12.0;
inline constexpr double ft_to_in = 12.0;

// Angle
inline constexpr double deg_to_rad = kPi / 180.0;
inline constexpr double rad_to_deg = 180.0 / kPi;

constexpr double sqr(double x) { return x * x; }

inline double inches_to_feet(double in) { return in * in_to_ft; }
inline double feet_to_inches(double ft) { return ft * ft_to_in; }

// Round a length up to the next whole inch. Tiny float noise just above an
// integer (1e-9 in) is absorbed instead of bumping a full inch.
inline double ceil_inch(double in) {
  const double r = std::round(in);
  if (std::fabs(in - r) < 1e-9) return r;
  return std::ceil(in);
}

} // namespace rwall::units
