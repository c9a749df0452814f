#pragma once
/*
================================================================================
Fragment 4.3 — Specification: Deterministic Fingerprint
FILE: cpp/engine/specification/spec_fingerprint.hpp

Purpose:
  - Stable FNV-1a hash of a WallSpecification's design content (geometry,
    material, objective, factors). Two runs with identical input and settings
    give identical fingerprints; used for determinism checks and artifact names.

Hardening:
  - Tagged sections in a fixed order; floats via canonical bit patterns.
  - The fingerprint field itself and evaluation counts are not hashed.
================================================================================
*/

#include "engine/core/hashing.hpp"
#include "engine/specification/wall_specification.hpp"

#include <string>

namespace rwall {

Hash64 fingerprint_specification(const WallSpecification& spec);

std::string fingerprint_specification_hex(const WallSpecification& spec);

}  // namespace rwall
