#pragma once
/*
================================================================================
Fragment 1.7 — Core: Deterministic Hashing
FILE: cpp/engine/core/hashing.hpp

Purpose:
  - Stable 64-bit fingerprints of wall specifications, so two runs of the
    same input can be compared byte-for-byte and artifacts can be named
    without collisions.

Design constraints:
  - No std::hash (not stable across processes or platforms).
  - Doubles are hashed by bit pattern after canonicalizing -0.0 and NaN.
  - Integers are fed little-endian regardless of host order.

Notes:
  - Not cryptographic.
================================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace rwall {

struct Hash64 {
  uint64_t value = 0;

  constexpr bool operator==(const Hash64& o) const noexcept { return value == o.value; }
  constexpr bool operator!=(const Hash64& o) const noexcept { return value != o.value; }
};

// FNV-1a, 64-bit.
class Fnv1a64 {
 public:
  static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr uint64_t kPrime       = 1099511628211ull;

  Fnv1a64() : h_(kOffsetBasis) {}

  uint64_t value() const { return h_; }

  void update_bytes(const void* data, size_t n);

  void update_u8(uint8_t v) { update_bytes(&v, 1); }
  void update_u32(uint32_t v) { update_le(v); }
  void update_u64(uint64_t v) { update_le(v); }
  void update_bool(bool b) { update_u8(static_cast<uint8_t>(b ? 1 : 0)); }

  // Length-prefixed so "ab"+"c" and "a"+"bc" differ.
  void update_string(std::string_view s);

  // Section marker: tag string followed by a unit separator byte.
  void update_tag(std::string_view tag);

  template <class E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
  void update_enum(E e) {
    using U = std::underlying_type_t<E>;
    update_u64(static_cast<uint64_t>(static_cast<U>(e)));
  }

  void update_f64(double x);

 private:
  template <class T>
  void update_le(T v) {
    static_assert(std::is_integral_v<T> && (sizeof(T) == 4 || sizeof(T) == 8),
                  "update_le supports 32/64-bit integral types only");
    std::array<uint8_t, sizeof(T)> b{};
    for (size_t i = 0; i < sizeof(T); ++i) {
      b[i] = static_cast<uint8_t>((static_cast<uint64_t>(v) >> (8 * i)) & 0xFFu);
    }
    update_bytes(b.data(), b.size());
  }

  uint64_t h_;
};

// 16 lowercase hex characters, most significant nibble first.
std::string hash_to_hex(Hash64 h);

}  // namespace rwall
