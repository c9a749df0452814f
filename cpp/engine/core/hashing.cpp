#include "engine/core/hashing.hpp"

#include <bit>
#include <cmath>

namespace rwall {

namespace {

constexpr uint64_t kCanonicalQuietNaNBits = 0x7ff8000000000000ull;

double canonical(double v) {
  if (std::isnan(v)) return std::bit_cast<double>(kCanonicalQuietNaNBits);
  if (v == 0.0) return 0.0;  // folds -0.0
  return v;
}

} // namespace

void Fnv1a64::update_bytes(const void* data, size_t n) {
  const auto* p = static_cast<const uint8_t*>(data);
  if (p == nullptr || n == 0) return;

  for (size_t i = 0; i < n; ++i) {
    h_ ^= static_cast<uint64_t>(p[i]);
    h_ *= kPrime;
  }
}

void Fnv1a64::update_string(std::string_view s) {
  update_u64(static_cast<uint64_t>(s.size()));
  if (!s.empty()) update_bytes(s.data(), s.size());
}

void Fnv1a64::update_tag(std::string_view tag) {
  update_string(tag);
  update_u8(0x1F);
}

void Fnv1a64::update_f64(double x) {
  update_u64(std::bit_cast<uint64_t>(canonical(x)));
}

std::string hash_to_hex(Hash64 h) {
  static const char* kHex = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 0; i < 16; ++i) {
    out[static_cast<size_t>(i)] = kHex[(h.value >> (4 * (15 - i))) & 0xFu];
  }
  return out;
}

}  // namespace rwall
