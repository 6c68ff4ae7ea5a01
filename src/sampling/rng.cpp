#include "sampling/rng.h"

#include <algorithm>
#include <cmath>

namespace mathgrade::sampling {

namespace {

constexpr double kTwoPi = 6.28318530717958647692;

uint64_t MulHi32(uint32_t a, uint32_t b) {
  uint64_t res = static_cast<uint64_t>(a) * static_cast<uint64_t>(b);
  return res >> 32;
}

uint64_t Philox2x32(uint64_t counter, uint64_t key) {
  uint32_t c0 = static_cast<uint32_t>(counter);
  uint32_t c1 = static_cast<uint32_t>(counter >> 32);
  uint32_t k0 = static_cast<uint32_t>(key);
  constexpr uint32_t kPhiloxW = 0x9E3779B9;
  constexpr uint32_t kPhiloxM0 = 0xD256D193;
  for (int round = 0; round < 10; ++round) {
    uint64_t hi = MulHi32(c0, kPhiloxM0);
    uint64_t lo = static_cast<uint64_t>(c0) * kPhiloxM0;
    uint32_t new_c0 = static_cast<uint32_t>(hi) ^ k0 ^ c1;
    uint32_t new_c1 = static_cast<uint32_t>(lo);
    c0 = new_c0;
    c1 = new_c1;
    k0 += kPhiloxW;
  }
  return (static_cast<uint64_t>(c1) << 32) | c0;
}

double Uint64ToUnitDouble(uint64_t v) {
  // Use upper 53 bits for a double in [0,1).
  constexpr double kInv = 1.0 / static_cast<double>(uint64_t{1} << 53);
  return (static_cast<double>(v >> 11)) * kInv;
}

}  // namespace

Rng::Rng(uint64_t seed, uint64_t stream)
    : seed_(seed), key_(seed ^ (stream + 0x9E3779B97F4A7C15ULL)) {}

uint64_t Rng::NextUint64() {
  return Philox2x32(counter_++, key_);
}

double Rng::Uniform() {
  return Uint64ToUnitDouble(NextUint64());
}

double Rng::Uniform(double lo, double hi) {
  return lo + (hi - lo) * Uniform();
}

int64_t Rng::UniformInt(int64_t lo, int64_t hi) {
  if (hi <= lo) {
    return lo;
  }
  const uint64_t span = static_cast<uint64_t>(hi - lo) + 1;
  return lo + static_cast<int64_t>(Index(span));
}

size_t Rng::Index(size_t n) {
  if (n <= 1) {
    return 0;
  }
  // Rejection sampling keeps the draw unbiased.
  const uint64_t limit = UINT64_MAX - UINT64_MAX % n;
  uint64_t v = NextUint64();
  while (v >= limit) {
    v = NextUint64();
  }
  return static_cast<size_t>(v % n);
}

double Rng::Normal() {
  double u1 = Uniform();
  double u2 = Uniform();
  double r = std::sqrt(-2.0 * std::log(std::max(u1, 1e-12)));
  double theta = kTwoPi * u2;
  return r * std::cos(theta);
}

}  // namespace mathgrade::sampling
