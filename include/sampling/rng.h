#ifndef MATHGRADE_SAMPLING_RNG_H_
#define MATHGRADE_SAMPLING_RNG_H_

#include <cstddef>
#include <cstdint>

namespace mathgrade::sampling {

/// Counter-based Philox2x32-10 generator. Each draw hashes (counter, key), so a
/// (seed, stream) pair fully determines the sequence. One instance per grading call.
class Rng {
 public:
  explicit Rng(uint64_t seed, uint64_t stream = 0);

  uint64_t NextUint64();
  /// Uniform double in [0, 1).
  double Uniform();
  /// Uniform double in [lo, hi).
  double Uniform(double lo, double hi);
  /// Uniform integer in [lo, hi], inclusive.
  int64_t UniformInt(int64_t lo, int64_t hi);
  /// Uniform index in [0, n).
  size_t Index(size_t n);
  /// Standard normal draw (Box-Muller).
  double Normal();

  uint64_t seed() const { return seed_; }
  uint64_t counter() const { return counter_; }

 private:
  uint64_t seed_;
  uint64_t key_;
  uint64_t counter_ = 0;
};

}  // namespace mathgrade::sampling

#endif  // MATHGRADE_SAMPLING_RNG_H_
