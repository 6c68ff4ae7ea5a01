#ifndef MATHGRADE_SAMPLING_MATRIX_SAMPLING_H_
#define MATHGRADE_SAMPLING_MATRIX_SAMPLING_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "runtime/value.h"
#include "sampling/sampling_set.h"

namespace mathgrade::sampling {

/// Arrays with entries drawn from [-0.5, 0.5) (plus an imaginary part when complex),
/// passed through ApplySymmetry and Normalize. A hook returning false rejects the draw;
/// after 100 rejections Sample throws a kConfig util::Error.
class ArraySamplingSet : public SamplingSet {
 public:
  ArraySamplingSet(std::string name, std::vector<int64_t> shape, bool complex,
                   RealInterval norm);

  runtime::Value Sample(Rng* rng) const override;

  const std::vector<int64_t>& shape() const { return shape_; }
  bool complex() const { return complex_; }

 protected:
  virtual bool ApplySymmetry(runtime::Value* array, Rng* rng) const;
  /// Rescales to a norm drawn from the norm interval.
  virtual bool Normalize(runtime::Value* array, Rng* rng) const;

  runtime::Value RandomEntries(Rng* rng) const;

  std::string name_;
  std::vector<int64_t> shape_;
  bool complex_;
  RealInterval norm_;
};

class RealVectors : public ArraySamplingSet {
 public:
  explicit RealVectors(int64_t length = 3, RealInterval norm = RealInterval());
};

class ComplexVectors : public ArraySamplingSet {
 public:
  explicit ComplexVectors(int64_t length = 3, RealInterval norm = RealInterval());
};

enum class Triangular { kNone, kUpper, kLower };

/// General rows x cols matrices, optionally upper or lower triangular.
class GeneralMatrices : public ArraySamplingSet {
 public:
  GeneralMatrices(std::string name, int64_t rows, int64_t cols, bool complex,
                  Triangular triangular, RealInterval norm);

 protected:
  bool ApplySymmetry(runtime::Value* array, Rng* rng) const override;

 private:
  Triangular triangular_;
};

class RealMatrices : public GeneralMatrices {
 public:
  explicit RealMatrices(int64_t rows = 2, int64_t cols = 2,
                        Triangular triangular = Triangular::kNone,
                        RealInterval norm = RealInterval());
};

class ComplexMatrices : public GeneralMatrices {
 public:
  explicit ComplexMatrices(int64_t rows = 2, int64_t cols = 2,
                           Triangular triangular = Triangular::kNone,
                           RealInterval norm = RealInterval());
};

/// Arrays of rank 3 or more.
class RealTensors : public ArraySamplingSet {
 public:
  explicit RealTensors(std::vector<int64_t> shape, RealInterval norm = RealInterval());
};

class ComplexTensors : public ArraySamplingSet {
 public:
  explicit ComplexTensors(std::vector<int64_t> shape, RealInterval norm = RealInterval());
};

/// A scalar draw times the identity matrix.
class IdentityMatrixMultiples : public SamplingSet {
 public:
  explicit IdentityMatrixMultiples(
      int64_t dimension = 2,
      std::shared_ptr<const SamplingSet> sampler = std::make_shared<RealInterval>());
  runtime::Value Sample(Rng* rng) const override;

 private:
  int64_t dimension_;
  std::shared_ptr<const SamplingSet> sampler_;
};

enum class Symmetry { kNone, kDiagonal, kSymmetric, kAntisymmetric, kHermitian, kAntihermitian };

struct SquareMatrixOptions {
  int64_t dimension = 2;
  Symmetry symmetry = Symmetry::kNone;
  bool traceless = false;
  /// 0 or 1 when set. A unit determinant replaces the norm constraint.
  std::optional<int> determinant;
  /// Forced on for hermitian and antihermitian symmetry.
  bool complex = false;
  RealInterval norm;
};

/// Square matrices with a symmetry, tracelessness and determinant 0 or 1. Combinations
/// that cannot exist are rejected with a kConfig util::Error at construction.
class SquareMatrices : public ArraySamplingSet {
 public:
  explicit SquareMatrices(SquareMatrixOptions options = SquareMatrixOptions());

 protected:
  bool ApplySymmetry(runtime::Value* array, Rng* rng) const override;
  bool Normalize(runtime::Value* array, Rng* rng) const override;

 private:
  bool MakeDeterminantOne(runtime::Value* array) const;
  void MakeDeterminantZero(runtime::Value* array, Rng* rng) const;

  SquareMatrixOptions options_;
};

/// Haar-random orthogonal matrices; SO(n) when unitdet is set.
class OrthogonalMatrices : public SamplingSet {
 public:
  explicit OrthogonalMatrices(int64_t dimension = 2, bool unitdet = true);
  runtime::Value Sample(Rng* rng) const override;

 private:
  int64_t dimension_;
  bool unitdet_;
};

/// Haar-random unitary matrices; SU(n) when unitdet is set.
class UnitaryMatrices : public SamplingSet {
 public:
  explicit UnitaryMatrices(int64_t dimension = 2, bool unitdet = true);
  runtime::Value Sample(Rng* rng) const override;

 private:
  int64_t dimension_;
  bool unitdet_;
};

}  // namespace mathgrade::sampling

#endif  // MATHGRADE_SAMPLING_MATRIX_SAMPLING_H_
