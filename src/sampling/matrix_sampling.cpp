#include "sampling/matrix_sampling.h"

#include <cmath>
#include <utility>

#include "runtime/linalg.h"
#include "util/error.h"

namespace mathgrade::sampling {

namespace {

constexpr int kMaxAttempts = 100;

using runtime::Complex;
using runtime::Value;

[[noreturn]] void ConfigFail(const std::string& message) {
  throw util::Error(util::ErrorKind::kConfig, message);
}

void CheckShape(const std::string& name, const std::vector<int64_t>& shape) {
  for (int64_t dim : shape) {
    if (dim < 1) {
      ConfigFail(name + " shape entries must be positive");
    }
  }
}

void CheckDimension(const std::string& name, int64_t dimension) {
  if (dimension < 2) {
    ConfigFail(name + " dimension must be at least 2");
  }
}

void Scale(Value* array, Complex factor) {
  for (auto& x : array->data) {
    x *= factor;
  }
}

bool NeedsComplex(const SquareMatrixOptions& options) {
  return options.complex || options.symmetry == Symmetry::kHermitian ||
         options.symmetry == Symmetry::kAntihermitian;
}

// P = I - v v^H for a random unit vector v, so P v = 0 and P is hermitian.
Value RandomProjector(int64_t n, bool complex, Rng* rng) {
  std::vector<Complex> v(static_cast<size_t>(n));
  double norm = 0.0;
  while (norm < 1e-6) {
    norm = 0.0;
    for (auto& x : v) {
      x = Complex(rng->Normal(), complex ? rng->Normal() : 0.0);
      norm += std::norm(x);
    }
    norm = std::sqrt(norm);
  }
  for (auto& x : v) {
    x /= norm;
  }
  Value p = runtime::Identity(n);
  for (int64_t r = 0; r < n; ++r) {
    for (int64_t c = 0; c < n; ++c) {
      p.At(r, c) -= v[r] * std::conj(v[c]);
    }
  }
  return p;
}

Value GaussianMatrix(int64_t n, bool complex, Rng* rng) {
  Value m = Value::Zeros({n, n});
  const double scale = complex ? 1.0 / std::sqrt(2.0) : 1.0;
  for (auto& x : m.data) {
    double re = rng->Normal();
    double im = complex ? rng->Normal() : 0.0;
    x = scale * Complex(re, im);
  }
  return m;
}

}  // namespace

ArraySamplingSet::ArraySamplingSet(std::string name, std::vector<int64_t> shape, bool complex,
                                   RealInterval norm)
    : name_(std::move(name)), shape_(std::move(shape)), complex_(complex), norm_(norm) {
  CheckShape(name_, shape_);
}

Value ArraySamplingSet::RandomEntries(Rng* rng) const {
  Value array = Value::Zeros(shape_);
  for (auto& x : array.data) {
    x = Complex(rng->Uniform() - 0.5, 0.0);
  }
  if (complex_) {
    for (auto& x : array.data) {
      x += Complex(0.0, rng->Uniform() - 0.5);
    }
  }
  return array;
}

Value ArraySamplingSet::Sample(Rng* rng) const {
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    Value array = RandomEntries(rng);
    if (!ApplySymmetry(&array, rng)) continue;
    if (!Normalize(&array, rng)) continue;
    return array;
  }
  ConfigFail("Unable to construct sample for " + name_);
}

bool ArraySamplingSet::ApplySymmetry(Value*, Rng*) const {
  return true;
}

bool ArraySamplingSet::Normalize(Value* array, Rng* rng) const {
  const double actual = runtime::Norm(*array);
  if (actual == 0.0) {
    return false;
  }
  Scale(array, Complex(norm_.Draw(rng) / actual, 0.0));
  return true;
}

RealVectors::RealVectors(int64_t length, RealInterval norm)
    : ArraySamplingSet("RealVectors", {length}, false, norm) {}

ComplexVectors::ComplexVectors(int64_t length, RealInterval norm)
    : ArraySamplingSet("ComplexVectors", {length}, true, norm) {}

GeneralMatrices::GeneralMatrices(std::string name, int64_t rows, int64_t cols, bool complex,
                                 Triangular triangular, RealInterval norm)
    : ArraySamplingSet(std::move(name), {rows, cols}, complex, norm), triangular_(triangular) {}

bool GeneralMatrices::ApplySymmetry(Value* array, Rng*) const {
  if (triangular_ == Triangular::kNone) {
    return true;
  }
  for (int64_t r = 0; r < shape_[0]; ++r) {
    for (int64_t c = 0; c < shape_[1]; ++c) {
      if ((triangular_ == Triangular::kUpper && c < r) ||
          (triangular_ == Triangular::kLower && c > r)) {
        array->At(r, c) = Complex(0.0, 0.0);
      }
    }
  }
  return true;
}

RealMatrices::RealMatrices(int64_t rows, int64_t cols, Triangular triangular, RealInterval norm)
    : GeneralMatrices("RealMatrices", rows, cols, false, triangular, norm) {}

ComplexMatrices::ComplexMatrices(int64_t rows, int64_t cols, Triangular triangular,
                                 RealInterval norm)
    : GeneralMatrices("ComplexMatrices", rows, cols, true, triangular, norm) {}

RealTensors::RealTensors(std::vector<int64_t> shape, RealInterval norm)
    : ArraySamplingSet("RealTensors", std::move(shape), false, norm) {
  if (shape_.size() < 3) {
    ConfigFail("RealTensors requires a shape with at least 3 dimensions");
  }
}

ComplexTensors::ComplexTensors(std::vector<int64_t> shape, RealInterval norm)
    : ArraySamplingSet("ComplexTensors", std::move(shape), true, norm) {
  if (shape_.size() < 3) {
    ConfigFail("ComplexTensors requires a shape with at least 3 dimensions");
  }
}

IdentityMatrixMultiples::IdentityMatrixMultiples(int64_t dimension,
                                                 std::shared_ptr<const SamplingSet> sampler)
    : dimension_(dimension), sampler_(std::move(sampler)) {
  CheckDimension("IdentityMatrixMultiples", dimension_);
  if (!sampler_) {
    ConfigFail("IdentityMatrixMultiples requires a scalar sampler");
  }
}

Value IdentityMatrixMultiples::Sample(Rng* rng) const {
  Value scaling = sampler_->Sample(rng);
  if (!scaling.IsScalar()) {
    ConfigFail("IdentityMatrixMultiples requires a scalar sampler");
  }
  Value out = runtime::Identity(dimension_);
  Scale(&out, scaling.scalar());
  return out;
}

SquareMatrices::SquareMatrices(SquareMatrixOptions options)
    : ArraySamplingSet("SquareMatrices", {options.dimension, options.dimension},
                       NeedsComplex(options), options.norm),
      options_(options) {
  CheckDimension("SquareMatrices", options_.dimension);
  options_.complex = complex_;
  if (!options_.determinant) {
    return;
  }
  const int det = *options_.determinant;
  if (det != 0 && det != 1) {
    ConfigFail("SquareMatrices determinant must be 0 or 1");
  }
  if (det == 0) {
    if (options_.symmetry == Symmetry::kAntisymmetric) {
      ConfigFail("Unable to generate zero determinant antisymmetric matrices");
    }
    if (options_.traceless) {
      ConfigFail("Unable to generate zero determinant traceless matrices");
    }
    return;
  }
  if (options_.dimension == 2 && options_.traceless) {
    if (options_.symmetry == Symmetry::kDiagonal && !options_.complex) {
      ConfigFail("No real, traceless, unit-determinant, diagonal 2x2 matrix exists");
    }
    if (options_.symmetry == Symmetry::kSymmetric && !options_.complex) {
      ConfigFail("No real, traceless, unit-determinant, symmetric 2x2 matrix exists");
    }
    if (options_.symmetry == Symmetry::kHermitian) {
      ConfigFail("No traceless, unit-determinant, Hermitian 2x2 matrix exists");
    }
  } else if (options_.dimension % 2 == 1) {
    // Odd dimension: every eigenvalue is imaginary, and so is the determinant.
    if (options_.symmetry == Symmetry::kAntisymmetric) {
      ConfigFail("No unit-determinant antisymmetric matrix exists in odd dimensions");
    }
    if (options_.symmetry == Symmetry::kAntihermitian) {
      ConfigFail("No unit-determinant antihermitian matrix exists in odd dimensions");
    }
  }
}

bool SquareMatrices::ApplySymmetry(Value* array, Rng*) const {
  const int64_t n = options_.dimension;
  const Value original = *array;
  for (int64_t r = 0; r < n; ++r) {
    for (int64_t c = 0; c < n; ++c) {
      const Complex a = original.At(r, c);
      const Complex b = original.At(c, r);
      switch (options_.symmetry) {
        case Symmetry::kNone:
          break;
        case Symmetry::kDiagonal:
          if (r != c) array->At(r, c) = Complex(0.0, 0.0);
          break;
        case Symmetry::kSymmetric:
          array->At(r, c) = a + b;
          break;
        case Symmetry::kAntisymmetric:
          array->At(r, c) = a - b;
          break;
        case Symmetry::kHermitian:
          array->At(r, c) = a + std::conj(b);
          break;
        case Symmetry::kAntihermitian:
          array->At(r, c) = a - std::conj(b);
          break;
      }
    }
  }
  if (options_.traceless) {
    const Complex shift = runtime::Trace(*array) / static_cast<double>(n);
    for (int64_t k = 0; k < n; ++k) {
      array->At(k, k) -= shift;
    }
  }
  return true;
}

bool SquareMatrices::Normalize(Value* array, Rng* rng) const {
  if (options_.determinant && *options_.determinant == 1) {
    return MakeDeterminantOne(array);
  }
  if (options_.determinant && *options_.determinant == 0) {
    MakeDeterminantZero(array, rng);
  }
  return ArraySamplingSet::Normalize(array, rng);
}

bool SquareMatrices::MakeDeterminantOne(Value* array) const {
  const double n = static_cast<double>(options_.dimension);
  const bool odd = options_.dimension % 2 == 1;
  Complex det = runtime::Determinant(*array);
  if (options_.complex && options_.symmetry != Symmetry::kHermitian &&
      options_.symmetry != Symmetry::kAntihermitian) {
    if (std::abs(det) < 1e-13) {
      return false;
    }
    Scale(array, 1.0 / std::pow(det, 1.0 / n));
    return true;
  }
  // Real matrices, and hermitian or antihermitian ones, have a real determinant.
  const double real_det = det.real();
  if (real_det > 0.0) {
    Scale(array, Complex(1.0 / std::pow(real_det, 1.0 / n), 0.0));
    return true;
  }
  if (odd && real_det < 0.0) {
    Scale(array, Complex(-1.0 / std::pow(-real_det, 1.0 / n), 0.0));
    return true;
  }
  return false;
}

void SquareMatrices::MakeDeterminantZero(Value* array, Rng* rng) const {
  const int64_t n = options_.dimension;
  if (options_.symmetry == Symmetry::kDiagonal) {
    const int64_t index = static_cast<int64_t>(rng->Index(static_cast<size_t>(n)));
    array->At(index, index) = Complex(0.0, 0.0);
    return;
  }
  // Projecting out a random direction keeps the symmetry and leaves a null vector.
  // Symmetric matrices need a real projector so that P^T = P.
  const bool complex_direction =
      options_.symmetry == Symmetry::kHermitian ||
      options_.symmetry == Symmetry::kAntihermitian ||
      (options_.symmetry == Symmetry::kNone && options_.complex);
  const Value projector = RandomProjector(n, complex_direction, rng);
  if (options_.symmetry == Symmetry::kNone) {
    *array = runtime::MatMul(*array, projector);
    return;
  }
  *array = runtime::MatMul(projector, runtime::MatMul(*array, projector));
}

OrthogonalMatrices::OrthogonalMatrices(int64_t dimension, bool unitdet)
    : dimension_(dimension), unitdet_(unitdet) {
  CheckDimension("OrthogonalMatrices", dimension_);
}

Value OrthogonalMatrices::Sample(Rng* rng) const {
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    Value q;
    try {
      q = runtime::OrthonormalFactor(GaussianMatrix(dimension_, false, rng));
    } catch (const util::Error& err) {
      if (err.kind() != util::ErrorKind::kZeroDivision) throw;
      continue;
    }
    if (unitdet_ && runtime::Determinant(q).real() < 0.0) {
      for (int64_t r = 0; r < dimension_; ++r) {
        q.At(r, 0) = -q.At(r, 0);
      }
    }
    return q;
  }
  ConfigFail("Unable to construct sample for OrthogonalMatrices");
}

UnitaryMatrices::UnitaryMatrices(int64_t dimension, bool unitdet)
    : dimension_(dimension), unitdet_(unitdet) {
  CheckDimension("UnitaryMatrices", dimension_);
}

Value UnitaryMatrices::Sample(Rng* rng) const {
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    Value q;
    try {
      q = runtime::OrthonormalFactor(GaussianMatrix(dimension_, true, rng));
    } catch (const util::Error& err) {
      if (err.kind() != util::ErrorKind::kZeroDivision) throw;
      continue;
    }
    if (unitdet_) {
      const Complex det = runtime::Determinant(q);
      Scale(&q, 1.0 / std::pow(det, 1.0 / static_cast<double>(dimension_)));
    }
    return q;
  }
  ConfigFail("Unable to construct sample for UnitaryMatrices");
}

}  // namespace mathgrade::sampling
