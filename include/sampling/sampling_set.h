#ifndef MATHGRADE_SAMPLING_SAMPLING_SET_H_
#define MATHGRADE_SAMPLING_SAMPLING_SET_H_

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "parser/ast.h"
#include "runtime/value.h"
#include "sampling/rng.h"

namespace mathgrade::sampling {

/// A set from which random variable values are drawn.
class SamplingSet {
 public:
  virtual ~SamplingSet() = default;
  virtual runtime::Value Sample(Rng* rng) const = 0;
};

/// Reals in [start, stop]; reversed bounds are swapped.
class RealInterval : public SamplingSet {
 public:
  explicit RealInterval(double start = 1.0, double stop = 5.0);
  runtime::Value Sample(Rng* rng) const override;
  double Draw(Rng* rng) const;

  double start() const { return start_; }
  double stop() const { return stop_; }

 private:
  double start_;
  double stop_;
};

/// Integers in [start, stop], both ends included.
class IntegerRange : public SamplingSet {
 public:
  explicit IntegerRange(int64_t start = 1, int64_t stop = 5);
  runtime::Value Sample(Rng* rng) const override;

 private:
  int64_t start_;
  int64_t stop_;
};

class ComplexRectangle : public SamplingSet {
 public:
  explicit ComplexRectangle(RealInterval re = RealInterval(1.0, 3.0),
                            RealInterval im = RealInterval(1.0, 3.0));
  runtime::Value Sample(Rng* rng) const override;

 private:
  RealInterval re_;
  RealInterval im_;
};

/// Annular sector: modulus in [1, 3] and argument in [0, pi/2] by default.
class ComplexSector : public SamplingSet {
 public:
  ComplexSector();
  ComplexSector(RealInterval modulus, RealInterval argument);
  runtime::Value Sample(Rng* rng) const override;

 private:
  RealInterval modulus_;
  RealInterval argument_;
};

/// Uniform choice from a fixed, non-empty list of values.
class DiscreteSet : public SamplingSet {
 public:
  explicit DiscreteSet(std::vector<runtime::Value> values);
  runtime::Value Sample(Rng* rng) const override;

 private:
  std::vector<runtime::Value> values_;
};

/// A variable computed from other sampled variables by a formula evaluated in the
/// default scope. The formula is parsed once; a bad formula is a kConfig util::Error.
class DependentSampler : public SamplingSet {
 public:
  DependentSampler(std::vector<std::string> depends, std::string formula);

  /// Always throws; dependent values come from Compute.
  runtime::Value Sample(Rng* rng) const override;
  runtime::Value Compute(const std::map<std::string, runtime::Value>& samples) const;

  const std::vector<std::string>& depends() const { return depends_; }
  const std::string& formula() const { return formula_; }

 private:
  std::vector<std::string> depends_;
  std::string formula_;
  std::shared_ptr<const parser::ParsedExpression> parsed_;
};

/// A set from which random functions are drawn.
class FunctionSamplingSet {
 public:
  virtual ~FunctionSamplingSet() = default;
  virtual std::shared_ptr<const runtime::Function> Sample(const std::string& name,
                                                          Rng* rng) const = 0;
};

struct RandomFunctionConfig {
  int input_dim = 1;
  /// Vector output when greater than 1.
  int output_dim = 1;
  int num_terms = 3;
  double center = 0.0;
  double amplitude = 10.0;
};

/// A smooth random function: a sum of sinusoids with random amplitude, frequency and
/// phase, bounded by center +/- amplitude.
class RandomFunction : public FunctionSamplingSet {
 public:
  explicit RandomFunction(RandomFunctionConfig config = RandomFunctionConfig());
  std::shared_ptr<const runtime::Function> Sample(const std::string& name,
                                                  Rng* rng) const override;

 private:
  RandomFunctionConfig config_;
};

/// Uniform choice from a fixed list of functions.
class SpecificFunctions : public FunctionSamplingSet {
 public:
  explicit SpecificFunctions(std::vector<std::shared_ptr<const runtime::Function>> functions);
  std::shared_ptr<const runtime::Function> Sample(const std::string& name,
                                                  Rng* rng) const override;

 private:
  std::vector<std::shared_ptr<const runtime::Function>> functions_;
};

}  // namespace mathgrade::sampling

#endif  // MATHGRADE_SAMPLING_SAMPLING_SET_H_
