#ifndef MATHGRADE_SAMPLING_SAMPLER_H_
#define MATHGRADE_SAMPLING_SAMPLER_H_

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "runtime/environment.h"
#include "runtime/value.h"
#include "sampling/rng.h"
#include "sampling/sampling_set.h"

namespace mathgrade::sampling {

/// True when `name` is `head_{n}` with n an integer without leading zeros (`a_{0}`,
/// `a_{-3}`, `a_{42}`).
bool IsNumberedInstance(const std::string& name, const std::string& head);

/// Values and functions drawn for one trial.
struct TrialSample {
  std::map<std::string, runtime::Value> values;
  std::map<std::string, std::shared_ptr<const runtime::Function>> functions;
};

/// Draws per-trial bindings for a grader's declared variables, numbered variables and
/// random functions.
class Sampler {
 public:
  /// Throws a kConfig util::Error for sample_from keys that are neither variables nor
  /// numbered heads, and for circular DependentSampler chains.
  Sampler(std::vector<std::string> variables, std::vector<std::string> numbered_heads,
          std::map<std::string, std::shared_ptr<const SamplingSet>> sample_from,
          std::map<std::string, std::shared_ptr<const FunctionSamplingSet>> function_samplers);

  /// The variables to draw for expressions using `names`: every declared variable, then
  /// each numbered instance found in `names`.
  std::vector<std::string> Plan(const std::set<std::string>& names) const;

  /// Independent variables first, then dependents in setup order, then one draw per
  /// function sampler.
  TrialSample Sample(const std::vector<std::string>& plan, Rng* rng) const;

  /// Sample, bound into a fresh child of `scope`. The draw is copied to `drawn` when it
  /// is not null.
  std::shared_ptr<runtime::Environment> SampleBindings(
      const std::vector<std::string>& plan, std::shared_ptr<const runtime::Environment> scope,
      Rng* rng, TrialSample* drawn = nullptr) const;

  const std::vector<std::string>& variables() const { return variables_; }
  const std::vector<std::string>& numbered_heads() const { return numbered_heads_; }
  /// Dependent variables in the order they are computed.
  const std::vector<std::string>& dependent_order() const { return dependent_order_; }
  std::shared_ptr<const SamplingSet> SamplerFor(const std::string& name) const;

 private:
  const std::string* NumberedHeadOf(const std::string& name) const;

  std::vector<std::string> variables_;
  std::vector<std::string> numbered_heads_;
  std::map<std::string, std::shared_ptr<const SamplingSet>> sample_from_;
  std::map<std::string, std::shared_ptr<const FunctionSamplingSet>> function_samplers_;
  std::vector<std::string> dependent_order_;
};

}  // namespace mathgrade::sampling

#endif  // MATHGRADE_SAMPLING_SAMPLER_H_
