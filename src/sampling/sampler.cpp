#include "sampling/sampler.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "util/error.h"
#include "util/string.h"

namespace mathgrade::sampling {

namespace {

const DependentSampler* AsDependent(const SamplingSet* set) {
  return dynamic_cast<const DependentSampler*>(set);
}

}  // namespace

bool IsNumberedInstance(const std::string& name, const std::string& head) {
  const std::string prefix = head + "_{";
  if (name.size() <= prefix.size() + 1 || name.compare(0, prefix.size(), prefix) != 0 ||
      name.back() != '}') {
    return false;
  }
  std::string index = name.substr(prefix.size(), name.size() - prefix.size() - 1);
  if (index == "0") {
    return true;
  }
  if (!index.empty() && index.front() == '-') {
    index.erase(0, 1);
  }
  if (index.empty() || index.front() == '0') {
    return false;
  }
  return std::all_of(index.begin(), index.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

Sampler::Sampler(
    std::vector<std::string> variables, std::vector<std::string> numbered_heads,
    std::map<std::string, std::shared_ptr<const SamplingSet>> sample_from,
    std::map<std::string, std::shared_ptr<const FunctionSamplingSet>> function_samplers)
    : variables_(std::move(variables)),
      numbered_heads_(std::move(numbered_heads)),
      sample_from_(std::move(sample_from)),
      function_samplers_(std::move(function_samplers)) {
  for (const auto& entry : sample_from_) {
    const bool declared =
        std::find(variables_.begin(), variables_.end(), entry.first) != variables_.end() ||
        std::find(numbered_heads_.begin(), numbered_heads_.end(), entry.first) !=
            numbered_heads_.end();
    if (!declared) {
      throw util::Error(util::ErrorKind::kConfig,
                        "sample_from contains '" + entry.first +
                            "', which is not a declared variable or numbered variable");
    }
    if (!entry.second) {
      throw util::Error(util::ErrorKind::kConfig,
                        "sample_from entry '" + entry.first + "' has no sampling set");
    }
  }
  for (const auto& head : numbered_heads_) {
    if (AsDependent(SamplerFor(head).get())) {
      throw util::Error(util::ErrorKind::kConfig,
                        "Numbered variable '" + head + "' cannot use a DependentSampler");
    }
  }

  // Resolve dependents in passes; whatever cannot be resolved is part of a cycle or
  // depends on something that is never sampled.
  std::set<std::string> available;
  std::map<std::string, const DependentSampler*> pending;
  for (const auto& name : variables_) {
    const DependentSampler* dependent = AsDependent(SamplerFor(name).get());
    if (dependent) {
      pending[name] = dependent;
    } else {
      available.insert(name);
    }
  }
  while (!pending.empty()) {
    bool progress = false;
    for (auto it = pending.begin(); it != pending.end();) {
      const auto& depends = it->second->depends();
      const bool ready = std::all_of(depends.begin(), depends.end(), [&](const std::string& d) {
        return available.count(d) > 0 || NumberedHeadOf(d) != nullptr;
      });
      if (!ready) {
        ++it;
        continue;
      }
      available.insert(it->first);
      dependent_order_.push_back(it->first);
      it = pending.erase(it);
      progress = true;
    }
    if (!progress) {
      std::vector<std::string> names;
      for (const auto& entry : pending) {
        names.push_back(entry.first);
      }
      throw util::Error(util::ErrorKind::kConfig,
                        "Circularly dependent DependentSamplers detected: " +
                            util::Join(names, ", "));
    }
  }
}

std::shared_ptr<const SamplingSet> Sampler::SamplerFor(const std::string& name) const {
  auto it = sample_from_.find(name);
  if (it != sample_from_.end()) {
    return it->second;
  }
  const std::string* head = NumberedHeadOf(name);
  if (head) {
    it = sample_from_.find(*head);
    if (it != sample_from_.end()) {
      return it->second;
    }
  }
  static const std::shared_ptr<const SamplingSet> fallback = std::make_shared<RealInterval>();
  return fallback;
}

const std::string* Sampler::NumberedHeadOf(const std::string& name) const {
  for (const auto& head : numbered_heads_) {
    if (IsNumberedInstance(name, head)) {
      return &head;
    }
  }
  return nullptr;
}

std::vector<std::string> Sampler::Plan(const std::set<std::string>& names) const {
  std::vector<std::string> plan = variables_;
  for (const auto& name : names) {
    if (std::find(variables_.begin(), variables_.end(), name) != variables_.end()) {
      continue;
    }
    if (NumberedHeadOf(name)) {
      plan.push_back(name);
    }
  }
  return plan;
}

TrialSample Sampler::Sample(const std::vector<std::string>& plan, Rng* rng) const {
  TrialSample trial;
  for (const auto& name : plan) {
    auto set = SamplerFor(name);
    if (AsDependent(set.get())) {
      continue;
    }
    trial.values[name] = set->Sample(rng);
  }
  for (const auto& name : dependent_order_) {
    const DependentSampler* dependent = AsDependent(SamplerFor(name).get());
    trial.values[name] = dependent->Compute(trial.values);
  }
  for (const auto& entry : function_samplers_) {
    trial.functions[entry.first] = entry.second->Sample(entry.first, rng);
  }
  return trial;
}

std::shared_ptr<runtime::Environment> Sampler::SampleBindings(
    const std::vector<std::string>& plan, std::shared_ptr<const runtime::Environment> scope,
    Rng* rng, TrialSample* drawn) const {
  TrialSample trial = Sample(plan, rng);
  auto env = std::make_shared<runtime::Environment>(std::move(scope));
  for (const auto& entry : trial.values) {
    env->Define(entry.first, entry.second);
  }
  for (const auto& entry : trial.functions) {
    env->DefineFunction(entry.first, entry.second);
  }
  if (drawn) {
    *drawn = std::move(trial);
  }
  return env;
}

}  // namespace mathgrade::sampling
