#ifndef MATHGRADE_RUNTIME_ENVIRONMENT_H_
#define MATHGRADE_RUNTIME_ENVIRONMENT_H_

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "runtime/value.h"

namespace mathgrade::runtime {

/// Variable, function and number-suffix bindings for one evaluation. Lookups fall back
/// to the parent scope; a child never mutates its parent.
class Environment {
 public:
  explicit Environment(std::shared_ptr<const Environment> parent = nullptr)
      : parent_(std::move(parent)) {}

  /// Stores or replaces a named value.
  void Define(const std::string& name, const Value& value) { values_[name] = value; }

  void DefineFunction(const std::string& name, std::shared_ptr<const Function> fn) {
    functions_[name] = std::move(fn);
  }

  void DefineSuffix(const std::string& suffix, double scale) { suffixes_[suffix] = scale; }

  /// Hides a name from this scope even if a parent defines it.
  void Erase(const std::string& name) {
    values_.erase(name);
    hidden_.insert(name);
  }

  /// Looks up a name, returning std::nullopt if it is undefined.
  std::optional<Value> Get(const std::string& name) const {
    auto it = values_.find(name);
    if (it != values_.end()) {
      return it->second;
    }
    if (!parent_ || hidden_.count(name) > 0) {
      return std::nullopt;
    }
    return parent_->Get(name);
  }

  std::shared_ptr<const Function> GetFunction(const std::string& name) const {
    auto it = functions_.find(name);
    if (it != functions_.end()) {
      return it->second;
    }
    if (!parent_) {
      return nullptr;
    }
    return parent_->GetFunction(name);
  }

  std::optional<double> GetSuffix(const std::string& suffix) const {
    auto it = suffixes_.find(suffix);
    if (it != suffixes_.end()) {
      return it->second;
    }
    if (!parent_) {
      return std::nullopt;
    }
    return parent_->GetSuffix(suffix);
  }

  bool HasVariable(const std::string& name) const { return Get(name).has_value(); }
  bool HasFunction(const std::string& name) const { return GetFunction(name) != nullptr; }

  /// All visible names, sorted, including those inherited from parents.
  std::set<std::string> VariableNames() const {
    std::set<std::string> names;
    if (parent_) {
      for (const auto& name : parent_->VariableNames()) {
        if (hidden_.count(name) == 0) names.insert(name);
      }
    }
    for (const auto& entry : values_) names.insert(entry.first);
    return names;
  }

  std::set<std::string> FunctionNames() const {
    std::set<std::string> names;
    if (parent_) names = parent_->FunctionNames();
    for (const auto& entry : functions_) names.insert(entry.first);
    return names;
  }

  std::set<std::string> SuffixNames() const {
    std::set<std::string> names;
    if (parent_) names = parent_->SuffixNames();
    for (const auto& entry : suffixes_) names.insert(entry.first);
    return names;
  }

 private:
  std::map<std::string, Value> values_;
  std::map<std::string, std::shared_ptr<const Function>> functions_;
  std::map<std::string, double> suffixes_;
  std::set<std::string> hidden_;
  std::shared_ptr<const Environment> parent_;
};

}  // namespace mathgrade::runtime

#endif  // MATHGRADE_RUNTIME_ENVIRONMENT_H_
