#include "grader/config.h"

#include <algorithm>
#include <utility>

#include "builtin/builtins.h"
#include "runtime/linalg.h"
#include "util/error.h"
#include "util/string.h"

namespace mathgrade::grader {

namespace {

[[noreturn]] void ConfigFail(const std::string& message) {
  throw util::Error(util::ErrorKind::kConfig, message);
}

template <typename Names>
std::vector<std::string> Overlap(const std::vector<std::string>& names, const Names& defaults) {
  std::vector<std::string> out;
  for (const auto& name : names) {
    if (defaults.count(name) > 0) out.push_back(name);
  }
  return out;
}

template <typename Map>
std::vector<std::string> Keys(const Map& map) {
  std::vector<std::string> keys;
  for (const auto& entry : map) keys.push_back(entry.first);
  return keys;
}

void WarnIfOverride(const GraderConfig& config, const std::string& key,
                    const std::vector<std::string>& names, const std::set<std::string>& defaults) {
  if (config.suppress_warnings) return;
  const std::vector<std::string> overridden = Overlap(names, defaults);
  if (overridden.empty()) return;
  ConfigFail("Warning: '" + key + "' contains entries '" + FormatNameList(overridden) +
             "' which will override default values. If you intend to override defaults, you "
             "may suppress this warning by adding 'suppress_warnings=True' to the grader "
             "configuration.");
}

void CheckNoCollisions(const std::string& key_a, const std::vector<std::string>& a,
                       const std::string& key_b, const std::vector<std::string>& b) {
  std::vector<std::string> duplicates;
  for (const auto& name : a) {
    if (std::find(b.begin(), b.end(), name) != b.end()) duplicates.push_back(name);
  }
  if (duplicates.empty()) return;
  const bool in_order = key_a < key_b;
  ConfigFail("'" + (in_order ? key_a : key_b) + "' and '" + (in_order ? key_b : key_a) +
             "' contain duplicate entries: " + FormatNameList(duplicates));
}

void CheckUnique(const std::string& key, const std::vector<std::string>& names) {
  std::set<std::string> seen;
  std::vector<std::string> duplicates;
  for (const auto& name : names) {
    if (!seen.insert(name).second) duplicates.push_back(name);
  }
  if (!duplicates.empty()) {
    ConfigFail("'" + key + "' contains duplicate entries: " + FormatNameList(duplicates));
  }
}

void CheckNumerical(const GraderConfig& config) {
  if (!config.variables.empty()) ConfigFail("NumericalGrader does not accept 'variables'");
  if (!config.numbered_vars.empty()) ConfigFail("NumericalGrader does not accept 'numbered_vars'");
  if (!config.sample_from.empty()) ConfigFail("NumericalGrader does not accept 'sample_from'");
  if (!config.random_functions.empty()) {
    ConfigFail("NumericalGrader does not accept random functions");
  }
  if (config.samples != 1) ConfigFail("NumericalGrader always uses 1 sample");
  if (config.failable_evals != 0) ConfigFail("NumericalGrader does not accept failable_evals");
}

}  // namespace

const char* GraderKindName(GraderKind kind) {
  switch (kind) {
    case GraderKind::kFormula:
      return "FormulaGrader";
    case GraderKind::kNumerical:
      return "NumericalGrader";
    case GraderKind::kMatrix:
      return "MatrixGrader";
  }
  return "FormulaGrader";
}

GraderConfig GraderConfig::Formula() {
  return GraderConfig();
}

GraderConfig GraderConfig::Numerical() {
  GraderConfig config;
  config.kind = GraderKind::kNumerical;
  config.tolerance = Tolerance::Percent(5.0);
  config.samples = 1;
  return config;
}

GraderConfig GraderConfig::Matrix() {
  GraderConfig config;
  config.kind = GraderKind::kMatrix;
  config.max_array_dim = 1;
  return config;
}

std::string FormatNameList(std::vector<std::string> names) {
  std::sort(names.begin(), names.end());
  for (auto& name : names) {
    name = "'" + name + "'";
  }
  return "[" + util::Join(names, ", ") + "]";
}

ResolvedConfig ResolveConfig(const GraderConfig& config) {
  if (config.samples < 1) ConfigFail("samples must be a positive integer");
  if (config.failable_evals < 0) ConfigFail("failable_evals must be non-negative");
  if (config.max_array_dim < 0) ConfigFail("max_array_dim must be non-negative");
  if (config.identity_dim && *config.identity_dim < 1) {
    ConfigFail("identity_dim must be a positive integer");
  }
  if (config.kind == GraderKind::kNumerical) {
    CheckNumerical(config);
  }

  auto scope = std::make_shared<runtime::Environment>();
  builtin::InstallConstants(scope.get());
  builtin::InstallDefaultFunctions(scope.get());
  builtin::InstallDefaultSuffixes(scope.get());
  if (config.kind == GraderKind::kMatrix) {
    builtin::InstallArrayFunctions(scope.get());
  }
  if (config.metric_suffixes) {
    builtin::InstallMetricSuffixes(scope.get());
  }

  ResolvedConfig resolved;
  resolved.default_functions = scope->FunctionNames();
  const std::set<std::string>& defaults = resolved.default_functions;

  if (!config.whitelist.empty() && !config.blacklist.empty()) {
    ConfigFail("Cannot whitelist and blacklist at the same time");
  }
  for (const auto& name : config.blacklist) {
    if (defaults.count(name) == 0) ConfigFail("Unknown function in blacklist: " + name);
  }
  const bool whitelist_none =
      config.whitelist.size() == 1 && config.whitelist.front() == kWhitelistNone;
  if (!whitelist_none) {
    for (const auto& name : config.whitelist) {
      if (defaults.count(name) == 0) ConfigFail("Unknown function in whitelist: " + name);
    }
  }

  for (const auto& name : config.removed_constants) {
    scope->Erase(name);
  }
  const std::set<std::string> default_variables = scope->VariableNames();

  CheckUnique("variables", config.variables);
  CheckUnique("numbered_vars", config.numbered_vars);
  WarnIfOverride(config, "variables", config.variables, default_variables);
  WarnIfOverride(config, "numbered_vars", config.numbered_vars, default_variables);
  WarnIfOverride(config, "user_constants", Keys(config.user_constants), default_variables);
  std::vector<std::string> user_function_names = Keys(config.user_functions);
  for (const auto& entry : config.random_functions) {
    user_function_names.push_back(entry.first);
  }
  WarnIfOverride(config, "user_functions", user_function_names, defaults);
  CheckNoCollisions("variables", config.variables, "user_constants",
                    Keys(config.user_constants));
  CheckNoCollisions("variables", config.variables, "numbered_vars", config.numbered_vars);

  for (const auto& entry : config.user_constants) {
    scope->Define(entry.first, entry.second);
  }
  if (config.identity_dim && !config.user_constants.count("I")) {
    scope->Define("I", runtime::Identity(*config.identity_dim));
  }
  for (const auto& entry : config.user_functions) {
    if (!entry.second) ConfigFail("user_functions entry '" + entry.first + "' is empty");
    scope->DefineFunction(entry.first, entry.second);
  }

  if (config.whitelist.empty()) {
    resolved.permitted_functions = defaults;
    for (const auto& name : config.blacklist) {
      resolved.permitted_functions.erase(name);
    }
  } else if (!whitelist_none) {
    resolved.permitted_functions.insert(config.whitelist.begin(), config.whitelist.end());
  }
  resolved.permitted_functions.insert(user_function_names.begin(), user_function_names.end());
  resolved.scope = std::move(scope);
  return resolved;
}

}  // namespace mathgrade::grader
