#ifndef MATHGRADE_GRADER_CONFIG_H_
#define MATHGRADE_GRADER_CONFIG_H_

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "grader/comparer.h"
#include "grader/tolerance.h"
#include "runtime/environment.h"
#include "runtime/value.h"
#include "sampling/sampling_set.h"

namespace mathgrade::grader {

enum class GraderKind { kFormula, kNumerical, kMatrix };

const char* GraderKindName(GraderKind kind);

/// A whitelist holding only this entry permits no default functions.
inline const std::string kWhitelistNone = "";

struct GraderConfig {
  GraderKind kind = GraderKind::kFormula;

  std::vector<std::string> variables;
  /// Heads `a` of numbered variables `a_{1}`, `a_{-2}`, ...
  std::vector<std::string> numbered_vars;
  /// Per-variable sampling sets; unlisted variables draw from RealInterval [1, 5].
  std::map<std::string, std::shared_ptr<const sampling::SamplingSet>> sample_from;
  std::map<std::string, std::shared_ptr<const runtime::Function>> user_functions;
  /// Functions redrawn every trial.
  std::map<std::string, std::shared_ptr<const sampling::FunctionSamplingSet>> random_functions;
  std::map<std::string, runtime::Value> user_constants;
  /// Default constants to remove from scope.
  std::vector<std::string> removed_constants;

  std::vector<std::string> whitelist;
  std::vector<std::string> blacklist;

  Tolerance tolerance = Tolerance::Percent(0.01);
  int samples = 5;
  int failable_evals = 0;

  std::vector<std::string> forbidden_strings;
  std::string forbidden_message = "Invalid Input: This particular answer is forbidden";
  std::vector<std::string> required_functions;
  /// Visible to comparer parameters only.
  std::vector<std::string> instructor_vars;

  bool metric_suffixes = false;
  bool suppress_warnings = false;
  bool debug = false;

  /// Highest array rank the student may write literally; 0 forbids arrays.
  int max_array_dim = 0;
  /// Defines `I` as the identity of this size when set.
  std::optional<int64_t> identity_dim;
  bool negative_powers = true;
  /// When false, shape errors in the student's answer grade as incorrect with the
  /// message instead of being reported as errors.
  bool shape_errors = true;
  ShapeDetail answer_shape_mismatch = ShapeDetail::kType;

  /// Tolerance 0.01%, 5 samples, no arrays.
  static GraderConfig Formula();
  /// Tolerance 5%, 1 sample, no variables.
  static GraderConfig Numerical();
  /// Vectors allowed, array functions in scope, shape-aware equality.
  static GraderConfig Matrix();
};

/// The validated, derived form of a GraderConfig.
struct ResolvedConfig {
  /// Constants, functions and suffixes shared by every trial.
  std::shared_ptr<const runtime::Environment> scope;
  /// Function names the student may use.
  std::set<std::string> permitted_functions;
  /// Default function names for the grader kind.
  std::set<std::string> default_functions;
};

/// Checks every rule a grader enforces at construction and builds the shared scope.
/// Throws a kConfig util::Error describing the first problem found.
ResolvedConfig ResolveConfig(const GraderConfig& config);

/// ['a', 'b'] with the names sorted.
std::string FormatNameList(std::vector<std::string> names);

}  // namespace mathgrade::grader

#endif  // MATHGRADE_GRADER_CONFIG_H_
