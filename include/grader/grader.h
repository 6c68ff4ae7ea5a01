#ifndef MATHGRADE_GRADER_GRADER_H_
#define MATHGRADE_GRADER_GRADER_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "grader/comparer.h"
#include "grader/config.h"
#include "parser/ast.h"
#include "parser/parse_cache.h"
#include "runtime/environment.h"
#include "runtime/ops.h"
#include "sampling/sampler.h"
#include "util/error.h"

namespace mathgrade::grader {

/// An instructor answer: a comparer and the expressions it is given, plus the credit
/// awarded on a match.
struct Answer {
  /// Equality comparer on a single expression.
  Answer(const std::string& expected);
  Answer(const char* expected);
  Answer(std::shared_ptr<const Comparer> comparer, std::vector<std::string> params);

  std::shared_ptr<const Comparer> comparer;
  std::vector<std::string> params;
  double grade_decimal = 1.0;
  std::string message;
};

struct GradeOptions {
  uint64_t seed = 0;
  /// Overrides the configured sample count.
  std::optional<int> samples;
};

/// A student-facing error.
struct Diagnostic {
  util::ErrorKind kind = util::ErrorKind::kParse;
  std::string message;
  int start = -1;
  int end = -1;
};

struct GradeResult {
  Outcome ok = Outcome::kMismatch;
  double grade_decimal = 0.0;
  std::string message;
  std::optional<Diagnostic> diagnostic;
  /// Per-trial lines, filled in debug mode.
  std::vector<std::string> debug_log;

  bool correct() const { return ok == Outcome::kMatch; }
};

/// Grades student formulas against instructor answers by evaluating both in randomly
/// sampled bindings. Configuration is validated once at construction; Grade is const
/// and may be called repeatedly.
class Grader {
 public:
  /// Throws a kConfig util::Error for invalid configuration. `cache` is not owned and
  /// may be shared between graders; null parses without caching.
  explicit Grader(GraderConfig config, parser::ParseCache* cache = nullptr);

  GradeResult Grade(const Answer& answer, const std::string& student,
                    const GradeOptions& options = GradeOptions()) const;

  const GraderConfig& config() const { return config_; }
  const ResolvedConfig& resolved() const { return resolved_; }
  const sampling::Sampler& sampler() const { return *sampler_; }

  /// Options used for the student's expressions.
  runtime::EvalOptions StudentEvalOptions() const;
  /// Shape-aware settings handed to comparers.
  ComparerUtils Utils() const;

  /// Parses through the cache when one is attached.
  std::shared_ptr<const parser::ParsedExpression> Parse(const std::string& source) const;

  /// Forbidden strings, required functions and permitted functions, in that order.
  /// Returns the failure message, or std::nullopt when the answer passes.
  std::optional<std::string> PostMatchCheck(const std::string& student,
                                            const std::set<std::string>& functions_used) const;

  /// The scope a student expression sees: `trial` without the instructor variables.
  std::shared_ptr<const runtime::Environment> StudentScope(
      std::shared_ptr<const runtime::Environment> trial) const;

  /// Turns a student-facing error into a result, honoring shape_errors.
  GradeResult StudentError(const util::Error& err) const;

 private:
  GraderConfig config_;
  ResolvedConfig resolved_;
  std::unique_ptr<sampling::Sampler> sampler_;
  parser::ParseCache* cache_;
};

/// Converts util::Error to a Diagnostic.
Diagnostic MakeDiagnostic(const util::Error& err);

}  // namespace mathgrade::grader

#endif  // MATHGRADE_GRADER_GRADER_H_
