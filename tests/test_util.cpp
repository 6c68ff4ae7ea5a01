#include "test_util.h"

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace test {

void ExpectNear(double actual, double expected, const std::string& name, TestContext* ctx) {
  if (std::fabs(actual - expected) <= kEpsilon * std::max(1.0, std::fabs(expected))) {
    ++ctx->passed;
    return;
  }
  ++ctx->failed;
  std::cerr << "[FAIL] " << name << " expected " << expected << " got " << actual << "\n";
}

void ExpectTrue(bool value, const std::string& name, TestContext* ctx) {
  if (value) {
    ++ctx->passed;
    return;
  }
  ++ctx->failed;
  std::cerr << "[FAIL] " << name << " expected true\n";
}

void ExpectComplexNear(rt::Complex actual, rt::Complex expected, const std::string& name,
                       TestContext* ctx) {
  if (std::abs(actual - expected) <= kEpsilon * std::max(1.0, std::abs(expected))) {
    ++ctx->passed;
    return;
  }
  ++ctx->failed;
  std::cerr << "[FAIL] " << name << " expected " << rt::FormatComplex(expected) << " got "
            << rt::FormatComplex(actual) << "\n";
}

std::string ExpectThrowsKind(const std::function<void()>& body, util::ErrorKind kind,
                             const std::string& name, TestContext* ctx) {
  try {
    body();
  } catch (const util::Error& err) {
    if (err.kind() == kind) {
      ++ctx->passed;
      return err.what();
    }
    ++ctx->failed;
    std::cerr << "[FAIL] " << name << " expected " << util::ErrorKindName(kind) << " got "
              << util::ErrorKindName(err.kind()) << ": " << err.what() << "\n";
    return "";
  }
  ++ctx->failed;
  std::cerr << "[FAIL] " << name << " expected " << util::ErrorKindName(kind)
            << " but nothing was thrown\n";
  return "";
}

std::shared_ptr<rt::Environment> MakeScope() {
  auto env = std::make_shared<rt::Environment>(bt::DefaultScope());
  bt::InstallArrayFunctions(env.get());
  return env;
}

rt::Value EvalExpr(const std::string& expr, const rt::Environment& env,
                   const rt::EvalOptions& options) {
  auto parsed = ps::ParseFormula(expr);
  return rt::EvaluateFormula(*parsed, env, options);
}

double EvalReal(const std::string& expr, const rt::Environment& env) {
  return EvalExpr(expr, env).scalar().real();
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

ScopedEnvVar::ScopedEnvVar(const char* name, const char* value) : name_(name) {
  if (const char* old = std::getenv(name)) {
    previous_ = old;
  }
  setenv(name, value, 1);
}

ScopedEnvVar::~ScopedEnvVar() {
  if (previous_) {
    setenv(name_.c_str(), previous_->c_str(), 1);
  } else {
    unsetenv(name_.c_str());
  }
}

}  // namespace test
