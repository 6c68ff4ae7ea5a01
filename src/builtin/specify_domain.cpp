#include "builtin/specify_domain.h"

#include <utility>

#include "util/error.h"

namespace mathgrade::builtin {

namespace {

std::string DomainReport(const std::string& name, const std::vector<ShapeSpec>& expected,
                         const std::vector<runtime::Value>& args) {
  std::string message = "There was an error evaluating function " + name + "(...)";
  for (size_t i = 0; i < args.size(); ++i) {
    const ShapeSpec& spec = expected[i];
    const std::string ordinal = LowOrdinal(static_cast<int>(i) + 1);
    if (spec.Accepts(args[i])) {
      message += "\n" + ordinal + " input is ok: received a " + spec.Description() +
                 " as expected";
    } else {
      message += "\n" + ordinal + " input has an error: received a " + args[i].Description() +
                 ", expected a " + spec.Description();
    }
  }
  return message;
}

void CheckInputs(const std::string& name, const std::vector<ShapeSpec>& expected,
                 const std::vector<runtime::Value>& args) {
  for (size_t i = 0; i < args.size(); ++i) {
    if (!expected[i].Accepts(args[i])) {
      throw util::Error(util::ErrorKind::kDomain, DomainReport(name, expected, args));
    }
  }
}

}  // namespace

ShapeSpec ShapeSpec::Array(std::vector<int64_t> dims) {
  ShapeSpec spec;
  spec.kind = ShapeKind::kArray;
  spec.shape = std::move(dims);
  return spec;
}

ShapeSpec ShapeSpec::Square() {
  ShapeSpec spec;
  spec.kind = ShapeKind::kSquare;
  return spec;
}

bool ShapeSpec::Accepts(const runtime::Value& value) const {
  switch (kind) {
    case ShapeKind::kScalar:
      return value.IsScalar();
    case ShapeKind::kArray:
      return value.shape == shape;
    case ShapeKind::kSquare:
      return value.IsSquare();
  }
  return false;
}

std::string ShapeSpec::Description() const {
  switch (kind) {
    case ShapeKind::kScalar:
      return "scalar";
    case ShapeKind::kArray:
      return runtime::DescribeShape(shape);
    case ShapeKind::kSquare:
      return "square matrix";
  }
  return "value";
}

std::string LowOrdinal(int n) {
  switch (n) {
    case 1:
      return "1st";
    case 2:
      return "2nd";
    case 3:
      return "3rd";
    default:
      return std::to_string(n) + "th";
  }
}

std::shared_ptr<runtime::Function> SpecifyDomain(const std::string& name,
                                                 std::vector<ShapeSpec> shapes,
                                                 runtime::NativeFunction impl) {
  const int arity = static_cast<int>(shapes.size());
  auto fn = runtime::MakeFunction(
      name, arity,
      [name, shapes = std::move(shapes), impl = std::move(impl)](
          const std::vector<runtime::Value>& args) {
        if (args.size() != shapes.size()) {
          throw util::Error(util::ErrorKind::kDomain,
                            "There was an error evaluating function " + name + "(...): expected " +
                                std::to_string(shapes.size()) + " inputs, but received " +
                                std::to_string(args.size()) + ".");
        }
        CheckInputs(name, shapes, args);
        return impl(args);
      });
  fn->validated = true;
  return fn;
}

std::shared_ptr<runtime::Function> SpecifyDomainVariadic(const std::string& name, ShapeSpec shape,
                                                         int min_length,
                                                         runtime::NativeFunction impl) {
  auto fn = runtime::MakeFunction(
      name, min_length,
      [name, shape = std::move(shape), min_length, impl = std::move(impl)](
          const std::vector<runtime::Value>& args) {
        if (static_cast<int>(args.size()) < min_length) {
          throw util::Error(util::ErrorKind::kDomain,
                            "There was an error evaluating function " + name +
                                "(...): expected at least " + std::to_string(min_length) +
                                " inputs, but received " + std::to_string(args.size()) + ".");
        }
        CheckInputs(name, std::vector<ShapeSpec>(args.size(), shape), args);
        return impl(args);
      });
  fn->variadic = true;
  fn->validated = true;
  return fn;
}

}  // namespace mathgrade::builtin
