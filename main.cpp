// Entry point for the mathgrade console or a one-shot grade.
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "grader/grader.h"
#include "parser/parse_cache.h"
#include "repl/repl.h"
#include "util/env.h"
#include "util/error.h"
#include "util/string.h"

namespace {

void PrintUsage() {
  std::cerr << "usage: mathgrade\n"
            << "       mathgrade --instructor EXPR --student EXPR [--vars a,b] [--seed N]"
               " [--samples N] [--tolerance T] [--matrix] [--debug]\n";
}

}  // namespace

int main(int argc, char** argv) {
  // No args -> console; otherwise grade one answer.
  if (argc == 1) {
    mathgrade::repl::Repl repl;
    repl.Run();
    return 0;
  }

  std::string instructor;
  std::string student;
  bool have_instructor = false;
  bool have_student = false;
  bool matrix = false;
  bool debug = false;
  std::string vars;
  std::string tolerance;
  mathgrade::grader::GradeOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--matrix") {
      matrix = true;
      continue;
    }
    if (arg == "--debug") {
      debug = true;
      continue;
    }
    if (i + 1 >= argc) {
      PrintUsage();
      return 2;
    }
    const char* value = argv[++i];
    uint64_t number = 0;
    if (arg == "--instructor") {
      instructor = value;
      have_instructor = true;
    } else if (arg == "--student") {
      student = value;
      have_student = true;
    } else if (arg == "--vars") {
      vars = value;
    } else if (arg == "--tolerance") {
      tolerance = value;
    } else if (arg == "--seed" && mathgrade::util::ParseUint64(value, &number)) {
      options.seed = number;
    } else if (arg == "--samples" && mathgrade::util::ParseUint64(value, &number)) {
      options.samples = static_cast<int>(number);
    } else {
      PrintUsage();
      return 2;
    }
  }
  if (!have_instructor || !have_student) {
    PrintUsage();
    return 2;
  }

  try {
    auto config = matrix ? mathgrade::grader::GraderConfig::Matrix()
                         : mathgrade::grader::GraderConfig::Formula();
    config.variables = mathgrade::util::Split(vars, ',');
    if (!tolerance.empty()) {
      config.tolerance = mathgrade::grader::Tolerance::Parse(tolerance);
    }
    config.debug = debug;
    mathgrade::parser::ParseCache cache;
    mathgrade::grader::Grader grader(config, &cache);
    const auto result = grader.Grade(instructor, student, options);
    for (const auto& line : result.debug_log) {
      std::cout << line << "\n";
    }
    std::cout << mathgrade::grader::OutcomeName(result.ok) << " " << result.grade_decimal;
    if (!result.message.empty()) {
      std::cout << ": " << result.message;
    }
    std::cout << "\n";
    if (result.diagnostic) {
      std::cout << mathgrade::util::ErrorKindTitle(result.diagnostic->kind);
      if (result.diagnostic->start >= 0) {
        std::cout << " at " << result.diagnostic->start;
      }
      std::cout << "\n";
    }
    return 0;
  } catch (const mathgrade::util::Error& err) {
    std::cerr << err.formatted() << "\n";
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "Unhandled error: " << ex.what() << "\n";
    return 1;
  }
}
