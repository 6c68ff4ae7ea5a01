#include "repl/repl.h"

#include <cctype>
#include <iostream>
#include <string>

namespace mathgrade::repl {

namespace {

bool IsIdentifier(const std::string& text) {
  if (text.empty() || !(std::isalpha(static_cast<unsigned char>(text.front())) ||
                        text.front() == '_')) {
    return false;
  }
  for (char c : text) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '\'') {
      return false;
    }
  }
  return true;
}

}  // namespace

Repl::Repl() : env_(std::make_shared<runtime::Environment>(builtin::DefaultScope())) {
  builtin::InstallArrayFunctions(env_.get());
}

void Repl::Run() {
  std::string line;
  while (true) {
    std::cout << "mathgrade> " << std::flush;
    if (!std::getline(std::cin, line)) {
      std::cout << "\n";
      break;
    }
    if (ProcessLine(line)) {
      break;
    }
  }
}

bool Repl::ProcessLine(const std::string& line) {
  std::string trimmed = util::Trim(line);
  if (trimmed.empty()) {
    return false;
  }
  if (trimmed == "exit") {
    return true;
  }
  std::string target;
  std::string source = trimmed;
  const size_t eq = trimmed.find('=');
  if (eq != std::string::npos && IsIdentifier(util::Trim(trimmed.substr(0, eq)))) {
    target = util::Trim(trimmed.substr(0, eq));
    source = trimmed.substr(eq + 1);
  }
  try {
    auto parsed = parser::ParseFormula(source);
    runtime::Value value = runtime::EvaluateFormula(*parsed, *env_);
    if (!target.empty()) {
      env_->Define(target, value);
    }
    std::cout << value.ToString() << "\n";
  } catch (const util::Error& err) {
    std::cout << err.formatted() << "\n";
  } catch (const std::exception& ex) {
    std::cout << "Unhandled error: " << ex.what() << "\n";
  }
  return false;
}

}  // namespace mathgrade::repl
