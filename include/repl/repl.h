#ifndef MATHGRADE_REPL_REPL_H_
#define MATHGRADE_REPL_REPL_H_

#include <iostream>
#include <memory>
#include <string>

#include "builtin/builtins.h"
#include "parser/parser.h"
#include "runtime/ops.h"
#include "util/string.h"

namespace mathgrade::repl {

/// Calculator console over the default scope plus the array functions.
class Repl {
 public:
  Repl();

  /// Starts the interactive loop until EOF or "exit".
  void Run();

 private:
  /// Processes one line; returns true when the loop should terminate. `name = expr`
  /// binds a variable for later lines.
  bool ProcessLine(const std::string& line);

  std::shared_ptr<runtime::Environment> env_;
};

}  // namespace mathgrade::repl

#endif  // MATHGRADE_REPL_REPL_H_
