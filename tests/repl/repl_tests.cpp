#include <istream>
#include <ostream>
#include <sstream>

#include "repl/repl.h"
#include "test_util.h"

namespace test {

class StreamRedirect {
 public:
  StreamRedirect(std::istream& in, std::ostream& out, std::istream& new_in, std::ostream& new_out)
      : orig_in_buf_(in.rdbuf()), orig_out_buf_(out.rdbuf()) {
    in.rdbuf(new_in.rdbuf());
    out.rdbuf(new_out.rdbuf());
  }

  ~StreamRedirect() = default;

  void Restore(std::istream& in, std::ostream& out) {
    in.rdbuf(orig_in_buf_);
    out.rdbuf(orig_out_buf_);
  }

 private:
  std::streambuf* orig_in_buf_;
  std::streambuf* orig_out_buf_;
};

namespace {

std::string RunSession(const std::string& script) {
  std::istringstream input(script);
  std::ostringstream output;
  StreamRedirect redirect(std::cin, std::cout, input, output);
  mathgrade::repl::Repl repl;
  repl.Run();
  redirect.Restore(std::cin, std::cout);
  return output.str();
}

}  // namespace

void RunReplTests(TestContext* ctx) {
  std::string out = RunSession("1 + 1\nexit\n");
  ExpectTrue(Contains(out, "mathgrade> 2\n"), "repl_evaluates_expression", ctx);

  out = RunSession("x = 3\nx^2 + 1\nexit\n");
  ExpectTrue(Contains(out, "mathgrade> 3\n") && Contains(out, "mathgrade> 10\n"),
             "repl_assignment", ctx);

  out = RunSession("det([[1, 2], [3, 4]])\n[1, 2]*[3, 4]\n");
  ExpectTrue(Contains(out, "mathgrade> -2\n") && Contains(out, "mathgrade> 11\n"),
             "repl_array_functions", ctx);

  out = RunSession("y + 1\n(1 + 2\nsqrt(-4)\nexit\n");
  ExpectTrue(Contains(out, "'y' not permitted in answer as a variable"),
             "repl_reports_unknown_variable", ctx);
  ExpectTrue(Contains(out, "ParseError"), "repl_reports_parse_error", ctx);
  ExpectTrue(Contains(out, "mathgrade> 2*i\n"), "repl_continues_after_error", ctx);

  out = RunSession("\n\nexit\n1 + 1\n");
  ExpectTrue(!Contains(out, "2"), "repl_stops_at_exit", ctx);
}

}  // namespace test
