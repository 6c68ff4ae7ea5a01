#include <iostream>

#include "test_util.h"

namespace test {
void RunUtilTests(TestContext* ctx);
void RunLexerTests(TestContext* ctx);
void RunParserTests(TestContext* ctx);
void RunParseCacheTests(TestContext* ctx);
void RunValueTests(TestContext* ctx);
void RunLinalgTests(TestContext* ctx);
void RunEvaluatorTests(TestContext* ctx);
void RunBuiltinTests(TestContext* ctx);
void RunSamplingTests(TestContext* ctx);
void RunComparerTests(TestContext* ctx);
void RunConfigTests(TestContext* ctx);
void RunGraderTests(TestContext* ctx);
void RunSumGraderTests(TestContext* ctx);
void RunIntegralGraderTests(TestContext* ctx);
void RunReplTests(TestContext* ctx);
}  // namespace test

int main() {
  test::TestContext ctx;
  test::RunUtilTests(&ctx);
  test::RunLexerTests(&ctx);
  test::RunParserTests(&ctx);
  test::RunParseCacheTests(&ctx);
  test::RunValueTests(&ctx);
  test::RunLinalgTests(&ctx);
  test::RunEvaluatorTests(&ctx);
  test::RunBuiltinTests(&ctx);
  test::RunSamplingTests(&ctx);
  test::RunComparerTests(&ctx);
  test::RunConfigTests(&ctx);
  test::RunGraderTests(&ctx);
  test::RunSumGraderTests(&ctx);
  test::RunIntegralGraderTests(&ctx);
  test::RunReplTests(&ctx);

  std::cout << "[RESULT] passed=" << ctx.passed << " failed=" << ctx.failed << "\n";
  return ctx.failed == 0 ? 0 : 1;
}
