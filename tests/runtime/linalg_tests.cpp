#include "runtime/array_ops.h"
#include "runtime/linalg.h"
#include "test_util.h"

namespace test {

namespace {

bool NearlyEqual(const rt::Value& a, const rt::Value& b) {
  if (a.shape != b.shape) return false;
  for (size_t i = 0; i < a.data.size(); ++i) {
    if (std::abs(a.data[i] - b.data[i]) > 1e-9) return false;
  }
  return true;
}

}  // namespace

void RunLinalgTests(TestContext* ctx) {
  const rt::Value m = rt::Value::Array({2, 2}, {1.0, 2.0, 3.0, 4.0});

  ExpectTrue(rt::Identity(3) == rt::Value::Array({3, 3}, {1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0,
                                                          0.0, 1.0}),
             "identity", ctx);
  ExpectTrue(rt::MatMul(m, rt::Identity(2)) == m, "matmul_identity", ctx);
  const rt::Value row = rt::Value::Array({1, 2}, {1.0, 1.0});
  const rt::Value col = rt::Value::Array({2, 1}, {2.0, 3.0});
  rt::Value one_by_one = rt::MatMul(row, col);
  ExpectTrue(one_by_one.IsScalar(), "one_by_one_product_is_scalar", ctx);
  ExpectNear(one_by_one.scalar().real(), 5.0, "one_by_one_product_value", ctx);

  ExpectTrue(rt::Transpose(m) == rt::Value::Array({2, 2}, {1.0, 3.0, 2.0, 4.0}), "transpose",
             ctx);
  const rt::Value c = rt::Value::Array({1, 2}, {rt::Complex(1.0, 1.0), rt::Complex(0.0, -2.0)});
  const rt::Value ct = rt::ConjugateTranspose(c);
  ExpectTrue(ct.shape == std::vector<int64_t>({2, 1}), "conjugate_transpose_shape", ctx);
  ExpectComplexNear(ct.data[0], rt::Complex(1.0, -1.0), "conjugate_transpose_entry", ctx);
  ExpectComplexNear(ct.data[1], rt::Complex(0.0, 2.0), "conjugate_transpose_second_entry",
                    ctx);

  ExpectComplexNear(rt::Determinant(m), -2.0, "determinant_2x2", ctx);
  ExpectComplexNear(rt::Determinant(rt::Value::Array({3, 3}, {2.0, 0.0, 1.0, 1.0, 3.0, 2.0,
                                                             1.0, 1.0, 2.0})),
                    6.0, "determinant_3x3", ctx);
  ExpectComplexNear(rt::Determinant(rt::Value::Array({2, 2}, {1.0, 2.0, 2.0, 4.0})), 0.0,
                    "determinant_singular", ctx);
  ExpectComplexNear(rt::Trace(m), 5.0, "trace", ctx);

  const rt::Value inverse = rt::Inverse(m);
  ExpectTrue(NearlyEqual(inverse, rt::Value::Array({2, 2}, {-2.0, 1.0, 1.5, -0.5})), "inverse",
             ctx);
  ExpectTrue(NearlyEqual(rt::MatMul(m, inverse), rt::Identity(2)), "inverse_product", ctx);
  ExpectThrowsKind([] { rt::Inverse(rt::Value::Array({2, 2}, {1.0, 2.0, 2.0, 4.0})); },
                   util::ErrorKind::kZeroDivision, "inverse_singular", ctx);

  const rt::Value tiny_inverse = rt::Inverse(rt::Value::Array({2, 2}, {1e-15, 0.0, 0.0, 1.0}));
  ExpectNear(tiny_inverse.At(0, 0).real() / 1e15, 1.0, "inverse_of_small_scale_entry", ctx);
  ExpectNear(tiny_inverse.At(1, 1).real(), 1.0, "inverse_small_scale_other_entry", ctx);
  const rt::Value scaled = rt::Value::Array({2, 2}, {1e-20, 2e-20, 3e-20, 4e-20});
  ExpectTrue(NearlyEqual(rt::MatMul(scaled, rt::Inverse(scaled)), rt::Identity(2)),
             "inverse_of_uniformly_small_matrix", ctx);
  ExpectThrowsKind([] { rt::Inverse(rt::Value::Array({2, 2}, {1e-20, 2e-20, 2e-20, 4e-20})); },
                   util::ErrorKind::kZeroDivision, "small_scale_singular_inverse", ctx);

  ExpectTrue(rt::MatrixPower(m, 0) == rt::Identity(2), "matrix_power_zero", ctx);
  ExpectTrue(NearlyEqual(rt::MatrixPower(m, 3), rt::Value::Array({2, 2}, {37.0, 54.0, 81.0,
                                                                         118.0})),
             "matrix_power_three", ctx);
  ExpectTrue(NearlyEqual(rt::MatrixPower(m, -1), inverse), "matrix_power_negative", ctx);

  ExpectNear(rt::Norm(rt::Value::Vector({3.0, 4.0})), 5.0, "vector_norm", ctx);
  ExpectNear(rt::Norm(m), std::sqrt(30.0), "frobenius_norm", ctx);
  ExpectNear(rt::Norm(rt::Value::Scalar(rt::Complex(3.0, -4.0))), 5.0, "scalar_norm", ctx);

  ExpectTrue(rt::Cross(rt::Value::Vector({1.0, 0.0, 0.0}), rt::Value::Vector({0.0, 1.0, 0.0})) ==
                 rt::Value::Vector({0.0, 0.0, 1.0}),
             "cross_product", ctx);

  {
    const std::vector<rt::Value> columns = {rt::Value::Vector({1.0, 0.0, 1.0}),
                                            rt::Value::Vector({0.0, 1.0, 1.0})};
    auto coefficients = rt::LeastSquares(columns, rt::Value::Vector({2.0, 3.0, 5.0}));
    ExpectTrue(coefficients.has_value(), "least_squares_solves", ctx);
    if (coefficients) {
      ExpectComplexNear((*coefficients)[0], 2.0, "least_squares_first", ctx);
      ExpectComplexNear((*coefficients)[1], 3.0, "least_squares_second", ctx);
    }
    const std::vector<rt::Value> dependent = {rt::Value::Vector({1.0, 2.0}),
                                              rt::Value::Vector({2.0, 4.0})};
    ExpectTrue(!rt::LeastSquares(dependent, rt::Value::Vector({1.0, 1.0})).has_value(),
               "least_squares_dependent_columns", ctx);
  }

  {
    const rt::Value a = rt::Value::Array({3, 3}, {2.0, -1.0, 0.5, 1.0, 3.0, 2.0, 0.0, 1.0, 4.0});
    const rt::Value q = rt::OrthonormalFactor(a);
    ExpectTrue(NearlyEqual(rt::MatMul(rt::ConjugateTranspose(q), q), rt::Identity(3)),
               "orthonormal_factor_is_orthogonal", ctx);
    ExpectNear(std::abs(rt::Determinant(q)), 1.0, "orthonormal_factor_unit_determinant", ctx);
    ExpectThrowsKind([] { rt::OrthonormalFactor(rt::Value::Zeros({2, 2})); },
                     util::ErrorKind::kZeroDivision, "orthonormal_factor_degenerate", ctx);
  }
}

}  // namespace test
