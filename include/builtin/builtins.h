#ifndef MATHGRADE_BUILTIN_BUILTINS_H_
#define MATHGRADE_BUILTIN_BUILTINS_H_

#include <memory>
#include <set>
#include <string>

#include "runtime/environment.h"

namespace mathgrade::builtin {

/// Registers the constants i, j, e and pi.
void InstallConstants(runtime::Environment* env);

/// Registers the scalar function library (trig, logs, fact, min, max, re, im, conj, ...).
void InstallDefaultFunctions(runtime::Environment* env);

/// Registers norm, abs, trans, ctrans, adj, det, trace and cross. Replaces the scalar abs.
void InstallArrayFunctions(runtime::Environment* env);

/// "%" as 0.01.
void InstallDefaultSuffixes(runtime::Environment* env);
/// k M G T m u n p.
void InstallMetricSuffixes(runtime::Environment* env);

/// sigma_x, sigma_y, sigma_z.
void InstallPauliMatrices(runtime::Environment* env);
/// hatx, haty, hatz.
void InstallCartesianXyz(runtime::Environment* env);
/// hati, hatj, hatk.
void InstallCartesianIjk(runtime::Environment* env);

/// Constants, default functions and the "%" suffix, built once and shared.
std::shared_ptr<const runtime::Environment> DefaultScope();

/// Names registered by InstallDefaultFunctions.
const std::set<std::string>& DefaultFunctionNames();
/// Names registered by InstallConstants.
const std::set<std::string>& DefaultVariableNames();

/// gamma(z + 1) over the complex plane; a kDomain util::Error at negative integers.
runtime::Complex Factorial(runtime::Complex z);

}  // namespace mathgrade::builtin

#endif  // MATHGRADE_BUILTIN_BUILTINS_H_
