#ifndef MATHGRADE_UTIL_ENV_H_
#define MATHGRADE_UTIL_ENV_H_

#include <cstdint>

namespace mathgrade::util {

/// Accepts 1/true/yes/on, case-insensitively.
bool IsTrueEnvValue(const char* value);
/// Accepts 0/false/no/off, case-insensitively.
bool IsFalseEnvValue(const char* value);
/// Parses a base-10 unsigned integer; returns false when no digits were read.
bool ParseUint64(const char* value, uint64_t* out);

}  // namespace mathgrade::util

#endif  // MATHGRADE_UTIL_ENV_H_
