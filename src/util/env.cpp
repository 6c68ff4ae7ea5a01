#include "util/env.h"

#include <cstdlib>
#include <string>

#include "util/string.h"

namespace mathgrade::util {

bool IsTrueEnvValue(const char* value) {
  if (!value) return false;
  const std::string v = ToLower(value);
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

bool IsFalseEnvValue(const char* value) {
  if (!value) return false;
  const std::string v = ToLower(value);
  return v == "0" || v == "false" || v == "no" || v == "off";
}

bool ParseUint64(const char* value, uint64_t* out) {
  if (!value || !out) return false;
  char* end = nullptr;
  unsigned long long parsed = std::strtoull(value, &end, 10);
  if (end == value) return false;
  *out = static_cast<uint64_t>(parsed);
  return true;
}

}  // namespace mathgrade::util
