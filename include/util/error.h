#ifndef MATHGRADE_UTIL_ERROR_H_
#define MATHGRADE_UTIL_ERROR_H_

#include <stdexcept>
#include <string>

namespace mathgrade::util {

enum class ErrorKind {
  kParse,
  kUnknownIdentifier,
  kDomain,
  kOverflow,
  kShape,
  kZeroDivision,
  kConfig,
  kInternal,
};

/// Stable lowercase name for logs ("parse", "unknown_identifier", ...).
const char* ErrorKindName(ErrorKind kind);

/// Display title used by formatted() ("ParseError", "ShapeError", ...).
const char* ErrorKindTitle(ErrorKind kind);

/// Returns true for errors that describe a problem with the student's input.
bool IsStudentFacing(ErrorKind kind);

class Error : public std::runtime_error {
 public:
  /// Creates an error with a kind, message and optional source range (0-based character
  /// offsets into the original input, -1 when unknown).
  Error(ErrorKind kind, const std::string& message, int start = -1, int end = -1)
      : std::runtime_error(message), kind_(kind), start_(start), end_(end < 0 ? start : end) {}

  ErrorKind kind() const { return kind_; }
  /// Offset of the first offending character.
  int start() const { return start_; }
  /// Offset one past the offending range.
  int end() const { return end_; }
  bool has_location() const { return start_ >= 0; }

  /// Returns a human-readable string with kind and location context.
  std::string formatted() const {
    std::string out = ErrorKindTitle(kind_);
    if (has_location()) {
      out += " at " + std::to_string(start_);
    }
    return out + ": " + what();
  }

 private:
  ErrorKind kind_;
  int start_;
  int end_;
};

}  // namespace mathgrade::util

#endif  // MATHGRADE_UTIL_ERROR_H_
