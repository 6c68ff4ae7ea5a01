#include "util/error.h"

namespace mathgrade::util {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kParse:
      return "parse";
    case ErrorKind::kUnknownIdentifier:
      return "unknown_identifier";
    case ErrorKind::kDomain:
      return "domain";
    case ErrorKind::kOverflow:
      return "overflow";
    case ErrorKind::kShape:
      return "shape";
    case ErrorKind::kZeroDivision:
      return "zero_division";
    case ErrorKind::kConfig:
      return "config";
    case ErrorKind::kInternal:
      return "internal";
  }
  return "internal";
}

const char* ErrorKindTitle(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kParse:
      return "ParseError";
    case ErrorKind::kUnknownIdentifier:
      return "UnknownIdentifier";
    case ErrorKind::kDomain:
      return "DomainError";
    case ErrorKind::kOverflow:
      return "OverflowError";
    case ErrorKind::kShape:
      return "ShapeError";
    case ErrorKind::kZeroDivision:
      return "ZeroDivisionError";
    case ErrorKind::kConfig:
      return "ConfigError";
    case ErrorKind::kInternal:
      return "InternalError";
  }
  return "InternalError";
}

bool IsStudentFacing(ErrorKind kind) {
  return kind != ErrorKind::kConfig && kind != ErrorKind::kInternal;
}

}  // namespace mathgrade::util
