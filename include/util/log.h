#ifndef MATHGRADE_UTIL_LOG_H_
#define MATHGRADE_UTIL_LOG_H_

#include <optional>
#include <string>

#include "util/error.h"

namespace mathgrade::util {

enum class LogLevel { kError, kWarn, kInfo, kDebug, kTrace };
enum class LogFormat { kText, kJson };

struct LogRecord {
  LogLevel level = LogLevel::kInfo;
  std::string component;
  std::string operation;
  std::string message;
  int trial = -1;
  std::optional<ErrorKind> error_kind;
};

struct LogConfig {
  bool enabled = false;
  LogLevel level = LogLevel::kError;
  LogFormat format = LogFormat::kText;
};

/// Reads MATHGRADE_LOG_LEVEL, MATHGRADE_LOG_FORMAT and MATHGRADE_LOG.
LogConfig LoadLogConfig();
const char* LogLevelName(LogLevel level);
std::string FormatLogLine(const LogRecord& record, LogFormat format);
/// True when a record at this level would be written.
bool LogEnabled(LogLevel level);
/// Writes the record to stderr when the environment enables its level.
void Log(const LogRecord& record);

}  // namespace mathgrade::util

#endif  // MATHGRADE_UTIL_LOG_H_
