#include "util/log.h"

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>

#include "util/env.h"
#include "util/string.h"

namespace mathgrade::util {

namespace {

LogLevel ParseLogLevel(const char* value) {
  if (!value) return LogLevel::kError;
  const std::string v = ToLower(value);
  if (v == "error") return LogLevel::kError;
  if (v == "warn" || v == "warning") return LogLevel::kWarn;
  if (v == "info") return LogLevel::kInfo;
  if (v == "debug") return LogLevel::kDebug;
  if (v == "trace") return LogLevel::kTrace;
  return LogLevel::kError;
}

LogFormat ParseLogFormat(const char* value) {
  if (!value) return LogFormat::kText;
  if (ToLower(value) == "json") return LogFormat::kJson;
  return LogFormat::kText;
}

bool ShouldLog(const LogConfig& config, LogLevel level) {
  return config.enabled && static_cast<int>(level) <= static_cast<int>(config.level);
}

std::string JsonEscape(const std::string& input) {
  std::string out;
  out.reserve(input.size() + 8);
  for (char c : input) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  return out;
}

std::string TextEscape(const std::string& input) {
  std::string out;
  out.reserve(input.size() + 8);
  for (char c : input) {
    if (c == '"') {
      out += "\\\"";
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '\t') {
      out += "\\t";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::mutex g_log_mu;

}  // namespace

LogConfig LoadLogConfig() {
  LogConfig config;
  if (const char* level = std::getenv("MATHGRADE_LOG_LEVEL")) {
    config.enabled = true;
    config.level = ParseLogLevel(level);
  }
  if (const char* fmt = std::getenv("MATHGRADE_LOG_FORMAT")) {
    config.enabled = true;
    config.format = ParseLogFormat(fmt);
  }
  if (const char* enable = std::getenv("MATHGRADE_LOG")) {
    if (IsTrueEnvValue(enable)) {
      config.enabled = true;
      if (static_cast<int>(config.level) < static_cast<int>(LogLevel::kInfo)) {
        config.level = LogLevel::kInfo;
      }
    }
  }
  return config;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kError:
      return "error";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kTrace:
      return "trace";
  }
  return "info";
}

std::string FormatLogLine(const LogRecord& record, LogFormat format) {
  if (format == LogFormat::kJson) {
    std::ostringstream out;
    out << "{";
    out << "\"level\":\"" << LogLevelName(record.level) << "\"";
    if (!record.component.empty()) {
      out << ",\"component\":\"" << JsonEscape(record.component) << "\"";
    }
    if (!record.operation.empty()) {
      out << ",\"op\":\"" << JsonEscape(record.operation) << "\"";
    }
    if (record.trial >= 0) {
      out << ",\"trial\":" << record.trial;
    }
    if (record.error_kind.has_value()) {
      out << ",\"kind\":\"" << ErrorKindName(*record.error_kind) << "\"";
    }
    out << ",\"message\":\"" << JsonEscape(record.message) << "\"";
    out << "}";
    return out.str();
  }

  std::ostringstream out;
  out << "level=" << LogLevelName(record.level);
  if (!record.component.empty()) out << " component=" << record.component;
  if (!record.operation.empty()) out << " op=" << record.operation;
  if (record.trial >= 0) out << " trial=" << record.trial;
  if (record.error_kind.has_value()) out << " kind=" << ErrorKindName(*record.error_kind);
  out << " message=\"" << TextEscape(record.message) << "\"";
  return out.str();
}

bool LogEnabled(LogLevel level) {
  return ShouldLog(LoadLogConfig(), level);
}

void Log(const LogRecord& record) {
  const LogConfig config = LoadLogConfig();
  if (!ShouldLog(config, record.level)) return;
  const std::string line = FormatLogLine(record, config.format);
  std::lock_guard<std::mutex> lock(g_log_mu);
  std::cerr << line << "\n";
}

}  // namespace mathgrade::util
