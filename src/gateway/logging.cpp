#include "gateway/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace {

using gateway::logging::LogLevel;
using gateway::logging::LogSink;

constexpr char kLevelEnvVar[] = "PLUGIN_GATEWAY_LOG_LEVEL";

std::atomic<LogLevel> g_log_level{LogLevel::kInfo};
// Guards the sink and serializes every record written through it.
std::mutex g_log_mutex;
LogSink g_sink;

std::string FormatRecord(LogLevel level, const std::string& message) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_snapshot;
  localtime_r(&now_time, &tm_snapshot);
  std::ostringstream line;
  line << std::put_time(&tm_snapshot, "%Y-%m-%d %H:%M:%S") << " ["
       << gateway::logging::LogLevelName(level) << "] " << message;
  return line.str();
}

void WriteToConsole(LogLevel level, const std::string& line) {
  std::ostream& stream =
      (level == LogLevel::kError || level == LogLevel::kWarn) ? std::cerr : std::cout;
  stream << line << std::endl;
}

}  // namespace

namespace gateway::logging {

void InitializeFromEnvironment() {
  const char* env = std::getenv(kLevelEnvVar);
  if (env == nullptr) {
    return;
  }
  if (const auto level = ParseLogLevel(env)) {
    SetLogLevel(*level);
  } else {
    LogWarn(std::string{kLevelEnvVar} + "='" + env + "' is not a log level, keeping " +
            LogLevelName(GetLogLevel()));
  }
}

std::optional<LogLevel> ParseLogLevel(std::string value) {
  for (auto& ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  return std::nullopt;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kDebug:
      return "DEBUG";
  }
  return "INFO";
}

void SetLogLevel(LogLevel level) { g_log_level.store(level); }

LogLevel GetLogLevel() { return g_log_level.load(); }

bool IsDebugEnabled() { return GetLogLevel() == LogLevel::kDebug; }

LogSink SetLogSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::swap(g_sink, sink);
  return sink;
}

// Sinks run under the log mutex and must not log themselves.
void Log(LogLevel level, const std::string& message) {
  if (static_cast<int>(level) > static_cast<int>(g_log_level.load())) {
    return;
  }
  const std::string line = FormatRecord(level, message);
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_sink) {
    g_sink(level, line);
  } else {
    WriteToConsole(level, line);
  }
}

void LogInfo(const std::string& message) { Log(LogLevel::kInfo, message); }

void LogWarn(const std::string& message) { Log(LogLevel::kWarn, message); }

void LogError(const std::string& message) { Log(LogLevel::kError, message); }

void LogDebug(const std::string& message) { Log(LogLevel::kDebug, message); }

}  // namespace gateway::logging
