#pragma once

#include <functional>
#include <optional>
#include <string>

namespace gateway::logging {

enum class LogLevel { kError = 0, kWarn, kInfo, kDebug };

// Receives every record that passes the level filter, already formatted as
// "<timestamp> [<LEVEL>] <message>".
using LogSink = std::function<void(LogLevel level, const std::string& line)>;

void InitializeFromEnvironment();
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
bool IsDebugEnabled();

// Accepts error/warn/warning/info/debug in any case.
std::optional<LogLevel> ParseLogLevel(std::string value);
const char* LogLevelName(LogLevel level);

// Replaces the console writer (WARN and ERROR to stderr, the rest to stdout).
// An empty sink restores it. Returns the sink that was installed before.
LogSink SetLogSink(LogSink sink);

void Log(LogLevel level, const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);

}  // namespace gateway::logging
