#pragma once

#include <string>

namespace core::logging {

enum class LogLevel { kError = 0, kWarn, kInfo, kDebug };

// Reads LOG_ENABLED and IDE_BRIDGE_LOG_LEVEL. Every line goes to stderr because
// stdout carries the MCP stream.
void InitializeFromEnvironment();
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
LogLevel ParseLogLevel(std::string value);

void Log(LogLevel level, const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);

}  // namespace core::logging
