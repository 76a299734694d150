/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Logging and String Utilities
 */

#ifndef MINERPROXY_UTIL_H
#define MINERPROXY_UTIL_H

#include "minerproxy/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace minerproxy {

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/// Set minimum level that is emitted
void SetLogLevel(LogLevel level);

/// Get current minimum level
LogLevel GetLogLevel();

/// Mirror every emitted line into a file (append mode). Empty path disables.
Result<void> SetLogFile(const std::string& path);

/// Parse "debug", "info", "warn"/"warning", "error"
Result<LogLevel> ParseLogLevel(const std::string& name);

/// Convert log level to its tag ("DEBUG", "INFO", ...)
std::string ToString(LogLevel level);

void LogDebug(const std::string& component, const std::string& message);
void LogInfo(const std::string& component, const std::string& message);
void LogWarning(const std::string& component, const std::string& message);
void LogError(const std::string& component, const std::string& message);

// ============================================================================
// String Helpers
// ============================================================================

/// Strip leading/trailing spaces, tabs, CR and LF
std::string Trim(const std::string& s);

/// Split on a delimiter, trimming each piece (empty pieces are kept)
std::vector<std::string> Split(const std::string& s, char delimiter);

/// Lowercase ASCII copy
std::string ToLower(const std::string& s);

/// Parse "true"/"1"/"yes"/"on" and "false"/"0"/"no"/"off"
Result<bool> ParseBool(const std::string& value);

/// Milliseconds since the epoch
int64_t ToUnixMillis(TimePoint tp);

} // namespace minerproxy

#endif // MINERPROXY_UTIL_H
