/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Logging and String Utilities
 */

#include "minerproxy/util.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace minerproxy {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_log_mutex;
std::ofstream g_log_file;

void Emit(LogLevel level, const std::string& component, const std::string& message) {
    if (static_cast<int>(level) < g_log_level.load()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    char buf[32];
    std::string timestamp = ctime_r(&time, buf) ? buf : "";
    if (!timestamp.empty() && timestamp.back() == '\n') {
        timestamp.pop_back();  // Remove newline
    }

    std::string line = "[" + timestamp + "] [" + ToString(level) + "] [" +
                       component + "] " + message;

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level >= LogLevel::WARN) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
    if (g_log_file.is_open()) {
        g_log_file << line << '\n';
        g_log_file.flush();
    }
}

} // namespace

// ============================================================================
// Logging
// ============================================================================

void SetLogLevel(LogLevel level) {
    g_log_level = static_cast<int>(level);
}

LogLevel GetLogLevel() {
    return static_cast<LogLevel>(g_log_level.load());
}

Result<void> SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file.is_open()) {
        g_log_file.close();
    }
    if (path.empty()) {
        return Result<void>::Ok();
    }

    g_log_file.open(path, std::ios::app);
    if (!g_log_file.is_open()) {
        return Result<void>::Error("Could not open log file: " + path);
    }
    return Result<void>::Ok();
}

Result<LogLevel> ParseLogLevel(const std::string& name) {
    std::string level = ToLower(Trim(name));
    if (level == "debug") return Result<LogLevel>::Ok(LogLevel::DEBUG);
    if (level == "info") return Result<LogLevel>::Ok(LogLevel::INFO);
    if (level == "warn" || level == "warning") return Result<LogLevel>::Ok(LogLevel::WARN);
    if (level == "error") return Result<LogLevel>::Ok(LogLevel::ERROR);
    return Result<LogLevel>::Error("Unknown log level: " + name);
}

std::string ToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void LogDebug(const std::string& component, const std::string& message) {
    Emit(LogLevel::DEBUG, component, message);
}

void LogInfo(const std::string& component, const std::string& message) {
    Emit(LogLevel::INFO, component, message);
}

void LogWarning(const std::string& component, const std::string& message) {
    Emit(LogLevel::WARN, component, message);
}

void LogError(const std::string& component, const std::string& message) {
    Emit(LogLevel::ERROR, component, message);
}

// ============================================================================
// String Helpers
// ============================================================================

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::vector<std::string> Split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(Trim(s.substr(start)));
            break;
        }
        parts.push_back(Trim(s.substr(start, pos - start)));
        start = pos + 1;
    }
    return parts;
}

std::string ToLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

Result<bool> ParseBool(const std::string& value) {
    std::string v = ToLower(Trim(value));
    if (v == "true" || v == "1" || v == "yes" || v == "on") return Result<bool>::Ok(true);
    if (v == "false" || v == "0" || v == "no" || v == "off") return Result<bool>::Ok(false);
    return Result<bool>::Error("Invalid boolean value: " + value);
}

int64_t ToUnixMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

} // namespace minerproxy
