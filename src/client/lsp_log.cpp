// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_log.cpp
 * @brief Logging implementation.
 */

#include "nanolsp/lsp_log.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace nanolsp {

namespace {

std::atomic<int>& LevelStorage() {
    static std::atomic<int> level{ static_cast<int>(LogLevel::Warn) };
    return level;
}

std::mutex& OutputMutex() {
    static std::mutex m;
    return m;
}

} // anonymous namespace

void SetLogLevel(LogLevel level) {
    LevelStorage().store(static_cast<int>(level));
}

LogLevel GetLogLevel() {
    return static_cast<LogLevel>(LevelStorage().load());
}

LogLevel ParseLogLevel(std::string_view text, LogLevel fallback) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "debug" || lower == "trace") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none" || lower == "silent") return LogLevel::Off;
    return fallback;
}

const char* ToString(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
    }
    return "unknown";
}

void Log(LogLevel level, std::string_view module, std::string_view message) {
    if (!LogEnabled(level)) return;

    std::ostringstream oss;
    oss << "[nanolsp:" << module << "] " << ToString(level) << ": " << message << "\n";

    std::lock_guard<std::mutex> lock(OutputMutex());
    std::cerr << oss.str();
    std::cerr.flush();
}

} // namespace nanolsp
