// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_log.hpp
 * @brief Minimal level-gated logging to stderr.
 *
 * stdout may belong to a JSON-RPC peer, so everything goes to std::cerr.
 */

#pragma once
#include <string>
#include <string_view>

namespace nanolsp {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

// "debug", "INFO", "warning", ... -> level; anything else -> fallback
LogLevel ParseLogLevel(std::string_view text, LogLevel fallback);
const char* ToString(LogLevel level);

inline bool LogEnabled(LogLevel level) {
    return level != LogLevel::Off && level >= GetLogLevel();
}

void Log(LogLevel level, std::string_view module, std::string_view message);

inline void LogDebug(std::string_view module, std::string_view message) { Log(LogLevel::Debug, module, message); }
inline void LogInfo(std::string_view module, std::string_view message) { Log(LogLevel::Info, module, message); }
inline void LogWarn(std::string_view module, std::string_view message) { Log(LogLevel::Warn, module, message); }
inline void LogError(std::string_view module, std::string_view message) { Log(LogLevel::Error, module, message); }

} // namespace nanolsp
