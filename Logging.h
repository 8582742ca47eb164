#pragma once

#include "framework.h"

#include <string>

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error,
};

// Debug lines exist only in _DEBUG builds.
void DebugLog(const wchar_t* format, ...);
void InfoLog(const wchar_t* format, ...);
void WarningLog(const wchar_t* format, ...);
void ErrorLog(const wchar_t* format, ...);

// Also writes every line to stderr.
void SetConsoleLogging(bool enabled);

// Lines below level are dropped.
void SetMinimumLogLevel(LogLevel level);

// Parses debug, info, warning or error (any case).
bool TryParseLogLevel(const std::string& text, LogLevel& level);
const char* ToString(LogLevel level);

// Directory of the running executable with a trailing separator, or empty.
std::wstring GetExecutableDirectory();
