#include "Logging.h"

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <mutex>

namespace
{
    constexpr size_t MaxLogLineLength = 1024;

    struct LevelName
    {
        LogLevel level;
        const char* name;
        const wchar_t* tag;
    };

    const LevelName LevelNames[] = {
        { LogLevel::Debug, "debug", L"DEBUG" },
        { LogLevel::Info, "info", L"INFO" },
        { LogLevel::Warning, "warning", L"WARNING" },
        { LogLevel::Error, "error", L"ERROR" },
    };

    const wchar_t* LevelTag(LogLevel level)
    {
        for (const LevelName& entry : LevelNames)
        {
            if (entry.level == level)
            {
                return entry.tag;
            }
        }
        return L"?";
    }

    // Debugger output, the log file beside the executable and optionally stderr.
    // The file is opened on first use and kept open.
    class LogSink
    {
    public:
        LogSink()
            : consoleEcho(false),
#ifdef _DEBUG
            minimumLevel(static_cast<int>(LogLevel::Debug)),
#else
            minimumLevel(static_cast<int>(LogLevel::Info)),
#endif
            fileOpenAttempted(false)
        {
        }

        bool Accepts(LogLevel level) const
        {
            return static_cast<int>(level) >= minimumLevel.load();
        }

        void Write(const std::wstring& line)
        {
            std::lock_guard<std::mutex> lock(mutex);

            OutputDebugStringW(line.c_str());

            if (consoleEcho.load())
            {
                fputws(line.c_str(), stderr);
            }

            if (!fileOpenAttempted)
            {
                fileOpenAttempted = true;
                file.open(GetExecutableDirectory() + L"SmartTVRemote.log", std::ios::app);
            }
            if (file)
            {
                file << line;
                file.flush();
            }
        }

        std::atomic<bool> consoleEcho;
        std::atomic<int> minimumLevel;

    private:
        std::mutex mutex;
        bool fileOpenAttempted;
        std::wofstream file;
    };

    LogSink& Sink()
    {
        static LogSink sink;
        return sink;
    }

    std::wstring FormatLine(LogLevel level, const wchar_t* format, va_list arguments)
    {
        SYSTEMTIME now{};
        GetLocalTime(&now);

        wchar_t prefix[80]{};
        swprintf_s(
            prefix,
            L"[%04u-%02u-%02u %02u:%02u:%02u][%s][%lu] ",
            static_cast<unsigned int>(now.wYear),
            static_cast<unsigned int>(now.wMonth),
            static_cast<unsigned int>(now.wDay),
            static_cast<unsigned int>(now.wHour),
            static_cast<unsigned int>(now.wMinute),
            static_cast<unsigned int>(now.wSecond),
            LevelTag(level),
            GetCurrentThreadId());

        wchar_t message[MaxLogLineLength]{};
        _vsnwprintf_s(message, _TRUNCATE, format, arguments);

        std::wstring line(prefix);
        line += message;
        line += L"\n";
        return line;
    }

    void LogV(LogLevel level, const wchar_t* format, va_list arguments)
    {
        LogSink& sink = Sink();
        if (!sink.Accepts(level))
        {
            return;
        }
        sink.Write(FormatLine(level, format, arguments));
    }
}

void DebugLog(const wchar_t* format, ...)
{
#ifdef _DEBUG
    va_list arguments;
    va_start(arguments, format);
    LogV(LogLevel::Debug, format, arguments);
    va_end(arguments);
#else
    (void)format;
#endif
}

void InfoLog(const wchar_t* format, ...)
{
    va_list arguments;
    va_start(arguments, format);
    LogV(LogLevel::Info, format, arguments);
    va_end(arguments);
}

void WarningLog(const wchar_t* format, ...)
{
    va_list arguments;
    va_start(arguments, format);
    LogV(LogLevel::Warning, format, arguments);
    va_end(arguments);
}

void ErrorLog(const wchar_t* format, ...)
{
    va_list arguments;
    va_start(arguments, format);
    LogV(LogLevel::Error, format, arguments);
    va_end(arguments);
}

void SetConsoleLogging(bool enabled)
{
    Sink().consoleEcho.store(enabled);
}

void SetMinimumLogLevel(LogLevel level)
{
    Sink().minimumLevel.store(static_cast<int>(level));
}

bool TryParseLogLevel(const std::string& text, LogLevel& level)
{
    std::string lowered;
    lowered.reserve(text.size());
    for (char character : text)
    {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(character))));
    }

    for (const LevelName& entry : LevelNames)
    {
        if (lowered == entry.name)
        {
            level = entry.level;
            return true;
        }
    }
    return false;
}

const char* ToString(LogLevel level)
{
    for (const LevelName& entry : LevelNames)
    {
        if (entry.level == level)
        {
            return entry.name;
        }
    }
    return "unknown";
}

std::wstring GetExecutableDirectory()
{
    wchar_t pathBuffer[MAX_PATH]{};
    DWORD length = GetModuleFileNameW(nullptr, pathBuffer, MAX_PATH);
    if (length == 0 || length >= MAX_PATH)
    {
        return {};
    }

    std::wstring fullPath(pathBuffer, length);
    size_t lastSeparator = fullPath.find_last_of(L"\\/");
    return lastSeparator == std::wstring::npos
        ? std::wstring()
        : fullPath.substr(0, lastSeparator + 1);
}
