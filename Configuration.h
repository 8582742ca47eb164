#pragma once

#include "Logging.h"

#include <string>

// Represents application configuration persisted on disk.
struct AppConfiguration
{
    std::string appName;
    bool preferSecureWebSocket;
    int connectTimeoutMs;
    int identifyTimeoutMs;
    int ssdpWindowMs;
    int ssdpResendCount;
    int ssdpResendIntervalMs;
    int scanFirstHost;
    int scanLastHost;
    int scanConcurrency;
    int probeTimeoutMs;
    int scanTimeoutMs;
    unsigned short scanPort;
    size_t maxFramePayload;
    bool consoleLog;
    LogLevel logLevel;

    AppConfiguration();
};

// Returns the full path to the configuration file.
std::wstring GetConfigurationFilePath();

// Returns the path of the per-brand token file stored beside the configuration file.
std::wstring GetTokenFilePath(const char* brandName);

// Loads configuration from disk if present and leaves defaults otherwise.
void LoadConfiguration(AppConfiguration& configuration);

// Saves configuration to disk.
void SaveConfiguration(const AppConfiguration& configuration);
