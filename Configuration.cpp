#include "Configuration.h"

#include "framework.h"
#include "Logging.h"

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

AppConfiguration::AppConfiguration()
    : appName("Universal TV Remote"),
    preferSecureWebSocket(true),
    connectTimeoutMs(15000),
    identifyTimeoutMs(2500),
    ssdpWindowMs(4000),
    ssdpResendCount(3),
    ssdpResendIntervalMs(150),
    scanFirstHost(1),
    scanLastHost(60),
    scanConcurrency(20),
    probeTimeoutMs(800),
    scanTimeoutMs(5000),
    scanPort(8001),
    maxFramePayload(1024 * 1024),
    consoleLog(true),
    logLevel(LogLevel::Info)
{
}

namespace
{
    void Trim(std::string& value)
    {
        while (!value.empty()
            && (value.back() == '\r'
                || value.back() == '\n'
                || std::isspace(static_cast<unsigned char>(value.back()))))
        {
            value.pop_back();
        }

        size_t index = 0;
        while (index < value.size()
            && std::isspace(static_cast<unsigned char>(value[index])))
        {
            ++index;
        }

        if (index > 0 && index < value.size())
        {
            value = value.substr(index);
        }
        else if (index >= value.size())
        {
            value.clear();
        }
    }

    bool ParseFlag(const std::string& value)
    {
        return value == "1" || value == "true" || value == "True";
    }

    // Parses an integer in [minimum, maximum]; leaves target untouched otherwise.
    void ParseBoundedInt(
        const std::string& key,
        const std::string& value,
        int minimum,
        int maximum,
        int& target)
    {
        try
        {
            int parsed = std::stoi(value);
            if (parsed >= minimum && parsed <= maximum)
            {
                target = parsed;
                return;
            }
            WarningLog(L"[Configuration] %hs=%d out of range, keeping %d", key.c_str(), parsed, target);
        }
        catch (const std::exception&)
        {
            WarningLog(L"[Configuration] Failed to parse %hs", key.c_str());
        }
    }
}

std::wstring GetConfigurationFilePath()
{
    return GetExecutableDirectory() + L"SmartTVRemote.ini";
}

std::wstring GetTokenFilePath(const char* brandName)
{
    std::wstring brand;
    for (const char* cursor = brandName; cursor && *cursor; ++cursor)
    {
        brand.push_back(static_cast<wchar_t>(*cursor));
    }
    return GetExecutableDirectory() + L"SmartTVRemote_" + brand + L"_tokens.txt";
}

void LoadConfiguration(AppConfiguration& configuration)
{
    std::wstring path = GetConfigurationFilePath();
    std::ifstream input(path);
    if (!input)
    {
        InfoLog(L"[Configuration] No configuration file found, using defaults");
        return;
    }

    std::string line;
    while (std::getline(input, line))
    {
        auto separator = line.find('=');
        if (separator == std::string::npos)
        {
            continue;
        }

        std::string key = line.substr(0, separator);
        std::string value = line.substr(separator + 1);

        Trim(key);
        Trim(value);

        if (key == "app_name")
        {
            if (!value.empty())
            {
                configuration.appName = value;
            }
        }
        else if (key == "prefer_secure_websocket")
        {
            configuration.preferSecureWebSocket = ParseFlag(value);
        }
        else if (key == "connect_timeout_ms")
        {
            ParseBoundedInt(key, value, 1000, 120000, configuration.connectTimeoutMs);
        }
        else if (key == "identify_timeout_ms")
        {
            ParseBoundedInt(key, value, 100, 30000, configuration.identifyTimeoutMs);
        }
        else if (key == "ssdp_window_ms")
        {
            ParseBoundedInt(key, value, 100, 60000, configuration.ssdpWindowMs);
        }
        else if (key == "ssdp_resend_count")
        {
            ParseBoundedInt(key, value, 1, 10, configuration.ssdpResendCount);
        }
        else if (key == "ssdp_resend_interval_ms")
        {
            ParseBoundedInt(key, value, 0, 5000, configuration.ssdpResendIntervalMs);
        }
        else if (key == "scan_first_host")
        {
            ParseBoundedInt(key, value, 1, 254, configuration.scanFirstHost);
        }
        else if (key == "scan_last_host")
        {
            ParseBoundedInt(key, value, 1, 254, configuration.scanLastHost);
        }
        else if (key == "scan_concurrency")
        {
            ParseBoundedInt(key, value, 1, 64, configuration.scanConcurrency);
        }
        else if (key == "probe_timeout_ms")
        {
            ParseBoundedInt(key, value, 50, 10000, configuration.probeTimeoutMs);
        }
        else if (key == "scan_timeout_ms")
        {
            ParseBoundedInt(key, value, 100, 60000, configuration.scanTimeoutMs);
        }
        else if (key == "scan_port")
        {
            int port = configuration.scanPort;
            ParseBoundedInt(key, value, 1, 65535, port);
            configuration.scanPort = static_cast<unsigned short>(port);
        }
        else if (key == "max_frame_payload")
        {
            int limit = static_cast<int>(configuration.maxFramePayload);
            ParseBoundedInt(key, value, 1024, 64 * 1024 * 1024, limit);
            configuration.maxFramePayload = static_cast<size_t>(limit);
        }
        else if (key == "console_log")
        {
            configuration.consoleLog = ParseFlag(value);
        }
        else if (key == "log_level")
        {
            if (!TryParseLogLevel(value, configuration.logLevel))
            {
                WarningLog(L"[Configuration] Unknown log_level %hs", value.c_str());
            }
        }
    }

    if (configuration.scanLastHost < configuration.scanFirstHost)
    {
        WarningLog(L"[Configuration] scan_last_host below scan_first_host, scanning a single host");
        configuration.scanLastHost = configuration.scanFirstHost;
    }
}

void SaveConfiguration(const AppConfiguration& configuration)
{
    std::wstring path = GetConfigurationFilePath();
    std::ofstream output(path, std::ios::trunc);
    if (!output)
    {
        ErrorLog(L"[Configuration] Failed to open configuration file for writing");
        return;
    }

    output << "app_name=" << configuration.appName << "\n";
    output << "prefer_secure_websocket=" << (configuration.preferSecureWebSocket ? "1" : "0") << "\n";
    output << "connect_timeout_ms=" << configuration.connectTimeoutMs << "\n";
    output << "identify_timeout_ms=" << configuration.identifyTimeoutMs << "\n";
    output << "ssdp_window_ms=" << configuration.ssdpWindowMs << "\n";
    output << "ssdp_resend_count=" << configuration.ssdpResendCount << "\n";
    output << "ssdp_resend_interval_ms=" << configuration.ssdpResendIntervalMs << "\n";
    output << "scan_first_host=" << configuration.scanFirstHost << "\n";
    output << "scan_last_host=" << configuration.scanLastHost << "\n";
    output << "scan_concurrency=" << configuration.scanConcurrency << "\n";
    output << "probe_timeout_ms=" << configuration.probeTimeoutMs << "\n";
    output << "scan_timeout_ms=" << configuration.scanTimeoutMs << "\n";
    output << "scan_port=" << configuration.scanPort << "\n";
    output << "max_frame_payload=" << configuration.maxFramePayload << "\n";
    output << "console_log=" << (configuration.consoleLog ? "1" : "0") << "\n";
    output << "log_level=" << ToString(configuration.logLevel) << "\n";
}
