#include "framework.h"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "Configuration.h"
#include "HandlerRegistry.h"
#include "HttpClient.h"
#include "LgWebOsHandler.h"
#include "Logging.h"
#include "NetworkStream.h"
#include "SamsungKeys.h"
#include "SamsungTizenHandler.h"
#include "TokenStore.h"
#include "WinsockDiscoveryNetwork.h"

namespace
{
    std::string ToNarrow(const wchar_t* value)
    {
        std::wstring wide(value != nullptr ? value : L"");
        if (wide.empty())
        {
            return {};
        }

        int requiredLength = WideCharToMultiByte(
            CP_UTF8,
            0,
            wide.c_str(),
            static_cast<int>(wide.size()),
            nullptr,
            0,
            nullptr,
            nullptr);
        if (requiredLength <= 0)
        {
            return {};
        }

        std::string result(static_cast<size_t>(requiredLength), '\0');
        WideCharToMultiByte(
            CP_UTF8,
            0,
            wide.c_str(),
            static_cast<int>(wide.size()),
            result.data(),
            requiredLength,
            nullptr,
            nullptr);
        return result;
    }

    std::vector<std::string> SplitWords(const std::string& line)
    {
        std::vector<std::string> words;
        std::istringstream stream(line);
        std::string word;
        while (stream >> word)
        {
            words.push_back(word);
        }
        return words;
    }

    void PrintUsage()
    {
        wprintf(
            L"Usage: SmartTVRemote [discover | connect <ip> [brand] | reconnect]\n"
            L"Commands at the prompt:\n"
            L"  discover                 find TVs on the local network\n"
            L"  connect <ip> [brand]     open a session (brand: samsung_tizen, lg_webos)\n"
            L"  reconnect                connect to the last TV used\n"
            L"  key <name>               send a standard key, e.g. volume_up\n"
            L"  raw <code>               send a native key code, e.g. KEY_NETFLIX\n"
            L"  type <text>              type letters, digits and spaces as raw keys\n"
            L"  app <id>                 launch an application\n"
            L"  keys                     list keys supported by the connected TV\n"
            L"  disconnect               close the session\n"
            L"  quit                     exit\n");
    }

    void PrintDevice(const TvDevice& device)
    {
        wprintf(
            L"  %hs  %-15hs  %hs",
            ToString(device.brand),
            device.ip.c_str(),
            device.name.c_str());
        if (!device.model.empty())
        {
            wprintf(L" (%hs)", device.model.c_str());
        }
        wprintf(L"\n");
    }

    void RunDiscover(HandlerRegistry& registry)
    {
        wprintf(L"Searching for TVs...\n");
        std::vector<TvDevice> devices = registry.DiscoverAll();
        if (devices.empty())
        {
            wprintf(L"No TVs found.\n");
            return;
        }

        wprintf(L"Found %u TV(s):\n", static_cast<unsigned int>(devices.size()));
        for (const TvDevice& device : devices)
        {
            PrintDevice(device);
        }
    }

    // Minimal device for an address the user typed, used when identification
    // is skipped or fails.
    TvDevice MakeManualDevice(const std::string& ip, TvBrand brand)
    {
        TvDevice device;
        device.ip = ip;
        device.brand = brand;
        if (brand == TvBrand::LgWebOs)
        {
            device.id = "lg-" + ip;
            device.name = "LG TV";
            device.os = "webOS";
            device.port = 3001;
        }
        else
        {
            device.id = "samsung-" + ip;
            device.name = "Samsung TV";
            device.os = "Tizen";
            device.port = 8002;
        }
        return device;
    }

    // Identifies ip with the requested handler, or with every handler when
    // no brand is given. Unidentified addresses fall back to Samsung.
    bool ResolveDevice(
        HandlerRegistry& registry,
        const std::string& ip,
        const std::string& brandText,
        TvDevice& device)
    {
        if (!brandText.empty())
        {
            TvBrand brand = TvBrand::Unknown;
            if (!TryParseTvBrand(brandText, brand))
            {
                wprintf(L"Unknown brand: %hs\n", brandText.c_str());
                return false;
            }

            ITvHandler* handler = registry.GetHandlerByBrand(brand);
            if (handler != nullptr && handler->Identify(ip, std::string(), device))
            {
                return true;
            }

            device = MakeManualDevice(ip, brand);
            return true;
        }

        for (ITvHandler* handler : registry.GetRegisteredHandlers())
        {
            if (handler->Identify(ip, std::string(), device))
            {
                return true;
            }
        }

        InfoLog(L"[Remote] %hs was not identified, assuming Samsung", ip.c_str());
        device = MakeManualDevice(ip, TvBrand::SamsungTizen);
        return true;
    }

    void RunConnect(HandlerRegistry& registry, const std::string& ip, const std::string& brandText)
    {
        TvDevice device;
        if (!ResolveDevice(registry, ip, brandText, device))
        {
            return;
        }

        wprintf(L"Connecting to %hs at %hs. Accept the prompt on the TV if one appears.\n",
            device.name.c_str(),
            device.ip.c_str());

        std::string errorMessage;
        if (!registry.Connect(device, errorMessage))
        {
            wprintf(L"Connection failed: %hs\n", errorMessage.c_str());
        }
    }

    void RunReconnect(HandlerRegistry& registry)
    {
        for (ITvHandler* handler : registry.GetRegisteredHandlers())
        {
            std::string ip;
            if (handler->GetLastConnectedIp(ip))
            {
                RunConnect(registry, ip, ToString(handler->Brand()));
                return;
            }
        }

        wprintf(L"No previously connected TV.\n");
    }

    void RunKeys(HandlerRegistry& registry)
    {
        std::vector<RemoteKeyGroup> groups = registry.GetSupportedKeyGroups();
        if (groups.empty())
        {
            wprintf(L"Not connected.\n");
            return;
        }

        std::vector<StandardRemoteKey> supported = registry.GetSupportedKeys();
        for (RemoteKeyGroup group : groups)
        {
            wprintf(L"  %hs:", ToString(group));
            for (StandardRemoteKey key : GetKeysInGroup(group))
            {
                for (StandardRemoteKey candidate : supported)
                {
                    if (candidate == key)
                    {
                        wprintf(L" %hs", ToString(key));
                        break;
                    }
                }
            }
            wprintf(L"\n");
        }
    }

    void ReportSend(bool sent)
    {
        if (!sent)
        {
            wprintf(L"Command was not sent.\n");
        }
    }

    // Sends one raw key per character. Stops at the first character without a key code.
    void RunType(HandlerRegistry& registry, const std::vector<std::string>& words)
    {
        std::string text;
        for (size_t index = 1; index < words.size(); ++index)
        {
            if (index > 1)
            {
                text += ' ';
            }
            text += words[index];
        }

        for (char character : text)
        {
            std::string keyCode;
            if (!CharToSamsungKey(character, keyCode))
            {
                wprintf(L"Cannot type '%hc'.\n", character);
                return;
            }
            if (!registry.SendRawKey(keyCode))
            {
                ReportSend(false);
                return;
            }
        }
    }

    // Returns false when the user asked to quit.
    bool ExecuteCommand(HandlerRegistry& registry, const std::vector<std::string>& words)
    {
        if (words.empty())
        {
            return true;
        }

        const std::string& command = words[0];
        if (command == "quit" || command == "exit")
        {
            return false;
        }

        if (command == "discover")
        {
            RunDiscover(registry);
        }
        else if (command == "connect" && words.size() >= 2)
        {
            RunConnect(registry, words[1], words.size() >= 3 ? words[2] : std::string());
        }
        else if (command == "reconnect")
        {
            RunReconnect(registry);
        }
        else if (command == "key" && words.size() >= 2)
        {
            StandardRemoteKey key = StandardRemoteKey::Power;
            if (!TryParseRemoteKey(words[1], key))
            {
                wprintf(L"Unknown key: %hs\n", words[1].c_str());
            }
            else
            {
                ReportSend(registry.SendKey(key));
            }
        }
        else if (command == "raw" && words.size() >= 2)
        {
            ReportSend(registry.SendRawKey(words[1]));
        }
        else if (command == "type" && words.size() >= 2)
        {
            RunType(registry, words);
        }
        else if (command == "app" && words.size() >= 2)
        {
            ReportSend(registry.LaunchApp(words[1]));
        }
        else if (command == "keys")
        {
            RunKeys(registry);
        }
        else if (command == "disconnect")
        {
            registry.Disconnect();
        }
        else
        {
            PrintUsage();
        }

        return true;
    }

    void RunPrompt(HandlerRegistry& registry)
    {
        std::string line;
        while (true)
        {
            wprintf(L"> ");
            fflush(stdout);
            if (!std::getline(std::cin, line))
            {
                break;
            }

            if (!ExecuteCommand(registry, SplitWords(line)))
            {
                break;
            }
        }
    }
}

int wmain(int argc, wchar_t* argv[])
{
    WinsockRuntime winsock;
    if (!winsock.IsReady())
    {
        fwprintf(stderr, L"Networking is unavailable.\n");
        return 1;
    }

    AppConfiguration configuration;
    LoadConfiguration(configuration);
    SetConsoleLogging(configuration.consoleLog);
    SetMinimumLogLevel(configuration.logLevel);

    FileTokenStore samsungTokens(GetTokenFilePath(ToString(TvBrand::SamsungTizen)));
    FileTokenStore lgTokens(GetTokenFilePath(ToString(TvBrand::LgWebOs)));

    WinHttpClient httpClient;
    WinsockStreamConnector connector;
    WinsockDiscoveryNetwork discoveryNetwork;

    SamsungTizenHandler samsungHandler(httpClient, connector, samsungTokens, configuration);
    LgWebOsHandler lgHandler(httpClient, connector, lgTokens, configuration);

    HandlerRegistry registry(discoveryNetwork, DiscoveryOptions::FromConfiguration(configuration));
    registry.Register(samsungHandler);
    registry.Register(lgHandler);

    Unsubscribe unsubscribe = registry.OnConnectionStateChange(
        [](const ConnectionEvent& event)
        {
            if (event.state == ConnectionState::Error)
            {
                wprintf(L"[%hs] %hs\n", ToString(event.state), event.error.c_str());
            }
            else if (event.hasDevice)
            {
                wprintf(L"[%hs] %hs (%hs)\n",
                    ToString(event.state),
                    event.device.name.c_str(),
                    event.device.ip.c_str());
            }
            else
            {
                wprintf(L"[%hs]\n", ToString(event.state));
            }
        });

    std::vector<std::string> arguments;
    for (int index = 1; index < argc; ++index)
    {
        arguments.push_back(ToNarrow(argv[index]));
    }

    bool keepRunning = true;
    if (!arguments.empty())
    {
        keepRunning = ExecuteCommand(registry, arguments)
            && arguments[0] != "discover";
    }
    else
    {
        PrintUsage();
    }

    if (keepRunning)
    {
        RunPrompt(registry);
    }

    registry.Disconnect();
    unsubscribe();
    return 0;
}
