#include "DiscoveryEngine.h"

#include "Logging.h"
#include "StringUtilities.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <regex>
#include <system_error>
#include <thread>

namespace
{
    const char SsdpAddress[] = "239.255.255.250:1900";
    constexpr int ListenSliceMs = 250;

    const char* const TvKeywords[] = {
        "samsung",
        "tizen",
        "tv",
        "dial",
        "mediarenderer",
        "remotecontrol",
        "roku",
        "lg",
        "webos",
        "android",
    };

    bool ParseIpv4(const std::string& text, std::uint32_t& value)
    {
        value = 0;
        int octets = 0;
        size_t index = 0;
        while (octets < 4)
        {
            if (index >= text.size() || text[index] < '0' || text[index] > '9')
            {
                return false;
            }

            int octet = 0;
            size_t digits = 0;
            while (index < text.size() && text[index] >= '0' && text[index] <= '9' && digits < 4)
            {
                octet = octet * 10 + (text[index] - '0');
                ++index;
                ++digits;
            }
            if (digits > 3 || octet > 255)
            {
                return false;
            }

            value = (value << 8) | static_cast<std::uint32_t>(octet);
            ++octets;

            if (octets < 4)
            {
                if (index >= text.size() || text[index] != '.')
                {
                    return false;
                }
                ++index;
            }
        }
        return index == text.size();
    }

    int MillisecondsUntil(std::chrono::steady_clock::time_point deadline)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        return remaining > 0 ? static_cast<int>(remaining) : 0;
    }
}

DiscoveryOptions DiscoveryOptions::FromConfiguration(const AppConfiguration& configuration)
{
    DiscoveryOptions options;
    options.windowMs = configuration.ssdpWindowMs;
    options.resendCount = configuration.ssdpResendCount;
    options.resendIntervalMs = configuration.ssdpResendIntervalMs;
    options.scanFirstHost = configuration.scanFirstHost;
    options.scanLastHost = configuration.scanLastHost;
    options.scanConcurrency = configuration.scanConcurrency;
    options.probeTimeoutMs = configuration.probeTimeoutMs;
    options.scanTimeoutMs = configuration.scanTimeoutMs;
    options.scanPort = configuration.scanPort;
    return options;
}

bool IpAddressLess(const std::string& left, const std::string& right)
{
    std::uint32_t leftValue = 0;
    std::uint32_t rightValue = 0;
    bool leftValid = ParseIpv4(left, leftValue);
    bool rightValid = ParseIpv4(right, rightValue);

    if (leftValid && rightValid)
    {
        return leftValue < rightValue;
    }
    if (leftValid != rightValid)
    {
        return leftValid;
    }
    return left < right;
}

DiscoveryEngine::DiscoveryEngine(IDiscoveryNetwork& networkValue, DiscoveryOptions optionsValue)
    : network(networkValue),
    options(optionsValue)
{
}

const std::vector<std::string>& DiscoveryEngine::SearchTargets()
{
    static const std::vector<std::string> targets = {
        "ssdp:all",
        "urn:samsung.com:device:RemoteControlReceiver:1",
        "urn:dial-multiscreen-org:service:dial:1",
    };
    return targets;
}

std::string DiscoveryEngine::BuildSearchMessage(const std::string& searchTarget)
{
    std::string message;
    message.reserve(128);
    message += "M-SEARCH * HTTP/1.1\r\n";
    message += "HOST: ";
    message += SsdpAddress;
    message += "\r\n";
    message += "MAN: \"ssdp:discover\"\r\n";
    message += "ST: ";
    message += searchTarget;
    message += "\r\n";
    message += "MX: 3\r\n";
    message += "\r\n";
    return message;
}

bool DiscoveryEngine::IsTvLikeResponse(const std::string& response)
{
    std::string lower = ToLowerAscii(response);
    for (const char* keyword : TvKeywords)
    {
        if (lower.find(keyword) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

bool DiscoveryEngine::ExtractIpFromSsdpResponse(const std::string& response, std::string& ip)
{
    static const std::regex hostPattern("(?:https?://)?([0-9.]+)(?::\\d+)?");

    std::string location = GetHttpHeaderValue(response, "LOCATION");
    std::smatch match;
    if (location.empty() || !std::regex_search(location, match, hostPattern))
    {
        return false;
    }

    std::uint32_t unused = 0;
    if (!ParseIpv4(match[1].str(), unused))
    {
        return false;
    }
    ip = match[1].str();
    return true;
}

std::vector<std::string> DiscoveryEngine::BuildSubnetProbeList(
    const std::string& localIp,
    int firstHost,
    int lastHost)
{
    std::vector<std::string> hosts;

    std::uint32_t address = 0;
    if (!ParseIpv4(localIp, address))
    {
        return hosts;
    }

    int ownHost = static_cast<int>(address & 0xFF);
    std::string prefix = localIp.substr(0, localIp.find_last_of('.') + 1);

    int first = std::max(firstHost, 1);
    int last = std::min(lastHost, 254);
    for (int host = first; host <= last; ++host)
    {
        if (host == ownHost)
        {
            continue;
        }
        hosts.push_back(prefix + std::to_string(host));
    }
    return hosts;
}

std::vector<DiscoveryCandidate> DiscoveryEngine::Discover()
{
    std::map<std::string, std::string> found;

    try
    {
        if (!SearchMulticast(found))
        {
            WarningLog(L"[Discovery] Multicast search failed");
        }

        if (found.empty())
        {
            InfoLog(L"[Discovery] SSDP found nothing, scanning subnet on port %u", options.scanPort);
            for (const std::string& ip : ScanSubnet())
            {
                found.emplace(ip, std::string());
            }
        }
    }
    catch (const std::system_error& error)
    {
        ErrorLog(L"[Discovery] Worker thread failed: %hs", error.what());
    }

    std::vector<DiscoveryCandidate> candidates;
    candidates.reserve(found.size());
    for (auto& entry : found)
    {
        candidates.push_back(DiscoveryCandidate{ entry.first, entry.second });
    }

    std::sort(
        candidates.begin(),
        candidates.end(),
        [](const DiscoveryCandidate& left, const DiscoveryCandidate& right)
        {
            return IpAddressLess(left.ip, right.ip);
        });

    InfoLog(L"[Discovery] Found %zu candidate(s)", candidates.size());
    return candidates;
}

bool DiscoveryEngine::SearchMulticast(std::map<std::string, std::string>& found)
{
    if (!network.OpenMulticast())
    {
        return false;
    }

    std::mutex foundMutex;
    std::atomic<bool> receiveFailed(false);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options.windowMs);

    std::thread listener([&]()
    {
        for (;;)
        {
            int remaining = MillisecondsUntil(deadline);
            if (remaining <= 0)
            {
                break;
            }

            std::string payload;
            std::string sourceIp;
            ReceiveResult result = network.ReceiveResponse(
                std::min(remaining, ListenSliceMs),
                payload,
                sourceIp);
            if (result == ReceiveResult::Timeout)
            {
                continue;
            }
            if (result == ReceiveResult::Failed)
            {
                receiveFailed = true;
                break;
            }

            if (!IsTvLikeResponse(payload))
            {
                continue;
            }

            std::string ip;
            if (!ExtractIpFromSsdpResponse(payload, ip))
            {
                ip = sourceIp;
            }
            if (ip.empty())
            {
                continue;
            }

            std::lock_guard<std::mutex> lock(foundMutex);
            if (found.emplace(ip, payload).second)
            {
                DebugLog(L"[Discovery] SSDP reply from TV-like device at %hs", ip.c_str());
            }
        }
    });

    const std::vector<std::string>& targets = SearchTargets();
    for (size_t targetIndex = 0; targetIndex < targets.size(); ++targetIndex)
    {
        if (targetIndex > 0)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(options.searchTargetGapMs));
        }

        std::string message = BuildSearchMessage(targets[targetIndex]);
        for (int attempt = 0; attempt < options.resendCount; ++attempt)
        {
            if (!network.SendSearch(message))
            {
                DebugLog(L"[Discovery] M-SEARCH send failed for %hs", targets[targetIndex].c_str());
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(options.resendIntervalMs));
        }
    }

    listener.join();
    network.CloseMulticast();

    std::lock_guard<std::mutex> lock(foundMutex);
    InfoLog(L"[Discovery] SSDP window closed with %zu device(s)", found.size());
    return !receiveFailed;
}

std::vector<std::string> DiscoveryEngine::ScanSubnet()
{
    std::string localIp;
    if (!network.GetLocalIpv4Address(localIp))
    {
        WarningLog(L"[Discovery] Cannot determine local IPv4 address for subnet scan");
        return {};
    }

    std::vector<std::string> hosts = BuildSubnetProbeList(localIp, options.scanFirstHost, options.scanLastHost);
    if (hosts.empty())
    {
        return {};
    }
    DebugLog(L"[Discovery] Probing %zu host(s) around %hs", hosts.size(), localIp.c_str());

    std::mutex openMutex;
    std::vector<std::string> openHosts;
    std::atomic<size_t> nextHost(0);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options.scanTimeoutMs);

    auto probeWorker = [&]()
    {
        for (;;)
        {
            size_t index = nextHost.fetch_add(1);
            if (index >= hosts.size())
            {
                return;
            }

            int remaining = MillisecondsUntil(deadline);
            if (remaining <= 0)
            {
                return;
            }

            const std::string& host = hosts[index];
            if (network.ProbeTcpPort(host, options.scanPort, std::min(options.probeTimeoutMs, remaining)))
            {
                DebugLog(L"[Discovery] Port %u open on %hs", options.scanPort, host.c_str());
                std::lock_guard<std::mutex> lock(openMutex);
                openHosts.push_back(host);
            }
        }
    };

    size_t workerCount = std::min(hosts.size(), static_cast<size_t>(std::max(options.scanConcurrency, 1)));
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t index = 0; index < workerCount; ++index)
    {
        try
        {
            workers.emplace_back(probeWorker);
        }
        catch (const std::system_error& error)
        {
            WarningLog(L"[Discovery] Started %zu of %zu probe workers: %hs", index, workerCount, error.what());
            break;
        }
    }

    for (std::thread& worker : workers)
    {
        worker.join();
    }

    std::sort(openHosts.begin(), openHosts.end(), IpAddressLess);
    InfoLog(L"[Discovery] Subnet scan found %zu host(s)", openHosts.size());
    return openHosts;
}
