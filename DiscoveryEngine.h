#pragma once

#include "Configuration.h"

#include <map>
#include <string>
#include <vector>

// Outcome of waiting for one multicast reply.
enum class ReceiveResult
{
    Packet,
    Timeout,
    Failed,
};

// Network operations used by discovery.
class IDiscoveryNetwork
{
public:
    virtual ~IDiscoveryNetwork() = default;

    // Opens the UDP socket used for M-SEARCH requests and their replies.
    virtual bool OpenMulticast() = 0;
    virtual bool SendSearch(const std::string& message) = 0;
    virtual ReceiveResult ReceiveResponse(int timeoutMs, std::string& payload, std::string& sourceIp) = 0;
    virtual void CloseMulticast() = 0;

    virtual bool GetLocalIpv4Address(std::string& ip) = 0;

    // True when a TCP connection to ip:port succeeds within the timeout.
    virtual bool ProbeTcpPort(const std::string& ip, unsigned short port, int timeoutMs) = 0;
};

struct DiscoveryOptions
{
    int windowMs = 4000;
    int resendCount = 3;
    int resendIntervalMs = 150;
    int searchTargetGapMs = 300;
    int scanFirstHost = 1;
    int scanLastHost = 60;
    int scanConcurrency = 20;
    int probeTimeoutMs = 800;
    int scanTimeoutMs = 5000;
    unsigned short scanPort = 8001;

    static DiscoveryOptions FromConfiguration(const AppConfiguration& configuration);
};

// An address that may host a TV, with the SSDP reply that named it if any.
struct DiscoveryCandidate
{
    std::string ip;
    std::string ssdpResponse;
};

// Finds candidate TV addresses with SSDP, falling back to a subnet port scan.
class DiscoveryEngine
{
public:
    DiscoveryEngine(IDiscoveryNetwork& network, DiscoveryOptions options);

    // Returns candidates unique by IP and sorted by address. Never fails; an
    // unusable network yields an empty list.
    std::vector<DiscoveryCandidate> Discover();

    static const std::vector<std::string>& SearchTargets();
    static std::string BuildSearchMessage(const std::string& searchTarget);
    static bool IsTvLikeResponse(const std::string& response);

    // Reads the IPv4 host from the LOCATION header.
    static bool ExtractIpFromSsdpResponse(const std::string& response, std::string& ip);

    // Hosts in [firstHost, lastHost] of the local /24, excluding the local address.
    static std::vector<std::string> BuildSubnetProbeList(const std::string& localIp, int firstHost, int lastHost);

private:
    bool SearchMulticast(std::map<std::string, std::string>& found);
    std::vector<std::string> ScanSubnet();

    IDiscoveryNetwork& network;
    DiscoveryOptions options;
};

// Orders dotted IPv4 strings numerically; anything unparsable sorts last.
bool IpAddressLess(const std::string& left, const std::string& right);
