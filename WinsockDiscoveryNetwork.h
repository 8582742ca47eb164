#pragma once

#include "framework.h"
#include "DiscoveryEngine.h"

// IDiscoveryNetwork over Winsock UDP/TCP and the IP Helper API.
class WinsockDiscoveryNetwork : public IDiscoveryNetwork
{
public:
    WinsockDiscoveryNetwork();
    ~WinsockDiscoveryNetwork() override;

    WinsockDiscoveryNetwork(const WinsockDiscoveryNetwork&) = delete;
    WinsockDiscoveryNetwork& operator=(const WinsockDiscoveryNetwork&) = delete;

    bool OpenMulticast() override;
    bool SendSearch(const std::string& message) override;
    ReceiveResult ReceiveResponse(int timeoutMs, std::string& payload, std::string& sourceIp) override;
    void CloseMulticast() override;

    bool GetLocalIpv4Address(std::string& ip) override;
    bool ProbeTcpPort(const std::string& ip, unsigned short port, int timeoutMs) override;

private:
    SOCKET multicastSocket;
    sockaddr_in groupAddress;
};
