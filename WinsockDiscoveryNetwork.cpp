#include "WinsockDiscoveryNetwork.h"

#include "Logging.h"
#include "NetworkStream.h"

#include <iphlpapi.h>

#include <vector>

#pragma comment(lib, "Iphlpapi.lib")
#pragma comment(lib, "Ws2_32.lib")

namespace
{
    const char MulticastGroup[] = "239.255.255.250";
    constexpr unsigned short SsdpPort = 1900;
    constexpr int ReceiveBufferSize = 4096;
}

WinsockDiscoveryNetwork::WinsockDiscoveryNetwork()
    : multicastSocket(INVALID_SOCKET),
    groupAddress()
{
    groupAddress.sin_family = AF_INET;
    groupAddress.sin_port = htons(SsdpPort);
    InetPtonA(AF_INET, MulticastGroup, &groupAddress.sin_addr);
}

WinsockDiscoveryNetwork::~WinsockDiscoveryNetwork()
{
    CloseMulticast();
}

bool WinsockDiscoveryNetwork::OpenMulticast()
{
    CloseMulticast();

    multicastSocket = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (multicastSocket == INVALID_SOCKET)
    {
        ErrorLog(L"[Discovery] UDP socket failed: %d", WSAGetLastError());
        return false;
    }

    sockaddr_in localAddress{};
    localAddress.sin_family = AF_INET;
    localAddress.sin_addr.s_addr = htonl(INADDR_ANY);
    localAddress.sin_port = 0;
    if (bind(multicastSocket, reinterpret_cast<const sockaddr*>(&localAddress), sizeof(localAddress)) == SOCKET_ERROR)
    {
        ErrorLog(L"[Discovery] bind failed: %d", WSAGetLastError());
        CloseMulticast();
        return false;
    }

    DWORD timeToLive = 4;
    if (setsockopt(
        multicastSocket,
        IPPROTO_IP,
        IP_MULTICAST_TTL,
        reinterpret_cast<const char*>(&timeToLive),
        sizeof(timeToLive)) == SOCKET_ERROR)
    {
        WarningLog(L"[Discovery] IP_MULTICAST_TTL failed: %d", WSAGetLastError());
    }

    // Replies are unicast, so failing to join only loses NOTIFY traffic.
    ip_mreq membership{};
    membership.imr_multiaddr = groupAddress.sin_addr;
    membership.imr_interface.s_addr = htonl(INADDR_ANY);
    if (setsockopt(
        multicastSocket,
        IPPROTO_IP,
        IP_ADD_MEMBERSHIP,
        reinterpret_cast<const char*>(&membership),
        sizeof(membership)) == SOCKET_ERROR)
    {
        DebugLog(L"[Discovery] IP_ADD_MEMBERSHIP failed: %d", WSAGetLastError());
    }

    return true;
}

bool WinsockDiscoveryNetwork::SendSearch(const std::string& message)
{
    if (multicastSocket == INVALID_SOCKET)
    {
        return false;
    }

    int sent = sendto(
        multicastSocket,
        message.data(),
        static_cast<int>(message.size()),
        0,
        reinterpret_cast<const sockaddr*>(&groupAddress),
        sizeof(groupAddress));
    if (sent == SOCKET_ERROR)
    {
        DebugLog(L"[Discovery] sendto failed: %d", WSAGetLastError());
        return false;
    }
    return true;
}

ReceiveResult WinsockDiscoveryNetwork::ReceiveResponse(int timeoutMs, std::string& payload, std::string& sourceIp)
{
    if (multicastSocket == INVALID_SOCKET)
    {
        return ReceiveResult::Failed;
    }

    fd_set readSet;
    FD_ZERO(&readSet);
    FD_SET(multicastSocket, &readSet);

    timeval timeout{};
    timeout.tv_sec = timeoutMs / 1000;
    timeout.tv_usec = (timeoutMs % 1000) * 1000;

    int ready = select(0, &readSet, nullptr, nullptr, &timeout);
    if (ready == 0)
    {
        return ReceiveResult::Timeout;
    }
    if (ready == SOCKET_ERROR)
    {
        ErrorLog(L"[Discovery] select failed: %d", WSAGetLastError());
        return ReceiveResult::Failed;
    }

    char buffer[ReceiveBufferSize];
    sockaddr_in source{};
    int sourceLength = sizeof(source);
    int received = recvfrom(
        multicastSocket,
        buffer,
        sizeof(buffer),
        0,
        reinterpret_cast<sockaddr*>(&source),
        &sourceLength);
    if (received == SOCKET_ERROR)
    {
        int error = WSAGetLastError();
        // Oversized datagrams and ICMP port-unreachable echoes are not fatal.
        if (error == WSAEMSGSIZE || error == WSAECONNRESET)
        {
            return ReceiveResult::Timeout;
        }
        ErrorLog(L"[Discovery] recvfrom failed: %d", error);
        return ReceiveResult::Failed;
    }

    payload.assign(buffer, buffer + received);

    char addressText[INET_ADDRSTRLEN]{};
    if (InetNtopA(AF_INET, &source.sin_addr, addressText, sizeof(addressText)))
    {
        sourceIp = addressText;
    }
    else
    {
        sourceIp.clear();
    }
    return ReceiveResult::Packet;
}

void WinsockDiscoveryNetwork::CloseMulticast()
{
    if (multicastSocket != INVALID_SOCKET)
    {
        closesocket(multicastSocket);
        multicastSocket = INVALID_SOCKET;
    }
}

bool WinsockDiscoveryNetwork::GetLocalIpv4Address(std::string& ip)
{
    ULONG flags = GAA_FLAG_SKIP_ANYCAST | GAA_FLAG_SKIP_MULTICAST | GAA_FLAG_SKIP_DNS_SERVER;
    ULONG bufferSize = 15 * 1024;
    std::vector<unsigned char> buffer;
    ULONG result = ERROR_BUFFER_OVERFLOW;

    for (int attempt = 0; attempt < 3 && result == ERROR_BUFFER_OVERFLOW; ++attempt)
    {
        buffer.resize(bufferSize);
        result = GetAdaptersAddresses(
            AF_INET,
            flags,
            nullptr,
            reinterpret_cast<IP_ADAPTER_ADDRESSES*>(buffer.data()),
            &bufferSize);
    }

    if (result != NO_ERROR)
    {
        ErrorLog(L"[Discovery] GetAdaptersAddresses failed: %lu", result);
        return false;
    }

    for (auto* adapter = reinterpret_cast<IP_ADAPTER_ADDRESSES*>(buffer.data());
        adapter != nullptr;
        adapter = adapter->Next)
    {
        if (adapter->OperStatus != IfOperStatusUp || adapter->IfType == IF_TYPE_SOFTWARE_LOOPBACK)
        {
            continue;
        }

        for (auto* unicast = adapter->FirstUnicastAddress; unicast != nullptr; unicast = unicast->Next)
        {
            const auto* address = reinterpret_cast<const sockaddr_in*>(unicast->Address.lpSockaddr);
            if (address->sin_family != AF_INET)
            {
                continue;
            }

            char addressText[INET_ADDRSTRLEN]{};
            if (!InetNtopA(AF_INET, &address->sin_addr, addressText, sizeof(addressText)))
            {
                continue;
            }

            std::string candidate(addressText);
            if (candidate.compare(0, 4, "127.") == 0 || candidate.compare(0, 8, "169.254.") == 0)
            {
                continue;
            }

            ip = candidate;
            DebugLog(L"[Discovery] Local address %hs on %s", ip.c_str(), adapter->FriendlyName);
            return true;
        }
    }

    return false;
}

bool WinsockDiscoveryNetwork::ProbeTcpPort(const std::string& ip, unsigned short port, int timeoutMs)
{
    int lastError = 0;
    SOCKET socketHandle = ConnectTcpSocket(ip, port, timeoutMs, lastError);
    if (socketHandle == INVALID_SOCKET)
    {
        return false;
    }
    closesocket(socketHandle);
    return true;
}
