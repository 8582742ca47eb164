#include "NetworkStream.h"

#include "Logging.h"
#include "TlsStream.h"

#include <algorithm>
#include <climits>
#include <utility>

#pragma comment(lib, "Ws2_32.lib")

bool ReadExact(IByteStream& stream, void* buffer, size_t size)
{
    auto* cursor = static_cast<std::uint8_t*>(buffer);
    size_t received = 0;
    while (received < size)
    {
        size_t bytesRead = 0;
        if (!stream.ReadSome(cursor + received, size - received, bytesRead))
        {
            return false;
        }
        received += bytesRead;
    }
    return true;
}

WinsockRuntime::WinsockRuntime()
    : ready(false)
{
    WSADATA data{};
    int result = WSAStartup(MAKEWORD(2, 2), &data);
    if (result != 0)
    {
        ErrorLog(L"[Network] WSAStartup failed: %d", result);
        return;
    }
    ready = true;
}

WinsockRuntime::~WinsockRuntime()
{
    if (ready)
    {
        WSACleanup();
    }
}

bool WinsockRuntime::IsReady() const
{
    return ready;
}

SOCKET ConnectTcpSocket(const std::string& ip, unsigned short port, int timeoutMs, int& lastError)
{
    lastError = 0;

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    if (InetPtonA(AF_INET, ip.c_str(), &address.sin_addr) != 1)
    {
        lastError = WSAEINVAL;
        return INVALID_SOCKET;
    }

    SOCKET socketHandle = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socketHandle == INVALID_SOCKET)
    {
        lastError = WSAGetLastError();
        return INVALID_SOCKET;
    }

    u_long nonBlocking = 1;
    ioctlsocket(socketHandle, FIONBIO, &nonBlocking);

    int result = connect(socketHandle, reinterpret_cast<const sockaddr*>(&address), sizeof(address));
    if (result == SOCKET_ERROR)
    {
        int error = WSAGetLastError();
        if (error != WSAEWOULDBLOCK)
        {
            lastError = error;
            closesocket(socketHandle);
            return INVALID_SOCKET;
        }

        fd_set writeSet;
        fd_set errorSet;
        FD_ZERO(&writeSet);
        FD_ZERO(&errorSet);
        FD_SET(socketHandle, &writeSet);
        FD_SET(socketHandle, &errorSet);

        timeval timeout{};
        timeout.tv_sec = timeoutMs / 1000;
        timeout.tv_usec = (timeoutMs % 1000) * 1000;

        int ready = select(0, nullptr, &writeSet, &errorSet, &timeout);
        if (ready <= 0)
        {
            lastError = (ready == 0) ? WSAETIMEDOUT : WSAGetLastError();
            closesocket(socketHandle);
            return INVALID_SOCKET;
        }

        int socketError = 0;
        int optionLength = sizeof(socketError);
        getsockopt(socketHandle, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&socketError), &optionLength);
        if (FD_ISSET(socketHandle, &errorSet) || socketError != 0)
        {
            lastError = socketError != 0 ? socketError : WSAECONNREFUSED;
            closesocket(socketHandle);
            return INVALID_SOCKET;
        }
    }

    u_long blocking = 0;
    ioctlsocket(socketHandle, FIONBIO, &blocking);

    BOOL noDelay = TRUE;
    setsockopt(socketHandle, IPPROTO_TCP, TCP_NODELAY, reinterpret_cast<const char*>(&noDelay), sizeof(noDelay));

    return socketHandle;
}

TcpStream::TcpStream(SOCKET socketHandleValue)
    : socketHandle(socketHandleValue),
    closed(false)
{
}

TcpStream::~TcpStream()
{
    Close();
    if (socketHandle != INVALID_SOCKET)
    {
        closesocket(socketHandle);
        socketHandle = INVALID_SOCKET;
    }
}

bool TcpStream::Write(const void* data, size_t size)
{
    if (closed.load())
    {
        return false;
    }

    const char* cursor = static_cast<const char*>(data);
    size_t sent = 0;
    while (sent < size)
    {
        int chunk = static_cast<int>(std::min<size_t>(size - sent, INT_MAX));
        int result = send(socketHandle, cursor + sent, chunk, 0);
        if (result == SOCKET_ERROR)
        {
            DebugLog(L"[Network] send failed: %d", WSAGetLastError());
            return false;
        }
        sent += static_cast<size_t>(result);
    }
    return true;
}

bool TcpStream::ReadSome(void* buffer, size_t capacity, size_t& bytesRead)
{
    bytesRead = 0;
    if (closed.load() || capacity == 0)
    {
        return false;
    }

    int chunk = static_cast<int>(std::min<size_t>(capacity, INT_MAX));
    int result = recv(socketHandle, static_cast<char*>(buffer), chunk, 0);
    if (result <= 0)
    {
        return false;
    }

    bytesRead = static_cast<size_t>(result);
    return true;
}

void TcpStream::Close()
{
    if (closed.exchange(true))
    {
        return;
    }

    if (socketHandle != INVALID_SOCKET)
    {
        shutdown(socketHandle, SD_BOTH);
    }
}

bool TcpStream::SetReceiveTimeout(int timeoutMs)
{
    DWORD timeout = static_cast<DWORD>(timeoutMs < 0 ? 0 : timeoutMs);
    return setsockopt(
        socketHandle,
        SOL_SOCKET,
        SO_RCVTIMEO,
        reinterpret_cast<const char*>(&timeout),
        sizeof(timeout)) == 0;
}

std::unique_ptr<IByteStream> WinsockStreamConnector::Open(
    const std::string& ip,
    unsigned short port,
    bool secure,
    int timeoutMs,
    std::string& errorMessage)
{
    int lastError = 0;
    SOCKET socketHandle = ConnectTcpSocket(ip, port, timeoutMs, lastError);
    if (socketHandle == INVALID_SOCKET)
    {
        errorMessage = "Could not reach " + ip + ":" + std::to_string(port)
            + " (WSA error " + std::to_string(lastError) + ")";
        return nullptr;
    }

    auto tcpStream = std::make_unique<TcpStream>(socketHandle);
    if (!secure)
    {
        return tcpStream;
    }

    auto tlsStream = std::make_unique<TlsStream>(std::move(tcpStream));
    if (!tlsStream->Handshake(ip, timeoutMs, errorMessage))
    {
        return nullptr;
    }
    return tlsStream;
}
