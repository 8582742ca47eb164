#pragma once

#include "framework.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Bidirectional byte stream under a WebSocket session.
class IByteStream
{
public:
    virtual ~IByteStream() = default;

    // Writes every byte or fails.
    virtual bool Write(const void* data, size_t size) = 0;

    // Reads at least one byte; false on end of stream or error.
    virtual bool ReadSome(void* buffer, size_t capacity, size_t& bytesRead) = 0;

    // Unblocks any pending read. Safe to call more than once.
    virtual void Close() = 0;
};

// Reads exactly size bytes or fails.
bool ReadExact(IByteStream& stream, void* buffer, size_t size);

// Opens byte streams to a TV endpoint.
class IStreamConnector
{
public:
    virtual ~IStreamConnector() = default;

    virtual std::unique_ptr<IByteStream> Open(
        const std::string& ip,
        unsigned short port,
        bool secure,
        int timeoutMs,
        std::string& errorMessage) = 0;
};

// Initializes Winsock for the lifetime of the object.
class WinsockRuntime
{
public:
    WinsockRuntime();
    ~WinsockRuntime();

    WinsockRuntime(const WinsockRuntime&) = delete;
    WinsockRuntime& operator=(const WinsockRuntime&) = delete;

    bool IsReady() const;

private:
    bool ready;
};

// Connects a TCP socket with a bounded wait. Returns INVALID_SOCKET on failure.
SOCKET ConnectTcpSocket(const std::string& ip, unsigned short port, int timeoutMs, int& lastError);

// Plain Winsock TCP connection.
class TcpStream : public IByteStream
{
public:
    explicit TcpStream(SOCKET socketHandle);
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    bool Write(const void* data, size_t size) override;
    bool ReadSome(void* buffer, size_t capacity, size_t& bytesRead) override;
    void Close() override;

    // Bounds blocking reads; zero waits indefinitely.
    bool SetReceiveTimeout(int timeoutMs);

private:
    SOCKET socketHandle;
    std::atomic<bool> closed;
};

// Opens TcpStream connections, wrapped in TLS for secure endpoints.
class WinsockStreamConnector : public IStreamConnector
{
public:
    std::unique_ptr<IByteStream> Open(
        const std::string& ip,
        unsigned short port,
        bool secure,
        int timeoutMs,
        std::string& errorMessage) override;
};
