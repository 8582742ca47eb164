#pragma once

#include "NetworkStream.h"

#ifndef SECURITY_WIN32
#define SECURITY_WIN32
#endif
#include <security.h>
#include <schannel.h>

#include <memory>
#include <string>
#include <vector>

// SChannel client stream over a connected TcpStream. Peer certificates are
// not validated; TVs present self-signed certificates.
class TlsStream : public IByteStream
{
public:
    explicit TlsStream(std::unique_ptr<TcpStream> transport);
    ~TlsStream() override;

    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    // Runs the TLS client handshake. Reads are bounded by timeoutMs meanwhile.
    bool Handshake(const std::string& serverName, int timeoutMs, std::string& errorMessage);

    bool Write(const void* data, size_t size) override;
    bool ReadSome(void* buffer, size_t capacity, size_t& bytesRead) override;
    void Close() override;

private:
    bool ReceiveEncrypted();
    bool SendAll(const void* data, size_t size);

    std::unique_ptr<TcpStream> transport;
    CredHandle credentials;
    CtxtHandle context;
    bool hasCredentials;
    bool hasContext;
    SecPkgContext_StreamSizes sizes;
    std::vector<std::uint8_t> encrypted;
    std::vector<std::uint8_t> decrypted;
    size_t decryptedOffset;
};
