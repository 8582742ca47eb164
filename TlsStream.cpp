#include "TlsStream.h"

#include "Logging.h"

#include <algorithm>
#include <cstring>
#include <utility>

#pragma comment(lib, "Secur32.lib")

namespace
{
    constexpr size_t ReceiveChunkSize = 16 * 1024;

    constexpr DWORD ContextRequestFlags =
        ISC_REQ_SEQUENCE_DETECT |
        ISC_REQ_REPLAY_DETECT |
        ISC_REQ_CONFIDENTIALITY |
        ISC_REQ_ALLOCATE_MEMORY |
        ISC_REQ_STREAM |
        ISC_REQ_MANUAL_CRED_VALIDATION;

    std::string FormatStatus(const char* step, SECURITY_STATUS status)
    {
        char buffer[96]{};
        sprintf_s(buffer, "%s failed: 0x%08lX", step, static_cast<unsigned long>(status));
        return buffer;
    }
}

TlsStream::TlsStream(std::unique_ptr<TcpStream> transportValue)
    : transport(std::move(transportValue)),
    credentials(),
    context(),
    hasCredentials(false),
    hasContext(false),
    sizes(),
    encrypted(),
    decrypted(),
    decryptedOffset(0)
{
}

TlsStream::~TlsStream()
{
    Close();

    if (hasContext)
    {
        DeleteSecurityContext(&context);
    }
    if (hasCredentials)
    {
        FreeCredentialsHandle(&credentials);
    }
}

bool TlsStream::Handshake(const std::string& serverName, int timeoutMs, std::string& errorMessage)
{
    SCHANNEL_CRED channelCredentials{};
    channelCredentials.dwVersion = SCHANNEL_CRED_VERSION;
    channelCredentials.grbitEnabledProtocols =
        SP_PROT_TLS1_CLIENT | SP_PROT_TLS1_1_CLIENT | SP_PROT_TLS1_2_CLIENT;
    channelCredentials.dwFlags =
        SCH_CRED_MANUAL_CRED_VALIDATION | SCH_CRED_NO_DEFAULT_CREDS;

    SECURITY_STATUS status = AcquireCredentialsHandleW(
        nullptr,
        const_cast<wchar_t*>(UNISP_NAME_W),
        SECPKG_CRED_OUTBOUND,
        nullptr,
        &channelCredentials,
        nullptr,
        nullptr,
        &credentials,
        nullptr);
    if (status != SEC_E_OK)
    {
        errorMessage = FormatStatus("AcquireCredentialsHandle", status);
        ErrorLog(L"[Tls] %hs", errorMessage.c_str());
        return false;
    }
    hasCredentials = true;

    transport->SetReceiveTimeout(timeoutMs);

    std::wstring targetName(serverName.begin(), serverName.end());
    bool needMoreData = false;
    bool firstCall = true;

    for (;;)
    {
        if (needMoreData && !ReceiveEncrypted())
        {
            errorMessage = "TLS handshake interrupted by peer";
            ErrorLog(L"[Tls] Handshake with %hs: connection lost", serverName.c_str());
            return false;
        }

        SecBuffer inBuffers[2]{};
        inBuffers[0].BufferType = SECBUFFER_TOKEN;
        inBuffers[0].pvBuffer = encrypted.empty() ? nullptr : encrypted.data();
        inBuffers[0].cbBuffer = static_cast<unsigned long>(encrypted.size());
        inBuffers[1].BufferType = SECBUFFER_EMPTY;

        SecBufferDesc inDescription{};
        inDescription.ulVersion = SECBUFFER_VERSION;
        inDescription.cBuffers = 2;
        inDescription.pBuffers = inBuffers;

        SecBuffer outBuffers[1]{};
        outBuffers[0].BufferType = SECBUFFER_TOKEN;

        SecBufferDesc outDescription{};
        outDescription.ulVersion = SECBUFFER_VERSION;
        outDescription.cBuffers = 1;
        outDescription.pBuffers = outBuffers;

        unsigned long contextAttributes = 0;
        status = InitializeSecurityContextW(
            &credentials,
            firstCall ? nullptr : &context,
            const_cast<wchar_t*>(targetName.c_str()),
            ContextRequestFlags,
            0,
            0,
            firstCall ? nullptr : &inDescription,
            0,
            &context,
            &outDescription,
            &contextAttributes,
            nullptr);

        if (firstCall)
        {
            hasContext = (status == SEC_E_OK || status == SEC_I_CONTINUE_NEEDED);
            firstCall = false;
        }

        if (status == SEC_E_INCOMPLETE_MESSAGE)
        {
            needMoreData = true;
            continue;
        }

        if (outBuffers[0].cbBuffer > 0 && outBuffers[0].pvBuffer != nullptr)
        {
            bool sent = SendAll(outBuffers[0].pvBuffer, outBuffers[0].cbBuffer);
            FreeContextBuffer(outBuffers[0].pvBuffer);
            if (!sent)
            {
                errorMessage = "TLS handshake send failed";
                return false;
            }
        }

        if (status != SEC_E_OK && status != SEC_I_CONTINUE_NEEDED)
        {
            errorMessage = FormatStatus("InitializeSecurityContext", status);
            ErrorLog(L"[Tls] Handshake with %hs: %hs", serverName.c_str(), errorMessage.c_str());
            return false;
        }

        if (inBuffers[1].BufferType == SECBUFFER_EXTRA && inBuffers[1].cbBuffer > 0)
        {
            std::vector<std::uint8_t> extra(
                encrypted.end() - inBuffers[1].cbBuffer,
                encrypted.end());
            encrypted.swap(extra);
        }
        else if (!encrypted.empty() && status != SEC_E_INCOMPLETE_MESSAGE)
        {
            encrypted.clear();
        }

        if (status == SEC_E_OK)
        {
            break;
        }

        needMoreData = encrypted.empty();
    }

    status = QueryContextAttributesW(&context, SECPKG_ATTR_STREAM_SIZES, &sizes);
    if (status != SEC_E_OK)
    {
        errorMessage = FormatStatus("QueryContextAttributes", status);
        ErrorLog(L"[Tls] %hs", errorMessage.c_str());
        return false;
    }

    transport->SetReceiveTimeout(0);
    DebugLog(L"[Tls] Handshake with %hs complete", serverName.c_str());
    return true;
}

bool TlsStream::Write(const void* data, size_t size)
{
    if (!hasContext || sizes.cbMaximumMessage == 0)
    {
        return false;
    }

    const auto* cursor = static_cast<const std::uint8_t*>(data);
    size_t remaining = size;
    std::vector<std::uint8_t> record;

    while (remaining > 0)
    {
        size_t chunk = std::min<size_t>(remaining, sizes.cbMaximumMessage);
        record.assign(sizes.cbHeader + chunk + sizes.cbTrailer, 0);
        std::memcpy(record.data() + sizes.cbHeader, cursor, chunk);

        SecBuffer buffers[4]{};
        buffers[0].BufferType = SECBUFFER_STREAM_HEADER;
        buffers[0].pvBuffer = record.data();
        buffers[0].cbBuffer = sizes.cbHeader;
        buffers[1].BufferType = SECBUFFER_DATA;
        buffers[1].pvBuffer = record.data() + sizes.cbHeader;
        buffers[1].cbBuffer = static_cast<unsigned long>(chunk);
        buffers[2].BufferType = SECBUFFER_STREAM_TRAILER;
        buffers[2].pvBuffer = record.data() + sizes.cbHeader + chunk;
        buffers[2].cbBuffer = sizes.cbTrailer;
        buffers[3].BufferType = SECBUFFER_EMPTY;

        SecBufferDesc description{};
        description.ulVersion = SECBUFFER_VERSION;
        description.cBuffers = 4;
        description.pBuffers = buffers;

        SECURITY_STATUS status = EncryptMessage(&context, 0, &description, 0);
        if (status != SEC_E_OK)
        {
            ErrorLog(L"[Tls] EncryptMessage failed: 0x%08lX", static_cast<unsigned long>(status));
            return false;
        }

        size_t recordSize = buffers[0].cbBuffer + buffers[1].cbBuffer + buffers[2].cbBuffer;
        if (!SendAll(record.data(), recordSize))
        {
            return false;
        }

        cursor += chunk;
        remaining -= chunk;
    }
    return true;
}

bool TlsStream::ReadSome(void* buffer, size_t capacity, size_t& bytesRead)
{
    bytesRead = 0;
    if (!hasContext || capacity == 0)
    {
        return false;
    }

    while (decryptedOffset >= decrypted.size())
    {
        decrypted.clear();
        decryptedOffset = 0;

        if (encrypted.empty() && !ReceiveEncrypted())
        {
            return false;
        }

        SecBuffer buffers[4]{};
        buffers[0].BufferType = SECBUFFER_DATA;
        buffers[0].pvBuffer = encrypted.data();
        buffers[0].cbBuffer = static_cast<unsigned long>(encrypted.size());
        buffers[1].BufferType = SECBUFFER_EMPTY;
        buffers[2].BufferType = SECBUFFER_EMPTY;
        buffers[3].BufferType = SECBUFFER_EMPTY;

        SecBufferDesc description{};
        description.ulVersion = SECBUFFER_VERSION;
        description.cBuffers = 4;
        description.pBuffers = buffers;

        SECURITY_STATUS status = DecryptMessage(&context, &description, 0, nullptr);
        if (status == SEC_E_INCOMPLETE_MESSAGE)
        {
            if (!ReceiveEncrypted())
            {
                return false;
            }
            continue;
        }

        if (status == SEC_I_CONTEXT_EXPIRED)
        {
            DebugLog(L"[Tls] Peer sent close_notify");
            return false;
        }

        if (status != SEC_E_OK)
        {
            ErrorLog(L"[Tls] DecryptMessage failed: 0x%08lX", static_cast<unsigned long>(status));
            return false;
        }

        std::vector<std::uint8_t> extra;
        for (const SecBuffer& output : buffers)
        {
            if (output.BufferType == SECBUFFER_DATA && output.cbBuffer > 0)
            {
                const auto* begin = static_cast<const std::uint8_t*>(output.pvBuffer);
                decrypted.assign(begin, begin + output.cbBuffer);
            }
            else if (output.BufferType == SECBUFFER_EXTRA && output.cbBuffer > 0)
            {
                extra.assign(encrypted.end() - output.cbBuffer, encrypted.end());
            }
        }
        encrypted.swap(extra);
    }

    size_t available = decrypted.size() - decryptedOffset;
    bytesRead = std::min(available, capacity);
    std::memcpy(buffer, decrypted.data() + decryptedOffset, bytesRead);
    decryptedOffset += bytesRead;
    return true;
}

void TlsStream::Close()
{
    if (transport)
    {
        transport->Close();
    }
}

bool TlsStream::ReceiveEncrypted()
{
    std::uint8_t chunk[ReceiveChunkSize];
    size_t bytesRead = 0;
    if (!transport->ReadSome(chunk, sizeof(chunk), bytesRead))
    {
        return false;
    }
    encrypted.insert(encrypted.end(), chunk, chunk + bytesRead);
    return true;
}

bool TlsStream::SendAll(const void* data, size_t size)
{
    return transport->Write(data, size);
}
