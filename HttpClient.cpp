#include "HttpClient.h"

#include "framework.h"
#include "Logging.h"

#include <winhttp.h>

#include <cstdlib>

#pragma comment(lib, "Winhttp.lib")

namespace
{
    std::wstring WidenAscii(const std::string& value)
    {
        return std::wstring(value.begin(), value.end());
    }

    // Closes a WinHTTP handle when leaving scope.
    class ScopedInternetHandle
    {
    public:
        explicit ScopedInternetHandle(HINTERNET handleValue)
            : handle(handleValue)
        {
        }

        ~ScopedInternetHandle()
        {
            if (handle)
            {
                WinHttpCloseHandle(handle);
            }
        }

        ScopedInternetHandle(const ScopedInternetHandle&) = delete;
        ScopedInternetHandle& operator=(const ScopedInternetHandle&) = delete;

        HINTERNET Get() const
        {
            return handle;
        }

        explicit operator bool() const
        {
            return handle != nullptr;
        }

    private:
        HINTERNET handle;
    };
}

bool ParseHttpUrl(const std::string& url, std::string& host, unsigned short& port, std::string& path)
{
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0)
    {
        return false;
    }

    size_t authorityStart = scheme.size();
    size_t pathStart = url.find('/', authorityStart);
    std::string authority = url.substr(
        authorityStart,
        pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);
    path = pathStart == std::string::npos ? "/" : url.substr(pathStart);

    size_t colon = authority.find(':');
    host = authority.substr(0, colon);
    port = 80;
    if (colon != std::string::npos)
    {
        std::string portText = authority.substr(colon + 1);
        char* end = nullptr;
        long parsed = std::strtol(portText.c_str(), &end, 10);
        if (portText.empty() || *end != '\0' || parsed <= 0 || parsed > 65535)
        {
            return false;
        }
        port = static_cast<unsigned short>(parsed);
    }

    return !host.empty();
}

bool WinHttpClient::Get(const std::string& url, int timeoutMs, HttpResponse& response)
{
    response = HttpResponse();

    std::string host;
    std::string path;
    unsigned short port = 0;
    if (!ParseHttpUrl(url, host, port, path))
    {
        WarningLog(L"[Http] Unsupported URL: %hs", url.c_str());
        return false;
    }

    ScopedInternetHandle sessionHandle(WinHttpOpen(
        L"SmartTVRemote/1.0",
        WINHTTP_ACCESS_TYPE_NO_PROXY,
        WINHTTP_NO_PROXY_NAME,
        WINHTTP_NO_PROXY_BYPASS,
        0));
    if (!sessionHandle)
    {
        ErrorLog(L"[Http] WinHttpOpen failed: %lu", GetLastError());
        return false;
    }

    if (!WinHttpSetTimeouts(sessionHandle.Get(), timeoutMs, timeoutMs, timeoutMs, timeoutMs))
    {
        WarningLog(L"[Http] WinHttpSetTimeouts failed: %lu", GetLastError());
    }

    ScopedInternetHandle connectHandle(WinHttpConnect(
        sessionHandle.Get(),
        WidenAscii(host).c_str(),
        port,
        0));
    if (!connectHandle)
    {
        DebugLog(L"[Http] WinHttpConnect %hs failed: %lu", host.c_str(), GetLastError());
        return false;
    }

    ScopedInternetHandle requestHandle(WinHttpOpenRequest(
        connectHandle.Get(),
        L"GET",
        WidenAscii(path).c_str(),
        nullptr,
        WINHTTP_NO_REFERER,
        WINHTTP_DEFAULT_ACCEPT_TYPES,
        0));
    if (!requestHandle)
    {
        ErrorLog(L"[Http] WinHttpOpenRequest failed: %lu", GetLastError());
        return false;
    }

    if (!WinHttpSendRequest(
        requestHandle.Get(),
        WINHTTP_NO_ADDITIONAL_HEADERS,
        0,
        WINHTTP_NO_REQUEST_DATA,
        0,
        0,
        0))
    {
        DebugLog(L"[Http] GET %hs: send failed: %lu", url.c_str(), GetLastError());
        return false;
    }

    if (!WinHttpReceiveResponse(requestHandle.Get(), nullptr))
    {
        DebugLog(L"[Http] GET %hs: no response: %lu", url.c_str(), GetLastError());
        return false;
    }

    DWORD statusCode = 0;
    DWORD statusCodeSize = sizeof(statusCode);
    if (!WinHttpQueryHeaders(
        requestHandle.Get(),
        WINHTTP_QUERY_STATUS_CODE | WINHTTP_QUERY_FLAG_NUMBER,
        WINHTTP_HEADER_NAME_BY_INDEX,
        &statusCode,
        &statusCodeSize,
        WINHTTP_NO_HEADER_INDEX))
    {
        ErrorLog(L"[Http] WinHttpQueryHeaders failed: %lu", GetLastError());
        return false;
    }
    response.statusCode = statusCode;

    for (;;)
    {
        DWORD available = 0;
        if (!WinHttpQueryDataAvailable(requestHandle.Get(), &available))
        {
            DebugLog(L"[Http] GET %hs: read failed: %lu", url.c_str(), GetLastError());
            return false;
        }
        if (available == 0)
        {
            break;
        }

        size_t room = MaxHttpBodySize - response.body.size();
        if (room == 0)
        {
            WarningLog(L"[Http] GET %hs: body truncated at %zu bytes", url.c_str(), MaxHttpBodySize);
            break;
        }

        DWORD toRead = available < room ? available : static_cast<DWORD>(room);
        size_t offset = response.body.size();
        response.body.resize(offset + toRead);

        DWORD bytesRead = 0;
        if (!WinHttpReadData(requestHandle.Get(), &response.body[offset], toRead, &bytesRead))
        {
            DebugLog(L"[Http] GET %hs: read failed: %lu", url.c_str(), GetLastError());
            return false;
        }
        response.body.resize(offset + bytesRead);
        if (bytesRead == 0)
        {
            break;
        }
    }

    DebugLog(L"[Http] GET %hs -> %lu (%zu bytes)", url.c_str(), statusCode, response.body.size());
    return true;
}
