#pragma once

#include <cstddef>
#include <string>

struct HttpResponse
{
    unsigned long statusCode = 0;
    std::string body;
};

// Plaintext HTTP GET used by identification probes.
class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    // Returns false on any transport failure; HTTP error statuses still return true.
    virtual bool Get(const std::string& url, int timeoutMs, HttpResponse& response) = 0;
};

// IHttpClient over WinHTTP.
class WinHttpClient : public IHttpClient
{
public:
    bool Get(const std::string& url, int timeoutMs, HttpResponse& response) override;
};

// Largest response body kept by WinHttpClient.
constexpr size_t MaxHttpBodySize = 256 * 1024;

// Splits http://host[:port][/path]. The port defaults to 80 and the path to "/".
bool ParseHttpUrl(const std::string& url, std::string& host, unsigned short& port, std::string& path);
