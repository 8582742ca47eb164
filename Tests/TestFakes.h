#pragma once

#include "DiscoveryEngine.h"
#include "EventChannel.h"
#include "HttpClient.h"
#include "NetworkStream.h"
#include "TokenStore.h"
#include "TvHandler.h"
#include "WebSocketFrame.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

const char SwitchingProtocolsResponse[] =
    "HTTP/1.1 101 Switching Protocols\r\n"
    "Upgrade: websocket\r\n"
    "Connection: Upgrade\r\n"
    "\r\n";

// Unmasked frame as a TV would send it.
inline std::vector<std::uint8_t> ServerFrame(WebSocketOpcode opcode, const std::string& payload)
{
    std::vector<std::uint8_t> frame;
    frame.push_back(static_cast<std::uint8_t>(0x80 | static_cast<std::uint8_t>(opcode)));
    if (payload.size() <= 125)
    {
        frame.push_back(static_cast<std::uint8_t>(payload.size()));
    }
    else
    {
        frame.push_back(126);
        frame.push_back(static_cast<std::uint8_t>((payload.size() >> 8) & 0xFF));
        frame.push_back(static_cast<std::uint8_t>(payload.size() & 0xFF));
    }
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

// Shared between a FakeByteStream handed to the code under test and the test.
struct FakeStreamState
{
    std::mutex mutex;
    std::condition_variable changed;
    std::deque<std::uint8_t> inbound;
    std::vector<std::uint8_t> written;
    bool closed = false;
    bool endOfInput = false;

    void PushBytes(const std::string& bytes)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            inbound.insert(inbound.end(), bytes.begin(), bytes.end());
        }
        changed.notify_all();
    }

    void PushBytes(const std::vector<std::uint8_t>& bytes)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            inbound.insert(inbound.end(), bytes.begin(), bytes.end());
        }
        changed.notify_all();
    }

    void PushServerText(const std::string& text)
    {
        PushBytes(ServerFrame(WebSocketOpcode::Text, text));
    }

    // Reads fail once the queued bytes are consumed.
    void EndInput()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            endOfInput = true;
        }
        changed.notify_all();
    }

    bool IsClosed()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

    std::string HandshakeRequest()
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::string text(written.begin(), written.end());
        size_t end = text.find("\r\n\r\n");
        return end == std::string::npos ? std::string() : text.substr(0, end + 4);
    }

    // Decodes every frame written after the handshake request.
    std::vector<WebSocketFrame> WrittenFrames()
    {
        std::vector<std::uint8_t> bytes;
        {
            std::lock_guard<std::mutex> lock(mutex);
            bytes = written;
        }

        std::vector<WebSocketFrame> frames;
        std::string text(bytes.begin(), bytes.end());
        size_t offset = text.find("\r\n\r\n");
        if (offset == std::string::npos)
        {
            return frames;
        }
        offset += 4;

        while (offset < bytes.size())
        {
            WebSocketFrame frame;
            size_t consumed = 0;
            if (DecodeFrame(bytes.data() + offset, bytes.size() - offset, DefaultMaxFramePayload, frame, consumed)
                != FrameDecodeResult::Complete)
            {
                break;
            }
            frames.push_back(frame);
            offset += consumed;
        }
        return frames;
    }

    std::vector<std::string> WrittenTexts()
    {
        std::vector<std::string> texts;
        for (const WebSocketFrame& frame : WrittenFrames())
        {
            if (frame.opcode == WebSocketOpcode::Text)
            {
                texts.emplace_back(frame.payload.begin(), frame.payload.end());
            }
        }
        return texts;
    }

    bool WaitForWrittenTexts(size_t count, int timeoutMs)
    {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (WrittenTexts().size() >= count)
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return WrittenTexts().size() >= count;
    }
};

class FakeByteStream : public IByteStream
{
public:
    explicit FakeByteStream(std::shared_ptr<FakeStreamState> stateValue)
        : state(std::move(stateValue))
    {
    }

    bool Write(const void* data, size_t size) override
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->closed)
        {
            return false;
        }
        const std::uint8_t* bytes = static_cast<const std::uint8_t*>(data);
        state->written.insert(state->written.end(), bytes, bytes + size);
        return true;
    }

    bool ReadSome(void* buffer, size_t capacity, size_t& bytesRead) override
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->changed.wait(lock, [this]()
        {
            return state->closed || state->endOfInput || !state->inbound.empty();
        });

        if (state->closed || state->inbound.empty())
        {
            return false;
        }

        std::uint8_t* destination = static_cast<std::uint8_t*>(buffer);
        bytesRead = 0;
        while (bytesRead < capacity && !state->inbound.empty())
        {
            destination[bytesRead++] = state->inbound.front();
            state->inbound.pop_front();
        }
        return true;
    }

    void Close() override
    {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->closed = true;
        }
        state->changed.notify_all();
    }

private:
    std::shared_ptr<FakeStreamState> state;
};

struct ConnectAttempt
{
    std::string ip;
    unsigned short port;
    bool secure;
};

// Hands out scripted streams per port; unscripted ports refuse.
class FakeConnector : public IStreamConnector
{
public:
    std::shared_ptr<FakeStreamState> Script(unsigned short port)
    {
        auto state = std::make_shared<FakeStreamState>();
        std::lock_guard<std::mutex> lock(mutex);
        scripts[port].push_back(state);
        return state;
    }

    std::vector<ConnectAttempt> Attempts()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return attempts;
    }

    std::unique_ptr<IByteStream> Open(
        const std::string& ip,
        unsigned short port,
        bool secure,
        int,
        std::string& errorMessage) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        attempts.push_back(ConnectAttempt{ ip, port, secure });

        auto found = scripts.find(port);
        if (found == scripts.end() || found->second.empty())
        {
            errorMessage = "Connection refused";
            return nullptr;
        }

        std::shared_ptr<FakeStreamState> state = found->second.front();
        found->second.pop_front();
        return std::unique_ptr<IByteStream>(new FakeByteStream(state));
    }

private:
    std::mutex mutex;
    std::map<unsigned short, std::deque<std::shared_ptr<FakeStreamState>>> scripts;
    std::vector<ConnectAttempt> attempts;
};

class InMemoryTokenStore : public ITokenStore
{
public:
    bool GetToken(const std::string& ip, std::string& token) const override
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto found = tokens.find(ip);
        if (found == tokens.end())
        {
            return false;
        }
        token = found->second;
        return true;
    }

    void SaveToken(const std::string& ip, const std::string& token) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        tokens[ip] = token;
    }

    void ClearToken(const std::string& ip) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        tokens.erase(ip);
    }

    bool GetLastConnectedIp(std::string& ip) const override
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (lastConnectedIp.empty())
        {
            return false;
        }
        ip = lastConnectedIp;
        return true;
    }

    void SetLastConnectedIp(const std::string& ip) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        lastConnectedIp = ip;
    }

private:
    mutable std::mutex mutex;
    std::map<std::string, std::string> tokens;
    std::string lastConnectedIp;
};

// Serves canned responses by URL; unknown URLs fail at the transport level.
class FakeHttpClient : public IHttpClient
{
public:
    void SetResponse(const std::string& url, unsigned long statusCode, const std::string& body)
    {
        std::lock_guard<std::mutex> lock(mutex);
        responses[url] = HttpResponse{ statusCode, body };
    }

    std::vector<std::string> RequestedUrls()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return requested;
    }

    bool Get(const std::string& url, int, HttpResponse& response) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        requested.push_back(url);
        auto found = responses.find(url);
        if (found == responses.end())
        {
            return false;
        }
        response = found->second;
        return true;
    }

private:
    std::mutex mutex;
    std::map<std::string, HttpResponse> responses;
    std::vector<std::string> requested;
};

// Replies to every M-SEARCH with the scripted SSDP answers.
class FakeDiscoveryNetwork : public IDiscoveryNetwork
{
public:
    struct Reply
    {
        std::string payload;
        std::string sourceIp;
    };

    bool openSucceeds = true;
    std::string localIp;
    std::vector<Reply> repliesPerSearch;
    std::set<std::string> openHosts;

    std::vector<std::string> SentSearches()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return sent;
    }

    std::vector<std::string> ProbedHosts()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return probed;
    }

    bool OpenMulticast() override
    {
        return openSucceeds;
    }

    bool SendSearch(const std::string& message) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            sent.push_back(message);
            for (const Reply& reply : repliesPerSearch)
            {
                pending.push_back(reply);
            }
        }
        changed.notify_all();
        return true;
    }

    ReceiveResult ReceiveResponse(int timeoutMs, std::string& payload, std::string& sourceIp) override
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (!changed.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this]() { return !pending.empty(); }))
        {
            return ReceiveResult::Timeout;
        }
        payload = pending.front().payload;
        sourceIp = pending.front().sourceIp;
        pending.pop_front();
        return ReceiveResult::Packet;
    }

    void CloseMulticast() override
    {
    }

    bool GetLocalIpv4Address(std::string& ip) override
    {
        if (localIp.empty())
        {
            return false;
        }
        ip = localIp;
        return true;
    }

    bool ProbeTcpPort(const std::string& ip, unsigned short, int) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        probed.push_back(ip);
        return openHosts.count(ip) != 0;
    }

private:
    std::mutex mutex;
    std::condition_variable changed;
    std::deque<Reply> pending;
    std::vector<std::string> sent;
    std::vector<std::string> probed;
};

// Handler whose identification and connection results are set by the test.
// Events go through a real EventChannel like the brand handlers.
class FakeTvHandler : public ITvHandler
{
public:
    explicit FakeTvHandler(TvBrand brandValue, const char* nameValue = "Fake")
        : brand(brandValue),
        name(nameValue),
        events(nameValue)
    {
    }

    std::map<std::string, TvDevice> identifiable;
    std::set<std::string> throwOnIdentify;
    bool connectSucceeds = true;
    std::string connectError = "Connection refused";
    std::set<Capability> capabilities;
    std::vector<StandardRemoteKey> keys;
    std::vector<RemoteKeyGroup> groups;
    std::string lastConnectedIp;

    int connectCalls = 0;
    int disconnectCalls = 0;
    std::vector<StandardRemoteKey> sentKeys;
    std::vector<std::string> sentRawKeys;
    std::vector<std::string> launchedApps;
    std::vector<std::string> identifiedIps;

    TvBrand Brand() const override
    {
        return brand;
    }

    const char* DisplayName() const override
    {
        return name;
    }

    bool Identify(const std::string& ip, const std::string&, TvDevice& device) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        identifiedIps.push_back(ip);
        if (throwOnIdentify.count(ip) != 0)
        {
            throw std::runtime_error("identify failed");
        }
        auto found = identifiable.find(ip);
        if (found == identifiable.end())
        {
            return false;
        }
        device = found->second;
        return true;
    }

    bool Connect(const TvDevice& device, std::string& errorMessage) override
    {
        ++connectCalls;
        current = device;
        Publish(ConnectionState::Connecting, std::string());
        if (!connectSucceeds)
        {
            errorMessage = connectError;
            Publish(ConnectionState::Error, connectError);
            return false;
        }
        connected = true;
        Publish(ConnectionState::Connected, std::string());
        return true;
    }

    void Disconnect() override
    {
        ++disconnectCalls;
        connected = false;
        Publish(ConnectionState::Disconnected, std::string());
    }

    bool IsConnected() const override
    {
        return connected;
    }

    // Drop initiated by the TV side.
    void SimulateDrop()
    {
        connected = false;
        Publish(ConnectionState::Disconnected, std::string());
    }

    bool SendKey(StandardRemoteKey key) override
    {
        sentKeys.push_back(key);
        return connected;
    }

    bool SendRawKey(const std::string& keyCode) override
    {
        sentRawKeys.push_back(keyCode);
        return connected;
    }

    bool LaunchApp(const std::string& appId) override
    {
        launchedApps.push_back(appId);
        return connected;
    }

    bool Supports(Capability capability) const override
    {
        return capabilities.count(capability) != 0;
    }

    std::vector<StandardRemoteKey> GetSupportedKeys() const override
    {
        return keys;
    }

    std::vector<RemoteKeyGroup> GetSupportedKeyGroups() const override
    {
        return groups;
    }

    Unsubscribe OnConnectionStateChange(ConnectionListener listener) override
    {
        size_t id = events.Subscribe(std::move(listener));
        return [this, id]()
        {
            events.Unsubscribe(id);
        };
    }

    bool GetLastConnectedIp(std::string& ip) const override
    {
        if (lastConnectedIp.empty())
        {
            return false;
        }
        ip = lastConnectedIp;
        return true;
    }

    bool WaitForEvents(int timeoutMs) override
    {
        return events.WaitUntilIdle(timeoutMs);
    }

private:
    void Publish(ConnectionState state, const std::string& error)
    {
        ConnectionEvent event;
        event.state = state;
        event.hasDevice = true;
        event.device = current;
        event.error = error;
        events.Publish(event);
    }

    TvBrand brand;
    const char* name;
    std::mutex mutex;
    bool connected = false;
    TvDevice current;
    EventChannel<ConnectionEvent> events;
};

// Collects events delivered to a listener.
class EventRecorder
{
public:
    ConnectionListener Listener()
    {
        return [this](const ConnectionEvent& event)
        {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(event);
        };
    }

    std::vector<ConnectionEvent> Events()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }

    size_t Count(ConnectionState state)
    {
        std::lock_guard<std::mutex> lock(mutex);
        size_t count = 0;
        for (const ConnectionEvent& event : events)
        {
            if (event.state == state)
            {
                ++count;
            }
        }
        return count;
    }

    void Clear()
    {
        std::lock_guard<std::mutex> lock(mutex);
        events.clear();
    }

private:
    std::mutex mutex;
    std::vector<ConnectionEvent> events;
};
