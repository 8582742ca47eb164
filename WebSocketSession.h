#pragma once

#include "Configuration.h"
#include "EventChannel.h"
#include "NetworkStream.h"
#include "OneShotTimer.h"
#include "TokenStore.h"
#include "TvTypes.h"
#include "WebSocketFrame.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// One port to try during connect.
struct SessionEndpoint
{
    unsigned short port;
    bool secure;
};

// How a brand classifies a message received while waiting for pairing.
enum class PairingOutcome
{
    Ready,
    Unauthorized,
    Inconclusive,
};

// Messages read after the upgrade before the attempt is declared unconfirmed.
constexpr int MaxPairingMessages = 5;

// Brand-agnostic WebSocket control session: handshake, pairing, background
// reader and serialized writes. Connection events go to the supplied channel.
class WebSocketSession
{
public:
    WebSocketSession(
        const char* logTag,
        IStreamConnector& connector,
        ITokenStore& tokenStore,
        const AppConfiguration& configuration,
        EventChannel<ConnectionEvent>& events);
    virtual ~WebSocketSession();

    WebSocketSession(const WebSocketSession&) = delete;
    WebSocketSession& operator=(const WebSocketSession&) = delete;

    // Blocks until the TV accepts, rejects, fails or the watchdog fires.
    bool Connect(const TvDevice& device, std::string& errorMessage);

    // Closes the connection and always publishes Disconnected.
    void Disconnect();

    bool IsConnected() const;
    ConnectionState GetState() const;

    // Sends one masked text frame; false when not connected or on I/O failure.
    bool SendText(const std::string& text);

    static std::string BuildUpgradeRequest(
        const std::string& host,
        unsigned short port,
        const std::string& path,
        const std::string& webSocketKey);

    // Base64 of 16 random bytes.
    static std::string GenerateWebSocketKey();

    // True for an HTTP status line whose status code is exactly 101.
    static bool IsSwitchingProtocolsStatus(const std::string& statusLine);

protected:
    virtual std::vector<SessionEndpoint> GetEndpoints() const = 0;
    virtual std::string BuildHandshakePath(const std::string& token) const = 0;

    // Runs right after the 101 response, before pairing messages are read.
    virtual bool OnUpgraded(IByteStream& stream, const std::string& token);

    // Sets token when the message carries one.
    virtual PairingOutcome ClassifyPairingMessage(const std::string& message, std::string& token) = 0;

    virtual std::string UnauthorizedMessage() const = 0;

    // Called on the connecting thread after Connected is published.
    virtual void OnConnected();

    // Called on the reader thread for every text message after pairing.
    virtual void OnMessage(const std::string& message);

    // Writes a text frame to a stream that is not yet the active one.
    bool WriteText(IByteStream& stream, const std::string& text);

    // Must be called from derived destructors so the reader never reaches a
    // destroyed override.
    void Shutdown();

    const AppConfiguration& configuration;
    const char* logTag;

private:
    enum class EndpointResult
    {
        Connected,
        Failed,
        Terminal,
    };

    EndpointResult TryEndpoint(
        const TvDevice& device,
        const SessionEndpoint& endpoint,
        const std::string& path,
        const std::string& storedToken,
        int timeoutMs,
        std::shared_ptr<IByteStream>& connected,
        std::string& receivedToken,
        std::string& errorMessage);

    bool PerformUpgrade(
        IByteStream& stream,
        const std::string& host,
        unsigned short port,
        const std::string& path,
        std::string& errorMessage);

    // Returns the next text or binary payload, answering pings along the way.
    bool ReadMessage(IByteStream& stream, std::string& message);

    bool WriteBytes(IByteStream& stream, const std::vector<std::uint8_t>& bytes);

    void ReaderLoop(std::shared_ptr<IByteStream> stream, std::uint64_t generation);
    void HandleDrop(std::uint64_t generation);

    // Closes any live or pending stream and joins the reader.
    void TearDown(bool publish);

    void SetPendingStream(const std::shared_ptr<IByteStream>& stream);
    void ClosePendingStream();
    bool ClaimTerminal();
    void FailAttempt(const TvDevice& device, const std::string& errorMessage);
    void Publish(ConnectionState state, const TvDevice* device, const std::string& error);

    IStreamConnector& connector;
    ITokenStore& tokenStore;
    EventChannel<ConnectionEvent>& events;

    std::atomic<bool> connecting;
    std::atomic<bool> terminalClaimed;
    std::atomic<bool> timedOut;
    std::atomic<bool> cancelled;
    OneShotTimer watchdog;

    mutable std::mutex stateMutex;
    ConnectionState state;
    TvDevice device;
    std::shared_ptr<IByteStream> activeStream;
    std::shared_ptr<IByteStream> pendingStream;
    std::thread reader;
    std::uint64_t generation;

    std::mutex writeMutex;
};
