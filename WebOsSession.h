#pragma once

#include "WebSocketSession.h"

#include <atomic>

// LG webOS SSAP session on ports 3001 (wss) and 3000 (ws). Pairing uses a
// register message whose client-key is kept as the session token.
class WebOsSession : public WebSocketSession
{
public:
    WebOsSession(
        IStreamConnector& connector,
        ITokenStore& tokenStore,
        const AppConfiguration& configuration,
        EventChannel<ConnectionEvent>& events);
    ~WebOsSession() override;

    // Sends an SSAP request; payloadJson may be null.
    bool SendRequest(const char* uri, const char* payloadJson);

    // Flips the mute state last reported by the TV, muting when unknown.
    bool ToggleMute();

    bool LaunchApp(const std::string& appId);

    std::string BuildRegisterMessage(const std::string& clientKey) const;
    std::string BuildRequestMessage(const char* uri, const char* payloadOrNull);

    static std::string ParseClientKey(const std::string& json);
    static bool ParseMuteFlag(const std::string& json, bool& muted);

protected:
    std::vector<SessionEndpoint> GetEndpoints() const override;
    std::string BuildHandshakePath(const std::string& token) const override;
    bool OnUpgraded(IByteStream& stream, const std::string& token) override;
    PairingOutcome ClassifyPairingMessage(const std::string& message, std::string& token) override;
    std::string UnauthorizedMessage() const override;
    void OnConnected() override;
    void OnMessage(const std::string& message) override;

private:
    std::atomic<unsigned int> nextRequestId;
    std::atomic<bool> muteKnown;
    std::atomic<bool> muted;
};
