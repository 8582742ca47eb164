#pragma once

#include "WebSocketSession.h"

// Samsung Tizen remote-control channel on ports 8002 (wss) and 8001 (ws).
class SamsungSession : public WebSocketSession
{
public:
    SamsungSession(
        IStreamConnector& connector,
        ITokenStore& tokenStore,
        const AppConfiguration& configuration,
        EventChannel<ConnectionEvent>& events);
    ~SamsungSession() override;

    // Sends a Click for a native key code such as KEY_VOLUP.
    bool SendKeyCode(const std::string& keyCode);

    bool LaunchApp(const std::string& appId);

    static std::string BuildKeyCommand(const std::string& keyCode);
    static std::string BuildLaunchCommand(const std::string& appId);
    static std::string BuildChannelPath(const std::string& appName, const std::string& token);

protected:
    std::vector<SessionEndpoint> GetEndpoints() const override;
    std::string BuildHandshakePath(const std::string& token) const override;
    PairingOutcome ClassifyPairingMessage(const std::string& message, std::string& token) override;
    std::string UnauthorizedMessage() const override;
    void OnMessage(const std::string& message) override;
};
