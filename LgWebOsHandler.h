#pragma once

#include "HttpClient.h"
#include "TvHandler.h"
#include "WebOsSession.h"

// LG webOS TVs over SSAP. Identification needs the SSDP reply because the
// device description URL is only advertised there.
class LgWebOsHandler : public ITvHandler
{
public:
    LgWebOsHandler(
        IHttpClient& httpClient,
        IStreamConnector& connector,
        ITokenStore& tokenStore,
        const AppConfiguration& configuration);

    TvBrand Brand() const override;
    const char* DisplayName() const override;

    bool Identify(const std::string& ip, const std::string& ssdpHint, TvDevice& device) override;

    bool Connect(const TvDevice& device, std::string& errorMessage) override;
    void Disconnect() override;
    bool IsConnected() const override;

    bool SendKey(StandardRemoteKey key) override;
    bool SendRawKey(const std::string& keyCode) override;
    bool LaunchApp(const std::string& appId) override;

    bool Supports(Capability capability) const override;
    std::vector<StandardRemoteKey> GetSupportedKeys() const override;
    std::vector<RemoteKeyGroup> GetSupportedKeyGroups() const override;

    Unsubscribe OnConnectionStateChange(ConnectionListener listener) override;
    bool GetLastConnectedIp(std::string& ip) const override;

    bool WaitForEvents(int timeoutMs) override;

    // SSAP URI for a key, or nullptr. Mute has no URI; it toggles instead.
    static const char* GetKeyUri(StandardRemoteKey key);

private:
    IHttpClient& httpClient;
    ITokenStore& tokenStore;
    const AppConfiguration& configuration;
    EventChannel<ConnectionEvent> events;
    WebOsSession session;
};
