#pragma once

#include "HttpClient.h"
#include "SamsungSession.h"
#include "TvHandler.h"

// Samsung Tizen TVs (2016 and later) over the ms.remote.control channel.
class SamsungTizenHandler : public ITvHandler
{
public:
    SamsungTizenHandler(
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

private:
    IHttpClient& httpClient;
    ITokenStore& tokenStore;
    const AppConfiguration& configuration;
    EventChannel<ConnectionEvent> events;
    SamsungSession session;
};
