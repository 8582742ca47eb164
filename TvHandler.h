#pragma once

#include "TvTypes.h"

#include <string>
#include <vector>

// Brand-specific identification and control behind one interface.
class ITvHandler
{
public:
    virtual ~ITvHandler() = default;

    virtual TvBrand Brand() const = 0;
    virtual const char* DisplayName() const = 0;

    // Read-only probe of ip. ssdpHint is the raw SSDP reply for ip, or empty.
    // Any failure means "not this brand".
    virtual bool Identify(const std::string& ip, const std::string& ssdpHint, TvDevice& device) = 0;

    virtual bool Connect(const TvDevice& device, std::string& errorMessage) = 0;
    virtual void Disconnect() = 0;
    virtual bool IsConnected() const = 0;

    virtual bool SendKey(StandardRemoteKey key) = 0;

    // Only meaningful when Supports(Capability::RawKey).
    virtual bool SendRawKey(const std::string& keyCode) = 0;

    // Only meaningful when Supports(Capability::AppLaunch).
    virtual bool LaunchApp(const std::string& appId) = 0;

    virtual bool Supports(Capability capability) const = 0;
    virtual std::vector<StandardRemoteKey> GetSupportedKeys() const = 0;
    virtual std::vector<RemoteKeyGroup> GetSupportedKeyGroups() const = 0;

    // The returned function removes exactly this listener. It must not be
    // called after the handler is destroyed.
    virtual Unsubscribe OnConnectionStateChange(ConnectionListener listener) = 0;

    virtual bool GetLastConnectedIp(std::string& ip) const = 0;

    // Waits until every connection event published so far reached listeners.
    // False on timeout, or at once when called from inside a listener.
    virtual bool WaitForEvents(int timeoutMs) = 0;
};
