#include "LgWebOsHandler.h"

#include "Logging.h"
#include "StringUtilities.h"

#include <utility>

namespace
{
    constexpr unsigned short ControlPort = 3001;
    const char Manufacturer[] = "LG Electronics";
}

LgWebOsHandler::LgWebOsHandler(
    IHttpClient& httpClientValue,
    IStreamConnector& connector,
    ITokenStore& tokenStoreValue,
    const AppConfiguration& configurationValue)
    : httpClient(httpClientValue),
    tokenStore(tokenStoreValue),
    configuration(configurationValue),
    events("WebOS"),
    session(connector, tokenStoreValue, configurationValue, events)
{
}

TvBrand LgWebOsHandler::Brand() const
{
    return TvBrand::LgWebOs;
}

const char* LgWebOsHandler::DisplayName() const
{
    return "LG (webOS)";
}

bool LgWebOsHandler::Identify(const std::string& ip, const std::string& ssdpHint, TvDevice& device)
{
    if (ssdpHint.empty())
    {
        return false;
    }

    std::string location = GetHttpHeaderValue(ssdpHint, "LOCATION");
    if (location.empty())
    {
        return false;
    }

    HttpResponse response;
    if (!httpClient.Get(location, configuration.identifyTimeoutMs, response))
    {
        return false;
    }
    if (response.statusCode < 200 || response.statusCode >= 300)
    {
        DebugLog(L"[WebOS] Identify %hs: HTTP %lu", ip.c_str(), response.statusCode);
        return false;
    }

    if (ExtractXmlElement(response.body, "manufacturer").find(Manufacturer) == std::string::npos)
    {
        DebugLog(L"[WebOS] Identify %hs: not an LG device", ip.c_str());
        return false;
    }

    TvDevice found;
    found.id = ExtractXmlElement(response.body, "UDN");
    if (found.id.empty())
    {
        found.id = "lg-" + ip;
    }
    found.ip = ip;
    found.port = ControlPort;
    found.name = ExtractXmlElement(response.body, "friendlyName");
    if (found.name.empty())
    {
        found.name = "LG TV";
    }
    found.brand = TvBrand::LgWebOs;
    found.model = ExtractXmlElement(response.body, "modelName");
    found.os = "webOS";
    found.ssdpResponse = ssdpHint;

    std::string modelNumber = ExtractXmlElement(response.body, "modelNumber");
    if (!modelNumber.empty())
    {
        found.metadata["modelNumber"] = modelNumber;
    }
    found.metadata["descriptionUrl"] = location;

    InfoLog(L"[WebOS] Identified %hs at %hs", found.name.c_str(), ip.c_str());
    device = found;
    return true;
}

bool LgWebOsHandler::Connect(const TvDevice& device, std::string& errorMessage)
{
    if (device.brand != TvBrand::LgWebOs)
    {
        errorMessage = "Device is not an LG TV";
        return false;
    }
    return session.Connect(device, errorMessage);
}

void LgWebOsHandler::Disconnect()
{
    session.Disconnect();
}

bool LgWebOsHandler::IsConnected() const
{
    return session.IsConnected();
}

bool LgWebOsHandler::SendKey(StandardRemoteKey key)
{
    if (key == StandardRemoteKey::Mute)
    {
        return session.ToggleMute();
    }

    const char* uri = GetKeyUri(key);
    if (!uri)
    {
        return false;
    }
    return session.SendRequest(uri, nullptr);
}

bool LgWebOsHandler::SendRawKey(const std::string&)
{
    return false;
}

bool LgWebOsHandler::LaunchApp(const std::string& appId)
{
    if (appId.empty())
    {
        return false;
    }
    return session.LaunchApp(appId);
}

bool LgWebOsHandler::Supports(Capability capability) const
{
    return capability == Capability::AppLaunch;
}

std::vector<StandardRemoteKey> LgWebOsHandler::GetSupportedKeys() const
{
    return {
        StandardRemoteKey::Power,
        StandardRemoteKey::VolumeUp,
        StandardRemoteKey::VolumeDown,
        StandardRemoteKey::Mute,
        StandardRemoteKey::ChannelUp,
        StandardRemoteKey::ChannelDown,
        StandardRemoteKey::Play,
        StandardRemoteKey::Pause,
        StandardRemoteKey::Stop,
        StandardRemoteKey::Rewind,
        StandardRemoteKey::FastForward,
    };
}

std::vector<RemoteKeyGroup> LgWebOsHandler::GetSupportedKeyGroups() const
{
    return {
        RemoteKeyGroup::Power,
        RemoteKeyGroup::Volume,
        RemoteKeyGroup::Channels,
        RemoteKeyGroup::Media,
    };
}

Unsubscribe LgWebOsHandler::OnConnectionStateChange(ConnectionListener listener)
{
    size_t id = events.Subscribe(std::move(listener));
    return [this, id]()
    {
        events.Unsubscribe(id);
    };
}

bool LgWebOsHandler::GetLastConnectedIp(std::string& ip) const
{
    return tokenStore.GetLastConnectedIp(ip);
}

bool LgWebOsHandler::WaitForEvents(int timeoutMs)
{
    return events.WaitUntilIdle(timeoutMs);
}

const char* LgWebOsHandler::GetKeyUri(StandardRemoteKey key)
{
    switch (key)
    {
    case StandardRemoteKey::Power: return "ssap://system/turnOff";
    case StandardRemoteKey::VolumeUp: return "ssap://audio/volumeUp";
    case StandardRemoteKey::VolumeDown: return "ssap://audio/volumeDown";
    case StandardRemoteKey::ChannelUp: return "ssap://tv/channelUp";
    case StandardRemoteKey::ChannelDown: return "ssap://tv/channelDown";
    case StandardRemoteKey::Play: return "ssap://media.controls/play";
    case StandardRemoteKey::Pause: return "ssap://media.controls/pause";
    case StandardRemoteKey::Stop: return "ssap://media.controls/stop";
    case StandardRemoteKey::Rewind: return "ssap://media.controls/rewind";
    case StandardRemoteKey::FastForward: return "ssap://media.controls/fastForward";
    default: return nullptr;
    }
}
