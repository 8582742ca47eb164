#include "SamsungTizenHandler.h"

#include "JsonHelpers.h"
#include "Logging.h"
#include "SamsungKeys.h"
#include "StringUtilities.h"

#include <utility>

namespace
{
    constexpr unsigned short InfoPort = 8001;
    constexpr unsigned short ControlPort = 8002;

    std::string FirstNonEmpty(const std::string& first, const std::string& second)
    {
        return first.empty() ? second : first;
    }

    void SetMetadata(TvDevice& device, const char* key, const std::string& value)
    {
        if (!value.empty())
        {
            device.metadata[key] = value;
        }
    }
}

SamsungTizenHandler::SamsungTizenHandler(
    IHttpClient& httpClientValue,
    IStreamConnector& connector,
    ITokenStore& tokenStoreValue,
    const AppConfiguration& configurationValue)
    : httpClient(httpClientValue),
    tokenStore(tokenStoreValue),
    configuration(configurationValue),
    events("Samsung"),
    session(connector, tokenStoreValue, configurationValue, events)
{
}

TvBrand SamsungTizenHandler::Brand() const
{
    return TvBrand::SamsungTizen;
}

const char* SamsungTizenHandler::DisplayName() const
{
    return "Samsung (Tizen)";
}

bool SamsungTizenHandler::Identify(const std::string& ip, const std::string&, TvDevice& device)
{
    std::string url = "http://" + ip + ":" + std::to_string(InfoPort) + "/api/v2/";

    HttpResponse response;
    if (!httpClient.Get(url, configuration.identifyTimeoutMs, response))
    {
        return false;
    }
    if (response.statusCode < 200 || response.statusCode >= 300)
    {
        DebugLog(L"[Samsung] Identify %hs: HTTP %lu", ip.c_str(), response.statusCode);
        return false;
    }

    std::string info;
    GetObjectMember(response.body, "device", info);

    std::string deviceType = GetMemberText(info, "type");
    std::string deviceName = GetMemberText(info, "name");
    std::string topLevelType = GetMemberText(response.body, "type");

    bool isSamsung = deviceType == "Samsung SmartTV"
        || ContainsIgnoreCase(deviceName, "samsung")
        || ContainsIgnoreCase(topLevelType, "samsung");
    if (!isSamsung)
    {
        DebugLog(L"[Samsung] Identify %hs: not a Samsung TV", ip.c_str());
        return false;
    }

    TvDevice found;
    found.id = FirstNonEmpty(
        FirstNonEmpty(GetMemberText(info, "id"), GetMemberText(info, "duid")),
        "samsung-" + ip);
    found.ip = ip;
    found.port = ControlPort;
    found.name = FirstNonEmpty(deviceName, "Samsung TV");
    found.brand = TvBrand::SamsungTizen;
    found.model = FirstNonEmpty(GetMemberText(info, "modelName"), GetMemberText(info, "model"));
    found.os = FirstNonEmpty(GetMemberText(info, "OS"), "Tizen");
    found.resolution = GetMemberText(info, "resolution");
    found.mac = GetMemberText(info, "wifiMac");

    SetMetadata(found, "firmwareVersion", GetMemberText(info, "firmwareVersion"));
    SetMetadata(found, "tokenAuthSupport", GetMemberText(info, "TokenAuthSupport"));
    SetMetadata(found, "networkType", GetMemberText(info, "networkType"));
    SetMetadata(found, "frameTVSupport", GetMemberText(info, "FrameTVSupport"));
    SetMetadata(found, "gamePadSupport", GetMemberText(info, "GamePadSupport"));
    SetMetadata(found, "apiVersion", GetMemberText(response.body, "version"));

    InfoLog(L"[Samsung] Identified %hs at %hs", found.name.c_str(), ip.c_str());
    device = found;
    return true;
}

bool SamsungTizenHandler::Connect(const TvDevice& device, std::string& errorMessage)
{
    if (device.brand != TvBrand::SamsungTizen)
    {
        errorMessage = "Device is not a Samsung TV";
        return false;
    }
    return session.Connect(device, errorMessage);
}

void SamsungTizenHandler::Disconnect()
{
    session.Disconnect();
}

bool SamsungTizenHandler::IsConnected() const
{
    return session.IsConnected();
}

bool SamsungTizenHandler::SendKey(StandardRemoteKey key)
{
    const char* keyCode = GetSamsungKeyCode(key);
    if (!keyCode)
    {
        return false;
    }
    return session.SendKeyCode(keyCode);
}

bool SamsungTizenHandler::SendRawKey(const std::string& keyCode)
{
    if (keyCode.empty())
    {
        return false;
    }
    return session.SendKeyCode(keyCode);
}

bool SamsungTizenHandler::LaunchApp(const std::string& appId)
{
    if (appId.empty())
    {
        return false;
    }
    return session.LaunchApp(appId);
}

bool SamsungTizenHandler::Supports(Capability capability) const
{
    return capability == Capability::RawKey || capability == Capability::AppLaunch;
}

std::vector<StandardRemoteKey> SamsungTizenHandler::GetSupportedKeys() const
{
    return AllRemoteKeys();
}

std::vector<RemoteKeyGroup> SamsungTizenHandler::GetSupportedKeyGroups() const
{
    return AllRemoteKeyGroups();
}

Unsubscribe SamsungTizenHandler::OnConnectionStateChange(ConnectionListener listener)
{
    size_t id = events.Subscribe(std::move(listener));
    return [this, id]()
    {
        events.Unsubscribe(id);
    };
}

bool SamsungTizenHandler::GetLastConnectedIp(std::string& ip) const
{
    return tokenStore.GetLastConnectedIp(ip);
}

bool SamsungTizenHandler::WaitForEvents(int timeoutMs)
{
    return events.WaitUntilIdle(timeoutMs);
}
