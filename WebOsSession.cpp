#include "WebOsSession.h"

#include "JsonHelpers.h"
#include "Logging.h"

namespace
{
    constexpr unsigned short SecurePort = 3001;
    constexpr unsigned short PlainPort = 3000;

    // Reads the boolean after "key": anywhere in the message.
    bool FindBooleanAfterKey(const std::string& json, const char* quotedKey, bool& value)
    {
        size_t position = json.find(quotedKey);
        if (position == std::string::npos)
        {
            return false;
        }

        position = json.find(':', position);
        if (position == std::string::npos)
        {
            return false;
        }

        position = json.find_first_not_of(" \t\r\n", position + 1);
        if (position == std::string::npos)
        {
            return false;
        }

        if (json.compare(position, 4, "true") == 0)
        {
            value = true;
            return true;
        }
        if (json.compare(position, 5, "false") == 0)
        {
            value = false;
            return true;
        }
        return false;
    }
}

WebOsSession::WebOsSession(
    IStreamConnector& connector,
    ITokenStore& tokenStore,
    const AppConfiguration& configuration,
    EventChannel<ConnectionEvent>& events)
    : WebSocketSession("WebOS", connector, tokenStore, configuration, events),
    nextRequestId(1),
    muteKnown(false),
    muted(false)
{
}

WebOsSession::~WebOsSession()
{
    Shutdown();
}

bool WebOsSession::SendRequest(const char* uri, const char* payloadJson)
{
    DebugLog(L"[WebOS] Request %hs", uri);
    return SendText(BuildRequestMessage(uri, payloadJson));
}

bool WebOsSession::ToggleMute()
{
    bool newMuted = muteKnown ? !muted.load() : true;
    if (!muteKnown)
    {
        DebugLog(L"[WebOS] ToggleMute: mute state unknown, forcing mute=true");
    }

    std::string payload = std::string("{\"mute\":") + (newMuted ? "true" : "false") + "}";
    if (!SendRequest("ssap://audio/setMute", payload.c_str()))
    {
        return false;
    }

    muted = newMuted;
    muteKnown = true;
    return true;
}

bool WebOsSession::LaunchApp(const std::string& appId)
{
    std::string payload = "{\"id\":\"" + EscapeJsonString(appId) + "\"}";
    return SendRequest("ssap://system.launcher/launch", payload.c_str());
}

std::string WebOsSession::BuildRegisterMessage(const std::string& clientKey) const
{
    std::string appName = EscapeJsonString(configuration.appName);

    std::string message;
    message.reserve(640);

    message += "{";
    message += "\"type\":\"register\",";
    message += "\"id\":\"register_0\",";
    message += "\"payload\":{";
    message += "\"forcePairing\":false,";
    message += "\"pairingType\":\"PROMPT\",";
    if (!clientKey.empty())
    {
        message += "\"client-key\":\"";
        message += EscapeJsonString(clientKey);
        message += "\",";
    }
    message += "\"manifest\":{";
    message += "\"manifestVersion\":1,";
    message += "\"appVersion\":\"1.0\",";
    message += "\"appId\":\"com.smarttvremote\",";
    message += "\"vendorId\":\"com.smarttvremote\",";
    message += "\"localizedAppNames\":{\"\":\"" + appName + "\"},";
    message += "\"localizedVendorNames\":{\"\":\"" + appName + "\"},";
    message += "\"permissions\":[";
    message += "\"CONTROL_AUDIO\",";
    message += "\"CONTROL_POWER\",";
    message += "\"CONTROL_INPUT_TV\",";
    message += "\"CONTROL_INPUT_MEDIA_PLAYBACK\",";
    message += "\"LAUNCH\",";
    message += "\"READ_INSTALLED_APPS\"";
    message += "]";
    message += "}";
    message += "}";
    message += "}";
    return message;
}

std::string WebOsSession::BuildRequestMessage(const char* uri, const char* payloadOrNull)
{
    std::string message;
    message.reserve(256);

    message += "{";
    message += "\"type\":\"request\",";
    message += "\"id\":\"req_" + std::to_string(nextRequestId++) + "\",";
    message += "\"uri\":\"";
    message += uri;
    message += "\"";
    if (payloadOrNull)
    {
        message += ",\"payload\":";
        message += payloadOrNull;
    }
    message += "}";
    return message;
}

std::string WebOsSession::ParseClientKey(const std::string& json)
{
    return FindStringFieldAnywhere(json, "client-key");
}

bool WebOsSession::ParseMuteFlag(const std::string& json, bool& mutedValue)
{
    return FindBooleanAfterKey(json, "\"muted\"", mutedValue)
        || FindBooleanAfterKey(json, "\"mute\"", mutedValue);
}

std::vector<SessionEndpoint> WebOsSession::GetEndpoints() const
{
    SessionEndpoint secure{ SecurePort, true };
    SessionEndpoint plain{ PlainPort, false };
    if (configuration.preferSecureWebSocket)
    {
        return { secure, plain };
    }
    return { plain, secure };
}

std::string WebOsSession::BuildHandshakePath(const std::string&) const
{
    return "/";
}

bool WebOsSession::OnUpgraded(IByteStream& stream, const std::string& token)
{
    DebugLog(L"[WebOS] Sending register (%hs)", token.empty() ? "PROMPT" : "stored client-key");
    return WriteText(stream, BuildRegisterMessage(token));
}

PairingOutcome WebOsSession::ClassifyPairingMessage(const std::string& message, std::string& token)
{
    std::string type;
    GetStringMember(message, "type", type);

    if (type == "registered")
    {
        token = ParseClientKey(message);
        return PairingOutcome::Ready;
    }

    if (type == "error")
    {
        return PairingOutcome::Unauthorized;
    }

    if (type == "response")
    {
        DebugLog(L"[WebOS] Pairing prompt shown on the TV");
    }
    return PairingOutcome::Inconclusive;
}

std::string WebOsSession::UnauthorizedMessage() const
{
    return "TV rejected the pairing request. Accept the prompt on the TV and try again.";
}

void WebOsSession::OnConnected()
{
    muteKnown = false;
    if (!SendRequest("ssap://audio/getStatus", nullptr))
    {
        WarningLog(L"[WebOS] getStatus request failed");
    }
}

void WebOsSession::OnMessage(const std::string& message)
{
    bool reportedMute = false;
    if (ParseMuteFlag(message, reportedMute))
    {
        muted = reportedMute;
        muteKnown = true;
        DebugLog(L"[WebOS] Mute is %hs", reportedMute ? "on" : "off");
    }

    std::string type;
    if (GetStringMember(message, "type", type) && type == "error")
    {
        std::string error;
        GetStringMember(message, "error", error);
        WarningLog(L"[WebOS] Request failed: %hs", error.c_str());
    }
}
