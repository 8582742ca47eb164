#include "SamsungSession.h"

#include "JsonHelpers.h"
#include "Logging.h"
#include "StringUtilities.h"

#include <regex>

namespace
{
    constexpr unsigned short SecurePort = 8002;
    constexpr unsigned short PlainPort = 8001;

    const char ChannelPath[] = "/api/v2/channels/samsung.remote.control";
}

SamsungSession::SamsungSession(
    IStreamConnector& connector,
    ITokenStore& tokenStore,
    const AppConfiguration& configuration,
    EventChannel<ConnectionEvent>& events)
    : WebSocketSession("Samsung", connector, tokenStore, configuration, events)
{
}

SamsungSession::~SamsungSession()
{
    Shutdown();
}

bool SamsungSession::SendKeyCode(const std::string& keyCode)
{
    DebugLog(L"[Samsung] SendKeyCode %hs", keyCode.c_str());
    return SendText(BuildKeyCommand(keyCode));
}

bool SamsungSession::LaunchApp(const std::string& appId)
{
    DebugLog(L"[Samsung] LaunchApp %hs", appId.c_str());
    return SendText(BuildLaunchCommand(appId));
}

std::string SamsungSession::BuildKeyCommand(const std::string& keyCode)
{
    std::string message;
    message.reserve(160);
    message += "{";
    message += "\"method\":\"ms.remote.control\",";
    message += "\"params\":{";
    message += "\"Cmd\":\"Click\",";
    message += "\"DataOfCmd\":\"" + EscapeJsonString(keyCode) + "\",";
    message += "\"Option\":\"false\",";
    message += "\"TypeOfRemote\":\"SendRemoteKey\"";
    message += "}";
    message += "}";
    return message;
}

std::string SamsungSession::BuildLaunchCommand(const std::string& appId)
{
    std::string message;
    message.reserve(192);
    message += "{";
    message += "\"method\":\"ms.channel.emit\",";
    message += "\"params\":{";
    message += "\"event\":\"ed.apps.launch\",";
    message += "\"to\":\"host\",";
    message += "\"data\":{";
    message += "\"action_type\":\"DEEP_LINK\",";
    message += "\"appId\":\"" + EscapeJsonString(appId) + "\",";
    message += "\"metaTag\":\"\"";
    message += "}";
    message += "}";
    message += "}";
    return message;
}

std::string SamsungSession::BuildChannelPath(const std::string& appName, const std::string& token)
{
    std::string path = ChannelPath;
    path += "?name=" + Base64Encode(appName);
    if (!token.empty())
    {
        path += "&token=" + token;
    }
    return path;
}

std::vector<SessionEndpoint> SamsungSession::GetEndpoints() const
{
    SessionEndpoint secure{ SecurePort, true };
    SessionEndpoint plain{ PlainPort, false };
    if (configuration.preferSecureWebSocket)
    {
        return { secure, plain };
    }
    return { plain, secure };
}

std::string SamsungSession::BuildHandshakePath(const std::string& token) const
{
    return BuildChannelPath(configuration.appName, token);
}

PairingOutcome SamsungSession::ClassifyPairingMessage(const std::string& message, std::string& token)
{
    if (message.find("ms.channel.connect") != std::string::npos
        || message.find("ms.channel.ready") != std::string::npos)
    {
        static const std::regex tokenPattern("\"token\"\\s*:\\s*\"([^\"]+)\"");
        std::smatch match;
        if (std::regex_search(message, match, tokenPattern))
        {
            token = match[1].str();
        }
        return PairingOutcome::Ready;
    }

    if (message.find("ms.channel.unauthorized") != std::string::npos)
    {
        return PairingOutcome::Unauthorized;
    }

    return PairingOutcome::Inconclusive;
}

std::string SamsungSession::UnauthorizedMessage() const
{
    return "TV denied the connection. Please try again and check the TV screen for an Allow/Deny prompt. "
        "If no prompt appears, go to TV Settings > General > External Device Manager and remove blocked devices.";
}

void SamsungSession::OnMessage(const std::string& message)
{
    std::string event;
    if (GetStringMember(message, "event", event))
    {
        DebugLog(L"[Samsung] Event %hs", event.c_str());
    }
}
