#include "WebSocketSession.h"

#include "Logging.h"
#include "StringUtilities.h"

#include <chrono>
#include <exception>
#include <random>
#include <utility>

namespace
{
    const char TimedOutMessage[] = "Connection timed out. TV did not respond.";
    const char CancelledMessage[] = "Connection cancelled";
    const char UnconfirmedMessage[] = "TV did not confirm the pairing";
    constexpr size_t MaxUpgradeResponseSize = 8 * 1024;

    int MillisecondsUntil(std::chrono::steady_clock::time_point deadline)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        return remaining > 0 ? static_cast<int>(remaining) : 0;
    }
}

WebSocketSession::WebSocketSession(
    const char* logTagValue,
    IStreamConnector& connectorValue,
    ITokenStore& tokenStoreValue,
    const AppConfiguration& configurationValue,
    EventChannel<ConnectionEvent>& eventsValue)
    : configuration(configurationValue),
    logTag(logTagValue),
    connector(connectorValue),
    tokenStore(tokenStoreValue),
    events(eventsValue),
    connecting(false),
    terminalClaimed(false),
    timedOut(false),
    cancelled(false),
    state(ConnectionState::Disconnected),
    generation(0)
{
}

WebSocketSession::~WebSocketSession()
{
    Shutdown();
}

bool WebSocketSession::Connect(const TvDevice& target, std::string& errorMessage)
{
    if (connecting.exchange(true))
    {
        errorMessage = "Already connecting";
        WarningLog(L"[%hs] Connect %hs: another attempt is in progress", logTag, target.ip.c_str());
        return false;
    }

    struct ConnectingGuard
    {
        std::atomic<bool>& flag;
        ~ConnectingGuard()
        {
            flag = false;
        }
    } connectingGuard{ connecting };

    TearDown(IsConnected());

    terminalClaimed = false;
    timedOut = false;
    cancelled = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        state = ConnectionState::Connecting;
        device = target;
    }
    Publish(ConnectionState::Connecting, &target, std::string());

    std::string storedToken;
    bool hasToken = tokenStore.GetToken(target.ip, storedToken);
    if (!hasToken)
    {
        storedToken.clear();
    }
    std::string path = BuildHandshakePath(storedToken);
    InfoLog(
        L"[%hs] Connecting to %hs (%hs)",
        logTag,
        target.ip.c_str(),
        hasToken ? "stored token" : "fresh pairing");

    auto deadline = std::chrono::steady_clock::now()
        + std::chrono::milliseconds(configuration.connectTimeoutMs);
    watchdog.Start(configuration.connectTimeoutMs, [this]()
    {
        if (!ClaimTerminal())
        {
            return;
        }
        timedOut = true;
        WarningLog(L"[%hs] Connect watchdog fired", logTag);
        ClosePendingStream();
    });

    std::string lastError = "Connection failed";
    std::shared_ptr<IByteStream> stream;
    std::string receivedToken;
    EndpointResult result = EndpointResult::Failed;

    for (const SessionEndpoint& endpoint : GetEndpoints())
    {
        if (timedOut || cancelled)
        {
            break;
        }

        int remaining = MillisecondsUntil(deadline);
        if (remaining <= 0)
        {
            break;
        }

        std::string endpointError;
        result = TryEndpoint(target, endpoint, path, storedToken, remaining, stream, receivedToken, endpointError);
        if (result == EndpointResult::Connected)
        {
            break;
        }

        lastError = endpointError;
        if (result == EndpointResult::Terminal)
        {
            break;
        }

        WarningLog(
            L"[%hs] %hs://%hs:%u failed: %hs",
            logTag,
            endpoint.secure ? "wss" : "ws",
            target.ip.c_str(),
            endpoint.port,
            endpointError.c_str());
    }

    if (result == EndpointResult::Connected && !cancelled && ClaimTerminal())
    {
        watchdog.Cancel();

        if (!receivedToken.empty() && receivedToken != storedToken)
        {
            tokenStore.SaveToken(target.ip, receivedToken);
        }
        tokenStore.SetLastConnectedIp(target.ip);

        bool activated = false;
        {
            // Disconnect() writes cancelled under this lock.
            std::lock_guard<std::mutex> lock(stateMutex);
            if (!cancelled)
            {
                pendingStream.reset();
                activeStream = stream;
                state = ConnectionState::Connected;
                std::uint64_t current = ++generation;
                reader = std::thread(&WebSocketSession::ReaderLoop, this, stream, current);
                Publish(ConnectionState::Connected, &target, std::string());
                activated = true;
            }
        }

        if (activated)
        {
            InfoLog(L"[%hs] Connected to %hs", logTag, target.ip.c_str());
            OnConnected();
            return true;
        }

        stream->Close();
        ClosePendingStream();
        errorMessage = CancelledMessage;
        FailAttempt(target, errorMessage);
        return false;
    }

    bool claimedHere = ClaimTerminal();
    watchdog.Cancel();

    if (stream)
    {
        stream->Close();
    }
    ClosePendingStream();

    if (!claimedHere)
    {
        errorMessage = TimedOutMessage;
    }
    else if (cancelled)
    {
        errorMessage = CancelledMessage;
    }
    else
    {
        errorMessage = lastError;
    }

    FailAttempt(target, errorMessage);
    return false;
}

void WebSocketSession::Disconnect()
{
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        cancelled = true;
    }
    TearDown(true);
}

bool WebSocketSession::IsConnected() const
{
    std::lock_guard<std::mutex> lock(stateMutex);
    return state == ConnectionState::Connected;
}

ConnectionState WebSocketSession::GetState() const
{
    std::lock_guard<std::mutex> lock(stateMutex);
    return state;
}

bool WebSocketSession::SendText(const std::string& text)
{
    std::shared_ptr<IByteStream> stream;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (state != ConnectionState::Connected || !activeStream)
        {
            return false;
        }
        stream = activeStream;
    }

    if (!WriteBytes(*stream, EncodeTextFrame(text)))
    {
        WarningLog(L"[%hs] Send failed", logTag);
        return false;
    }
    return true;
}

std::string WebSocketSession::BuildUpgradeRequest(
    const std::string& host,
    unsigned short port,
    const std::string& path,
    const std::string& webSocketKey)
{
    std::string request;
    request.reserve(256 + path.size());
    request += "GET " + path + " HTTP/1.1\r\n";
    request += "Host: " + host + ":" + std::to_string(port) + "\r\n";
    request += "Upgrade: websocket\r\n";
    request += "Connection: Upgrade\r\n";
    request += "Sec-WebSocket-Key: " + webSocketKey + "\r\n";
    request += "Sec-WebSocket-Version: 13\r\n";
    request += "\r\n";
    return request;
}

std::string WebSocketSession::GenerateWebSocketKey()
{
    std::random_device source;
    std::uint8_t keyBytes[16]{};
    for (std::uint8_t& value : keyBytes)
    {
        value = static_cast<std::uint8_t>(source() & 0xFF);
    }
    return Base64Encode(keyBytes, sizeof(keyBytes));
}

bool WebSocketSession::IsSwitchingProtocolsStatus(const std::string& statusLine)
{
    if (statusLine.compare(0, 5, "HTTP/") != 0)
    {
        return false;
    }

    size_t codeStart = statusLine.find(' ');
    if (codeStart == std::string::npos)
    {
        return false;
    }
    ++codeStart;
    size_t codeEnd = statusLine.find(' ', codeStart);
    std::string code = statusLine.substr(
        codeStart,
        codeEnd == std::string::npos ? std::string::npos : codeEnd - codeStart);
    return code == "101";
}

bool WebSocketSession::OnUpgraded(IByteStream&, const std::string&)
{
    return true;
}

void WebSocketSession::OnConnected()
{
}

void WebSocketSession::OnMessage(const std::string&)
{
}

bool WebSocketSession::WriteText(IByteStream& stream, const std::string& text)
{
    return WriteBytes(stream, EncodeTextFrame(text));
}

void WebSocketSession::Shutdown()
{
    watchdog.Cancel();
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        cancelled = true;
    }
    TearDown(false);
}

WebSocketSession::EndpointResult WebSocketSession::TryEndpoint(
    const TvDevice& target,
    const SessionEndpoint& endpoint,
    const std::string& path,
    const std::string& storedToken,
    int timeoutMs,
    std::shared_ptr<IByteStream>& connected,
    std::string& receivedToken,
    std::string& errorMessage)
{
    DebugLog(
        L"[%hs] Trying %hs://%hs:%u",
        logTag,
        endpoint.secure ? "wss" : "ws",
        target.ip.c_str(),
        endpoint.port);

    std::unique_ptr<IByteStream> opened = connector.Open(
        target.ip,
        endpoint.port,
        endpoint.secure,
        timeoutMs,
        errorMessage);
    if (!opened)
    {
        if (errorMessage.empty())
        {
            errorMessage = "Could not open connection";
        }
        return EndpointResult::Failed;
    }

    std::shared_ptr<IByteStream> stream(std::move(opened));
    SetPendingStream(stream);

    if (!PerformUpgrade(*stream, target.ip, endpoint.port, path, errorMessage))
    {
        stream->Close();
        return EndpointResult::Failed;
    }

    if (!OnUpgraded(*stream, storedToken))
    {
        errorMessage = "Could not send the pairing request";
        stream->Close();
        return EndpointResult::Failed;
    }

    for (int index = 0; index < MaxPairingMessages; ++index)
    {
        std::string message;
        if (!ReadMessage(*stream, message))
        {
            errorMessage = "No response from TV";
            stream->Close();
            return EndpointResult::Failed;
        }

        DebugLog(L"[%hs] Pairing message %d (%zu bytes)", logTag, index, message.size());

        std::string token;
        PairingOutcome outcome = ClassifyPairingMessage(message, token);
        if (outcome == PairingOutcome::Ready)
        {
            connected = stream;
            receivedToken = token;
            return EndpointResult::Connected;
        }

        if (outcome == PairingOutcome::Unauthorized)
        {
            stream->Close();
            tokenStore.ClearToken(target.ip);
            errorMessage = UnauthorizedMessage();
            WarningLog(L"[%hs] %hs rejected the connection", logTag, target.ip.c_str());
            return EndpointResult::Terminal;
        }

        WarningLog(L"[%hs] Unexpected message while pairing", logTag);
    }

    stream->Close();
    errorMessage = UnconfirmedMessage;
    return EndpointResult::Terminal;
}

bool WebSocketSession::PerformUpgrade(
    IByteStream& stream,
    const std::string& host,
    unsigned short port,
    const std::string& path,
    std::string& errorMessage)
{
    std::string request = BuildUpgradeRequest(host, port, path, GenerateWebSocketKey());
    {
        std::lock_guard<std::mutex> lock(writeMutex);
        if (!stream.Write(request.data(), request.size()))
        {
            errorMessage = "Could not send the upgrade request";
            return false;
        }
    }

    std::string response;
    bool complete = false;
    while (response.size() < MaxUpgradeResponseSize)
    {
        char character = 0;
        if (!ReadExact(stream, &character, 1))
        {
            errorMessage = "Connection closed during the upgrade";
            return false;
        }

        response.push_back(character);
        if (response.size() >= 4 && response.compare(response.size() - 4, 4, "\r\n\r\n") == 0)
        {
            complete = true;
            break;
        }
    }

    if (!complete)
    {
        errorMessage = "Upgrade response too large";
        return false;
    }

    std::string statusLine = response.substr(0, response.find("\r\n"));
    DebugLog(L"[%hs] Upgrade response: %hs", logTag, statusLine.c_str());
    if (!IsSwitchingProtocolsStatus(statusLine))
    {
        errorMessage = "WebSocket upgrade failed: " + statusLine;
        return false;
    }
    return true;
}

bool WebSocketSession::ReadMessage(IByteStream& stream, std::string& message)
{
    std::string assembled;
    bool assembling = false;

    for (;;)
    {
        WebSocketFrame frame;
        if (!ReadFrame(stream, configuration.maxFramePayload, frame))
        {
            return false;
        }

        if (frame.opcode == WebSocketOpcode::Ping)
        {
            if (!WriteBytes(stream, EncodeControlFrame(WebSocketOpcode::Pong, frame.payload)))
            {
                return false;
            }
            continue;
        }

        if (frame.opcode == WebSocketOpcode::Pong)
        {
            continue;
        }

        if (frame.opcode == WebSocketOpcode::Close)
        {
            DebugLog(L"[%hs] Close frame received", logTag);
            return false;
        }

        if (frame.opcode == WebSocketOpcode::Continuation)
        {
            if (!assembling || assembled.size() + frame.payload.size() > configuration.maxFramePayload)
            {
                WarningLog(L"[%hs] Malformed fragmented message", logTag);
                return false;
            }
            assembled.append(frame.payload.begin(), frame.payload.end());
        }
        else
        {
            assembled.assign(frame.payload.begin(), frame.payload.end());
            assembling = true;
        }

        if (frame.fin)
        {
            message.swap(assembled);
            return true;
        }
    }
}

bool WebSocketSession::WriteBytes(IByteStream& stream, const std::vector<std::uint8_t>& bytes)
{
    std::lock_guard<std::mutex> lock(writeMutex);
    return stream.Write(bytes.data(), bytes.size());
}

void WebSocketSession::ReaderLoop(std::shared_ptr<IByteStream> stream, std::uint64_t readerGeneration)
{
    for (;;)
    {
        std::string message;
        if (!ReadMessage(*stream, message))
        {
            break;
        }

        try
        {
            OnMessage(message);
        }
        catch (const std::exception& exception)
        {
            ErrorLog(L"[%hs] Message handler threw: %hs", logTag, exception.what());
        }
    }

    HandleDrop(readerGeneration);
}

void WebSocketSession::HandleDrop(std::uint64_t readerGeneration)
{
    std::shared_ptr<IByteStream> stream;
    TvDevice dropped;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (readerGeneration != generation || state != ConnectionState::Connected)
        {
            return;
        }
        state = ConnectionState::Disconnected;
        stream = std::move(activeStream);
        dropped = device;
    }

    if (stream)
    {
        stream->Close();
    }

    InfoLog(L"[%hs] Connection to %hs closed", logTag, dropped.ip.c_str());
    Publish(ConnectionState::Disconnected, &dropped, std::string());
}

void WebSocketSession::TearDown(bool publish)
{
    std::shared_ptr<IByteStream> stream;
    std::thread finished;
    TvDevice previous;
    bool hadDevice = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        ++generation;
        stream = std::move(activeStream);
        if (reader.joinable())
        {
            if (reader.get_id() == std::this_thread::get_id())
            {
                reader.detach();
            }
            else
            {
                finished = std::move(reader);
            }
        }
        previous = device;
        hadDevice = !device.ip.empty();
        if (state != ConnectionState::Connecting)
        {
            state = ConnectionState::Disconnected;
        }
    }

    if (stream)
    {
        stream->Close();
    }
    ClosePendingStream();

    if (finished.joinable())
    {
        finished.join();
    }

    if (publish)
    {
        DebugLog(L"[%hs] Disconnected", logTag);
        Publish(ConnectionState::Disconnected, hadDevice ? &previous : nullptr, std::string());
    }
}

void WebSocketSession::SetPendingStream(const std::shared_ptr<IByteStream>& stream)
{
    std::lock_guard<std::mutex> lock(stateMutex);
    pendingStream = stream;
    if (timedOut || cancelled)
    {
        stream->Close();
    }
}

void WebSocketSession::ClosePendingStream()
{
    std::shared_ptr<IByteStream> stream;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        stream = std::move(pendingStream);
    }
    if (stream)
    {
        stream->Close();
    }
}

bool WebSocketSession::ClaimTerminal()
{
    return !terminalClaimed.exchange(true);
}

void WebSocketSession::FailAttempt(const TvDevice& target, const std::string& errorMessage)
{
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        state = ConnectionState::Error;
    }
    ErrorLog(L"[%hs] Connect %hs failed: %hs", logTag, target.ip.c_str(), errorMessage.c_str());
    Publish(ConnectionState::Error, &target, errorMessage);
}

void WebSocketSession::Publish(ConnectionState newState, const TvDevice* eventDevice, const std::string& error)
{
    ConnectionEvent event;
    event.state = newState;
    if (eventDevice)
    {
        event.hasDevice = true;
        event.device = *eventDevice;
    }
    event.error = error;
    events.Publish(std::move(event));
}
