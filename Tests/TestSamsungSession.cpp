#include <unity.h>

#include "SamsungSession.h"
#include "SamsungTizenHandler.h"
#include "TestFakes.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace
{
    const char TvIp[] = "10.0.0.5";
    const char ConnectedMessage[] = "{\"event\":\"ms.channel.connect\",\"data\":{\"id\":\"c1\",\"token\":\"19283746\"}}";
    const char UnauthorizedMessage[] = "{\"event\":\"ms.channel.unauthorized\"}";

    // Runs a hook after the last connected IP is recorded, which is the
    // final step before a session goes live.
    class HookedTokenStore : public InMemoryTokenStore
    {
    public:
        std::function<void()> afterLastConnectedIp;

        void SetLastConnectedIp(const std::string& ip) override
        {
            InMemoryTokenStore::SetLastConnectedIp(ip);
            if (afterLastConnectedIp)
            {
                afterLastConnectedIp();
            }
        }
    };

    AppConfiguration configuration;
    std::unique_ptr<FakeHttpClient> http;
    std::unique_ptr<FakeConnector> connector;
    std::unique_ptr<InMemoryTokenStore> tokens;
    std::unique_ptr<SamsungTizenHandler> handler;
    std::unique_ptr<EventRecorder> recorder;
    Unsubscribe unsubscribe;

    TvDevice MakeDevice()
    {
        TvDevice device;
        device.id = "samsung-10.0.0.5";
        device.ip = TvIp;
        device.port = 8002;
        device.name = "Samsung TV";
        device.brand = TvBrand::SamsungTizen;
        return device;
    }

    std::shared_ptr<FakeStreamState> ScriptUpgrade(unsigned short port, const char* firstMessage)
    {
        std::shared_ptr<FakeStreamState> stream = connector->Script(port);
        stream->PushBytes(std::string(SwitchingProtocolsResponse));
        if (firstMessage)
        {
            stream->PushServerText(firstMessage);
        }
        return stream;
    }

    void Recreate()
    {
        if (unsubscribe)
        {
            unsubscribe();
            unsubscribe = nullptr;
        }
        handler.reset(new SamsungTizenHandler(*http, *connector, *tokens, configuration));
        unsubscribe = handler->OnConnectionStateChange(recorder->Listener());
    }

    bool WaitForFrame(FakeStreamState& stream, WebSocketOpcode opcode, WebSocketFrame& found)
    {
        for (int attempt = 0; attempt < 200; ++attempt)
        {
            for (const WebSocketFrame& frame : stream.WrittenFrames())
            {
                if (frame.opcode == opcode)
                {
                    found = frame;
                    return true;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }
}

void setUp(void)
{
    configuration = AppConfiguration();
    configuration.appName = "Universal TV Remote";
    configuration.connectTimeoutMs = 2000;
    http.reset(new FakeHttpClient());
    connector.reset(new FakeConnector());
    tokens.reset(new InMemoryTokenStore());
    recorder.reset(new EventRecorder());
    Recreate();
}

void tearDown(void)
{
    if (unsubscribe)
    {
        unsubscribe();
        unsubscribe = nullptr;
    }
    handler.reset();
    recorder.reset();
    tokens.reset();
    connector.reset();
    http.reset();
}

void test_channel_path_embeds_app_name_and_token(void)
{
    TEST_ASSERT_EQUAL_STRING(
        "/api/v2/channels/samsung.remote.control?name=VW5pdmVyc2FsIFRWIFJlbW90ZQ==",
        SamsungSession::BuildChannelPath("Universal TV Remote", "").c_str());
    TEST_ASSERT_EQUAL_STRING(
        "/api/v2/channels/samsung.remote.control?name=VW5pdmVyc2FsIFRWIFJlbW90ZQ==&token=555",
        SamsungSession::BuildChannelPath("Universal TV Remote", "555").c_str());
}

void test_upgrade_request_headers(void)
{
    std::string request = WebSocketSession::BuildUpgradeRequest("10.0.0.5", 8002, "/path", "a2V5");

    TEST_ASSERT_EQUAL_STRING(
        "GET /path HTTP/1.1\r\n"
        "Host: 10.0.0.5:8002\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Key: a2V5\r\n"
        "Sec-WebSocket-Version: 13\r\n"
        "\r\n",
        request.c_str());
    TEST_ASSERT_EQUAL_UINT32(24, WebSocketSession::GenerateWebSocketKey().size());
}

void test_upgrade_needs_status_code_101(void)
{
    TEST_ASSERT_TRUE(WebSocketSession::IsSwitchingProtocolsStatus("HTTP/1.1 101 Switching Protocols"));
    TEST_ASSERT_TRUE(WebSocketSession::IsSwitchingProtocolsStatus("HTTP/1.1 101"));
    TEST_ASSERT_FALSE(WebSocketSession::IsSwitchingProtocolsStatus("HTTP/1.1 200 OK 101"));
    TEST_ASSERT_FALSE(WebSocketSession::IsSwitchingProtocolsStatus("HTTP/1.1 1010 Unknown"));
    TEST_ASSERT_FALSE(WebSocketSession::IsSwitchingProtocolsStatus("HTTP/1.1 403 Forbidden"));
    TEST_ASSERT_FALSE(WebSocketSession::IsSwitchingProtocolsStatus("101 Switching Protocols"));
    TEST_ASSERT_FALSE(WebSocketSession::IsSwitchingProtocolsStatus(""));
}

void test_first_connect_pairs_and_stores_token(void)
{
    std::shared_ptr<FakeStreamState> stream = ScriptUpgrade(8002, ConnectedMessage);

    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));
    TEST_ASSERT_TRUE(handler->IsConnected());

    std::string handshake = stream->HandshakeRequest();
    TEST_ASSERT_TRUE(handshake.find("GET /api/v2/channels/samsung.remote.control?name=VW5pdmVyc2FsIFRWIFJlbW90ZQ== HTTP/1.1") == 0);
    TEST_ASSERT_TRUE(handshake.find("token=") == std::string::npos);
    TEST_ASSERT_TRUE(handshake.find("Sec-WebSocket-Version: 13\r\n") != std::string::npos);

    std::string token;
    TEST_ASSERT_TRUE(tokens->GetToken(TvIp, token));
    TEST_ASSERT_EQUAL_STRING("19283746", token.c_str());

    std::string lastIp;
    TEST_ASSERT_TRUE(handler->GetLastConnectedIp(lastIp));
    TEST_ASSERT_EQUAL_STRING(TvIp, lastIp.c_str());

    TEST_ASSERT_TRUE(handler->WaitForEvents(2000));
    TEST_ASSERT_EQUAL_UINT32(1, recorder->Count(ConnectionState::Connecting));
    TEST_ASSERT_EQUAL_UINT32(1, recorder->Count(ConnectionState::Connected));
    TEST_ASSERT_EQUAL_UINT32(0, recorder->Count(ConnectionState::Error));
}

void test_stored_token_is_sent_in_path(void)
{
    tokens->SaveToken(TvIp, "stored42");
    std::shared_ptr<FakeStreamState> stream = ScriptUpgrade(8002, "{\"event\":\"ms.channel.connect\"}");

    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));
    TEST_ASSERT_TRUE(stream->HandshakeRequest().find("&token=stored42 HTTP/1.1") != std::string::npos);

    std::string token;
    TEST_ASSERT_TRUE(tokens->GetToken(TvIp, token));
    TEST_ASSERT_EQUAL_STRING("stored42", token.c_str());
}

void test_unauthorized_clears_token_and_next_connect_omits_it(void)
{
    tokens->SaveToken(TvIp, "stale");
    ScriptUpgrade(8002, UnauthorizedMessage);

    std::string error;
    TEST_ASSERT_FALSE(handler->Connect(MakeDevice(), error));
    TEST_ASSERT_TRUE(error.find("TV denied the connection") == 0);
    TEST_ASSERT_TRUE(error.find("External Device Manager") != std::string::npos);

    std::string token;
    TEST_ASSERT_FALSE(tokens->GetToken(TvIp, token));
    TEST_ASSERT_EQUAL_UINT32(1, connector->Attempts().size());

    TEST_ASSERT_TRUE(handler->WaitForEvents(2000));
    TEST_ASSERT_EQUAL_UINT32(1, recorder->Count(ConnectionState::Error));

    std::shared_ptr<FakeStreamState> retry = ScriptUpgrade(8002, ConnectedMessage);
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));
    TEST_ASSERT_TRUE(retry->HandshakeRequest().find("token=") == std::string::npos);
}

void test_secure_failure_falls_back_to_plain_port(void)
{
    std::shared_ptr<FakeStreamState> plain = ScriptUpgrade(8001, ConnectedMessage);

    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));

    std::vector<ConnectAttempt> attempts = connector->Attempts();
    TEST_ASSERT_EQUAL_UINT32(2, attempts.size());
    TEST_ASSERT_EQUAL_UINT16(8002, attempts[0].port);
    TEST_ASSERT_TRUE(attempts[0].secure);
    TEST_ASSERT_EQUAL_UINT16(8001, attempts[1].port);
    TEST_ASSERT_FALSE(attempts[1].secure);
    TEST_ASSERT_TRUE(plain->HandshakeRequest().find("Host: 10.0.0.5:8001") != std::string::npos);
}

void test_plain_port_first_when_secure_not_preferred(void)
{
    configuration.preferSecureWebSocket = false;
    ScriptUpgrade(8001, ConnectedMessage);

    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));
    TEST_ASSERT_EQUAL_UINT32(1, connector->Attempts().size());
    TEST_ASSERT_EQUAL_UINT16(8001, connector->Attempts()[0].port);
}

void test_rejected_upgrade_tries_next_port_then_fails(void)
{
    std::shared_ptr<FakeStreamState> stream = connector->Script(8002);
    stream->PushBytes(std::string("HTTP/1.1 403 Forbidden\r\nContent-Length: 0\r\n\r\n"));

    std::string error;
    TEST_ASSERT_FALSE(handler->Connect(MakeDevice(), error));
    TEST_ASSERT_EQUAL_UINT32(2, connector->Attempts().size());
    TEST_ASSERT_TRUE(stream->IsClosed());
    TEST_ASSERT_FALSE(handler->IsConnected());
}

void test_watchdog_fails_silent_tv_with_timeout_message(void)
{
    configuration.connectTimeoutMs = 300;
    std::shared_ptr<FakeStreamState> stream = ScriptUpgrade(8002, nullptr);

    std::string error;
    TEST_ASSERT_FALSE(handler->Connect(MakeDevice(), error));
    TEST_ASSERT_EQUAL_STRING("Connection timed out. TV did not respond.", error.c_str());
    TEST_ASSERT_TRUE(stream->IsClosed());
    TEST_ASSERT_EQUAL_UINT32(1, connector->Attempts().size());

    TEST_ASSERT_TRUE(handler->WaitForEvents(2000));
    TEST_ASSERT_EQUAL_UINT32(1, recorder->Count(ConnectionState::Error));
    TEST_ASSERT_EQUAL_UINT32(0, recorder->Count(ConnectionState::Connected));
}

void test_unrecognized_messages_end_in_explicit_failure(void)
{
    std::shared_ptr<FakeStreamState> stream = ScriptUpgrade(8002, nullptr);
    for (int index = 0; index < MaxPairingMessages; ++index)
    {
        stream->PushServerText("{\"event\":\"ms.remote.touchEnable\"}");
    }

    std::string error;
    TEST_ASSERT_FALSE(handler->Connect(MakeDevice(), error));
    TEST_ASSERT_EQUAL_STRING("TV did not confirm the pairing", error.c_str());
    TEST_ASSERT_EQUAL_UINT32(1, connector->Attempts().size());

    std::string token;
    TEST_ASSERT_FALSE(tokens->GetToken(TvIp, token));
}

void test_disconnect_emits_disconnected_once(void)
{
    std::shared_ptr<FakeStreamState> stream = ScriptUpgrade(8002, ConnectedMessage);
    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));

    handler->Disconnect();
    TEST_ASSERT_TRUE(handler->WaitForEvents(2000));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    TEST_ASSERT_TRUE(handler->WaitForEvents(2000));

    TEST_ASSERT_FALSE(handler->IsConnected());
    TEST_ASSERT_TRUE(stream->IsClosed());
    TEST_ASSERT_EQUAL_UINT32(1, recorder->Count(ConnectionState::Disconnected));
    TEST_ASSERT_FALSE(handler->SendKey(StandardRemoteKey::VolumeUp));
}

void test_peer_close_drops_session(void)
{
    std::shared_ptr<FakeStreamState> stream = ScriptUpgrade(8002, ConnectedMessage);
    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));

    stream->PushBytes(ServerFrame(WebSocketOpcode::Close, std::string()));

    for (int attempt = 0; attempt < 200 && handler->IsConnected(); ++attempt)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    TEST_ASSERT_FALSE(handler->IsConnected());

    handler->Disconnect();
    TEST_ASSERT_TRUE(handler->WaitForEvents(2000));
    std::vector<ConnectionEvent> events = recorder->Events();
    TEST_ASSERT_TRUE(events.size() >= 3);
    TEST_ASSERT_TRUE(events[2].state == ConnectionState::Disconnected);
    TEST_ASSERT_TRUE(events[2].hasDevice);
    TEST_ASSERT_EQUAL_STRING(TvIp, events[2].device.ip.c_str());
}

void test_ping_is_answered_with_pong(void)
{
    std::shared_ptr<FakeStreamState> stream = ScriptUpgrade(8002, ConnectedMessage);
    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));

    stream->PushBytes(ServerFrame(WebSocketOpcode::Ping, "hb"));

    WebSocketFrame pong;
    TEST_ASSERT_TRUE(WaitForFrame(*stream, WebSocketOpcode::Pong, pong));
    TEST_ASSERT_TRUE(pong.masked);
    TEST_ASSERT_EQUAL_STRING("hb", std::string(pong.payload.begin(), pong.payload.end()).c_str());
    TEST_ASSERT_TRUE(handler->IsConnected());
}

void test_second_connect_replaces_first_session(void)
{
    std::shared_ptr<FakeStreamState> first = ScriptUpgrade(8002, ConnectedMessage);
    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));

    std::shared_ptr<FakeStreamState> second = ScriptUpgrade(8002, ConnectedMessage);
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));

    TEST_ASSERT_TRUE(first->IsClosed());
    TEST_ASSERT_FALSE(second->IsClosed());
    TEST_ASSERT_TRUE(handler->SendKey(StandardRemoteKey::Home));
    TEST_ASSERT_TRUE(second->WaitForWrittenTexts(1, 1000));
    TEST_ASSERT_TRUE(first->WrittenTexts().empty());
}

void test_disconnect_during_final_connect_step_cancels_it(void)
{
    HookedTokenStore store;
    SamsungTizenHandler racing(*http, *connector, store, configuration);
    EventRecorder raceEvents;
    Unsubscribe stopRecording = racing.OnConnectionStateChange(raceEvents.Listener());
    store.afterLastConnectedIp = [&racing]()
    {
        std::thread other([&racing]() { racing.Disconnect(); });
        other.join();
    };
    std::shared_ptr<FakeStreamState> stream = ScriptUpgrade(8002, ConnectedMessage);

    std::string error;
    TEST_ASSERT_FALSE(racing.Connect(MakeDevice(), error));
    TEST_ASSERT_EQUAL_STRING("Connection cancelled", error.c_str());
    TEST_ASSERT_FALSE(racing.IsConnected());
    TEST_ASSERT_TRUE(stream->IsClosed());
    TEST_ASSERT_FALSE(racing.SendKey(StandardRemoteKey::VolumeUp));

    TEST_ASSERT_TRUE(racing.WaitForEvents(1000));
    TEST_ASSERT_EQUAL_UINT32(0, raceEvents.Count(ConnectionState::Connected));
    TEST_ASSERT_EQUAL_UINT32(1, raceEvents.Count(ConnectionState::Disconnected));

    store.afterLastConnectedIp = nullptr;
    stopRecording();
}

int main(void)
{
    UNITY_BEGIN();

    RUN_TEST(test_channel_path_embeds_app_name_and_token);
    RUN_TEST(test_upgrade_request_headers);
    RUN_TEST(test_upgrade_needs_status_code_101);
    RUN_TEST(test_first_connect_pairs_and_stores_token);
    RUN_TEST(test_stored_token_is_sent_in_path);
    RUN_TEST(test_unauthorized_clears_token_and_next_connect_omits_it);
    RUN_TEST(test_secure_failure_falls_back_to_plain_port);
    RUN_TEST(test_plain_port_first_when_secure_not_preferred);
    RUN_TEST(test_rejected_upgrade_tries_next_port_then_fails);
    RUN_TEST(test_watchdog_fails_silent_tv_with_timeout_message);
    RUN_TEST(test_unrecognized_messages_end_in_explicit_failure);
    RUN_TEST(test_disconnect_emits_disconnected_once);
    RUN_TEST(test_peer_close_drops_session);
    RUN_TEST(test_ping_is_answered_with_pong);
    RUN_TEST(test_second_connect_replaces_first_session);
    RUN_TEST(test_disconnect_during_final_connect_step_cancels_it);

    return UNITY_END();
}
