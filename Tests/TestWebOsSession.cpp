#include <unity.h>

#include "JsonHelpers.h"
#include "LgWebOsHandler.h"
#include "TestFakes.h"
#include "WebOsSession.h"

#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace
{
    const char TvIp[] = "192.168.1.30";
    const char PromptShown[] = "{\"type\":\"response\",\"id\":\"register_0\",\"payload\":{\"pairingType\":\"PROMPT\",\"returnValue\":true}}";
    const char Registered[] = "{\"type\":\"registered\",\"id\":\"register_0\",\"payload\":{\"client-key\":\"ck-1\"}}";

    AppConfiguration configuration;
    std::unique_ptr<FakeHttpClient> http;
    std::unique_ptr<FakeConnector> connector;
    std::unique_ptr<InMemoryTokenStore> tokens;
    std::unique_ptr<LgWebOsHandler> handler;

    TvDevice MakeDevice()
    {
        TvDevice device;
        device.id = "uuid:lg";
        device.ip = TvIp;
        device.port = 3001;
        device.name = "LG TV";
        device.brand = TvBrand::LgWebOs;
        return device;
    }

    std::shared_ptr<FakeStreamState> ScriptPairing(const char* first, const char* second)
    {
        std::shared_ptr<FakeStreamState> stream = connector->Script(3001);
        stream->PushBytes(std::string(SwitchingProtocolsResponse));
        stream->PushServerText(first);
        if (second)
        {
            stream->PushServerText(second);
        }
        return stream;
    }

    std::string PayloadOf(const std::string& message)
    {
        std::string payload;
        GetObjectMember(message, "payload", payload);
        return payload;
    }
}

void setUp(void)
{
    configuration = AppConfiguration();
    configuration.connectTimeoutMs = 2000;
    http.reset(new FakeHttpClient());
    connector.reset(new FakeConnector());
    tokens.reset(new InMemoryTokenStore());
    handler.reset(new LgWebOsHandler(*http, *connector, *tokens, configuration));
}

void tearDown(void)
{
    handler.reset();
    tokens.reset();
    connector.reset();
    http.reset();
}

void test_parse_client_key(void)
{
    TEST_ASSERT_EQUAL_STRING("ck-1", WebOsSession::ParseClientKey(Registered).c_str());
    TEST_ASSERT_EQUAL_STRING("", WebOsSession::ParseClientKey(PromptShown).c_str());
}

void test_parse_mute_flag(void)
{
    bool muted = false;
    TEST_ASSERT_TRUE(WebOsSession::ParseMuteFlag("{\"payload\":{\"muted\": true}}", muted));
    TEST_ASSERT_TRUE(muted);
    TEST_ASSERT_TRUE(WebOsSession::ParseMuteFlag("{\"payload\":{\"mute\":false,\"volume\":5}}", muted));
    TEST_ASSERT_FALSE(muted);
    TEST_ASSERT_FALSE(WebOsSession::ParseMuteFlag("{\"payload\":{\"volume\":5}}", muted));
}

void test_pairing_prompt_then_registered_connects(void)
{
    std::shared_ptr<FakeStreamState> stream = ScriptPairing(PromptShown, Registered);

    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));
    TEST_ASSERT_TRUE(handler->IsConnected());
    TEST_ASSERT_TRUE(stream->HandshakeRequest().find("GET / HTTP/1.1") == 0);

    std::string token;
    TEST_ASSERT_TRUE(tokens->GetToken(TvIp, token));
    TEST_ASSERT_EQUAL_STRING("ck-1", token.c_str());

    TEST_ASSERT_TRUE(stream->WaitForWrittenTexts(2, 1000));
    std::vector<std::string> texts = stream->WrittenTexts();

    TEST_ASSERT_EQUAL_STRING("register", GetMemberText(texts[0], "type").c_str());
    std::string payload = PayloadOf(texts[0]);
    TEST_ASSERT_EQUAL_STRING("PROMPT", GetMemberText(payload, "pairingType").c_str());
    TEST_ASSERT_EQUAL_STRING("", GetMemberText(payload, "client-key").c_str());

    TEST_ASSERT_EQUAL_STRING("request", GetMemberText(texts[1], "type").c_str());
    TEST_ASSERT_EQUAL_STRING("ssap://audio/getStatus", GetMemberText(texts[1], "uri").c_str());
}

void test_register_carries_stored_client_key(void)
{
    tokens->SaveToken(TvIp, "ck-old");
    std::shared_ptr<FakeStreamState> stream = ScriptPairing(
        "{\"type\":\"registered\",\"id\":\"register_0\",\"payload\":{\"client-key\":\"ck-old\"}}",
        nullptr);

    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));

    std::vector<std::string> texts = stream->WrittenTexts();
    TEST_ASSERT_TRUE(texts.size() >= 1);
    TEST_ASSERT_EQUAL_STRING("ck-old", GetMemberText(PayloadOf(texts[0]), "client-key").c_str());
}

void test_register_error_clears_client_key(void)
{
    tokens->SaveToken(TvIp, "ck-old");
    ScriptPairing("{\"type\":\"error\",\"id\":\"register_0\",\"error\":\"403 User denied access\"}", nullptr);

    std::string error;
    TEST_ASSERT_FALSE(handler->Connect(MakeDevice(), error));
    TEST_ASSERT_TRUE(error.find("rejected the pairing") != std::string::npos);

    std::string token;
    TEST_ASSERT_FALSE(tokens->GetToken(TvIp, token));
    TEST_ASSERT_EQUAL_UINT32(1, connector->Attempts().size());
}

void test_keys_become_ssap_requests(void)
{
    std::shared_ptr<FakeStreamState> stream = ScriptPairing(Registered, nullptr);
    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));

    TEST_ASSERT_TRUE(handler->SendKey(StandardRemoteKey::VolumeUp));
    TEST_ASSERT_TRUE(handler->SendKey(StandardRemoteKey::ChannelDown));
    TEST_ASSERT_FALSE(handler->SendKey(StandardRemoteKey::Home));
    TEST_ASSERT_TRUE(stream->WaitForWrittenTexts(4, 1000));

    std::vector<std::string> texts = stream->WrittenTexts();
    TEST_ASSERT_EQUAL_STRING("ssap://audio/volumeUp", GetMemberText(texts[2], "uri").c_str());
    TEST_ASSERT_EQUAL_STRING("ssap://tv/channelDown", GetMemberText(texts[3], "uri").c_str());
    TEST_ASSERT_TRUE(GetMemberText(texts[2], "id") != GetMemberText(texts[3], "id"));
}

void test_mute_toggles_from_reported_state(void)
{
    std::shared_ptr<FakeStreamState> stream = ScriptPairing(Registered, nullptr);
    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));
    TEST_ASSERT_TRUE(stream->WaitForWrittenTexts(2, 1000));

    stream->PushServerText("{\"type\":\"response\",\"id\":\"req_1\",\"payload\":{\"returnValue\":true,\"mute\":true,\"volume\":12}}");
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    TEST_ASSERT_TRUE(handler->SendKey(StandardRemoteKey::Mute));
    TEST_ASSERT_TRUE(handler->SendKey(StandardRemoteKey::Mute));
    TEST_ASSERT_TRUE(stream->WaitForWrittenTexts(4, 1000));

    std::vector<std::string> texts = stream->WrittenTexts();
    TEST_ASSERT_EQUAL_STRING("ssap://audio/setMute", GetMemberText(texts[2], "uri").c_str());
    TEST_ASSERT_EQUAL_STRING("false", GetMemberText(PayloadOf(texts[2]), "mute").c_str());
    TEST_ASSERT_EQUAL_STRING("true", GetMemberText(PayloadOf(texts[3]), "mute").c_str());
}

void test_mute_with_unknown_state_mutes(void)
{
    std::shared_ptr<FakeStreamState> stream = ScriptPairing(Registered, nullptr);
    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));

    TEST_ASSERT_TRUE(handler->SendKey(StandardRemoteKey::Mute));
    TEST_ASSERT_TRUE(stream->WaitForWrittenTexts(3, 1000));

    std::vector<std::string> texts = stream->WrittenTexts();
    TEST_ASSERT_EQUAL_STRING("true", GetMemberText(PayloadOf(texts[2]), "mute").c_str());
}

void test_app_launch_and_no_raw_keys(void)
{
    std::shared_ptr<FakeStreamState> stream = ScriptPairing(Registered, nullptr);
    std::string error;
    TEST_ASSERT_TRUE(handler->Connect(MakeDevice(), error));

    TEST_ASSERT_FALSE(handler->Supports(Capability::RawKey));
    TEST_ASSERT_TRUE(handler->Supports(Capability::AppLaunch));
    TEST_ASSERT_FALSE(handler->SendRawKey("KEY_HOME"));
    TEST_ASSERT_TRUE(handler->LaunchApp("netflix"));
    TEST_ASSERT_TRUE(stream->WaitForWrittenTexts(3, 1000));

    std::vector<std::string> texts = stream->WrittenTexts();
    TEST_ASSERT_EQUAL_STRING("ssap://system.launcher/launch", GetMemberText(texts[2], "uri").c_str());
    TEST_ASSERT_EQUAL_STRING("netflix", GetMemberText(PayloadOf(texts[2]), "id").c_str());
}

int main(void)
{
    UNITY_BEGIN();

    RUN_TEST(test_parse_client_key);
    RUN_TEST(test_parse_mute_flag);
    RUN_TEST(test_pairing_prompt_then_registered_connects);
    RUN_TEST(test_register_carries_stored_client_key);
    RUN_TEST(test_register_error_clears_client_key);
    RUN_TEST(test_keys_become_ssap_requests);
    RUN_TEST(test_mute_toggles_from_reported_state);
    RUN_TEST(test_mute_with_unknown_state_mutes);
    RUN_TEST(test_app_launch_and_no_raw_keys);

    return UNITY_END();
}
