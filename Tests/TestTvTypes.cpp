#include <unity.h>

#include "LgWebOsHandler.h"
#include "SamsungKeys.h"
#include "TvTypes.h"

#include <string>

void setUp(void)
{
}

void tearDown(void)
{
}

void test_brand_names_parse_back(void)
{
    TvBrand brand = TvBrand::Unknown;
    TEST_ASSERT_TRUE(TryParseTvBrand("samsung_tizen", brand));
    TEST_ASSERT_TRUE(brand == TvBrand::SamsungTizen);
    TEST_ASSERT_TRUE(TryParseTvBrand("lg_webos", brand));
    TEST_ASSERT_TRUE(brand == TvBrand::LgWebOs);
    TEST_ASSERT_FALSE(TryParseTvBrand("Samsung", brand));
    TEST_ASSERT_EQUAL_STRING("fire_tv", ToString(TvBrand::FireTv));
}

void test_every_key_has_a_wire_name(void)
{
    for (StandardRemoteKey key : AllRemoteKeys())
    {
        StandardRemoteKey parsed = StandardRemoteKey::Power;
        TEST_ASSERT_TRUE(TryParseRemoteKey(ToString(key), parsed));
        TEST_ASSERT_TRUE(parsed == key);
    }
    TEST_ASSERT_EQUAL_UINT32(31, AllRemoteKeys().size());
}

void test_unknown_key_name_is_rejected(void)
{
    StandardRemoteKey key = StandardRemoteKey::Power;
    TEST_ASSERT_FALSE(TryParseRemoteKey("volume-up", key));
    TEST_ASSERT_FALSE(TryParseRemoteKey("", key));
}

void test_groups_partition_the_keys(void)
{
    size_t total = 0;
    for (RemoteKeyGroup group : AllRemoteKeyGroups())
    {
        total += GetKeysInGroup(group).size();
    }
    TEST_ASSERT_EQUAL_UINT32(AllRemoteKeys().size(), total);

    const std::vector<StandardRemoteKey>& volume = GetKeysInGroup(RemoteKeyGroup::Volume);
    TEST_ASSERT_EQUAL_UINT32(3, volume.size());
    TEST_ASSERT_TRUE(volume[0] == StandardRemoteKey::VolumeUp);
}

void test_every_key_has_a_samsung_code(void)
{
    for (StandardRemoteKey key : AllRemoteKeys())
    {
        TEST_ASSERT_NOT_NULL(GetSamsungKeyCode(key));
    }
    TEST_ASSERT_EQUAL_STRING("KEY_VOLUP", GetSamsungKeyCode(StandardRemoteKey::VolumeUp));
    TEST_ASSERT_EQUAL_STRING("KEY_RETURN", GetSamsungKeyCode(StandardRemoteKey::Back));
    TEST_ASSERT_EQUAL_STRING("KEY_FF", GetSamsungKeyCode(StandardRemoteKey::FastForward));
}

void test_keyboard_characters_map_to_samsung_keys(void)
{
    std::string code;
    TEST_ASSERT_TRUE(CharToSamsungKey('a', code));
    TEST_ASSERT_EQUAL_STRING("KEY_A", code.c_str());
    TEST_ASSERT_TRUE(CharToSamsungKey('7', code));
    TEST_ASSERT_EQUAL_STRING("KEY_7", code.c_str());
    TEST_ASSERT_TRUE(CharToSamsungKey(' ', code));
    TEST_ASSERT_EQUAL_STRING("KEY_SPACE", code.c_str());
    TEST_ASSERT_FALSE(CharToSamsungKey('#', code));
}

void test_lg_key_uris(void)
{
    TEST_ASSERT_EQUAL_STRING("ssap://audio/volumeUp", LgWebOsHandler::GetKeyUri(StandardRemoteKey::VolumeUp));
    TEST_ASSERT_EQUAL_STRING("ssap://system/turnOff", LgWebOsHandler::GetKeyUri(StandardRemoteKey::Power));
    TEST_ASSERT_NULL(LgWebOsHandler::GetKeyUri(StandardRemoteKey::Mute));
    TEST_ASSERT_NULL(LgWebOsHandler::GetKeyUri(StandardRemoteKey::Home));
}

void test_device_equality_covers_metadata(void)
{
    TvDevice left;
    left.id = "a";
    left.ip = "10.0.0.5";
    TvDevice right = left;
    TEST_ASSERT_TRUE(left == right);

    right.metadata["firmwareVersion"] = "1";
    TEST_ASSERT_TRUE(left != right);
}

int main(void)
{
    UNITY_BEGIN();

    RUN_TEST(test_brand_names_parse_back);
    RUN_TEST(test_every_key_has_a_wire_name);
    RUN_TEST(test_unknown_key_name_is_rejected);
    RUN_TEST(test_groups_partition_the_keys);
    RUN_TEST(test_every_key_has_a_samsung_code);
    RUN_TEST(test_keyboard_characters_map_to_samsung_keys);
    RUN_TEST(test_lg_key_uris);
    RUN_TEST(test_device_equality_covers_metadata);

    return UNITY_END();
}
