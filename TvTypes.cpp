#include "TvTypes.h"

namespace
{
    struct KeyName
    {
        StandardRemoteKey key;
        const char* name;
    };

    const KeyName KeyNames[] = {
        { StandardRemoteKey::Power, "power" },
        { StandardRemoteKey::Source, "source" },
        { StandardRemoteKey::Up, "up" },
        { StandardRemoteKey::Down, "down" },
        { StandardRemoteKey::Left, "left" },
        { StandardRemoteKey::Right, "right" },
        { StandardRemoteKey::Enter, "enter" },
        { StandardRemoteKey::Back, "back" },
        { StandardRemoteKey::Home, "home" },
        { StandardRemoteKey::Menu, "menu" },
        { StandardRemoteKey::Info, "info" },
        { StandardRemoteKey::VolumeUp, "volume_up" },
        { StandardRemoteKey::VolumeDown, "volume_down" },
        { StandardRemoteKey::Mute, "mute" },
        { StandardRemoteKey::ChannelUp, "channel_up" },
        { StandardRemoteKey::ChannelDown, "channel_down" },
        { StandardRemoteKey::Num0, "num_0" },
        { StandardRemoteKey::Num1, "num_1" },
        { StandardRemoteKey::Num2, "num_2" },
        { StandardRemoteKey::Num3, "num_3" },
        { StandardRemoteKey::Num4, "num_4" },
        { StandardRemoteKey::Num5, "num_5" },
        { StandardRemoteKey::Num6, "num_6" },
        { StandardRemoteKey::Num7, "num_7" },
        { StandardRemoteKey::Num8, "num_8" },
        { StandardRemoteKey::Num9, "num_9" },
        { StandardRemoteKey::Play, "play" },
        { StandardRemoteKey::Pause, "pause" },
        { StandardRemoteKey::Stop, "stop" },
        { StandardRemoteKey::Rewind, "rewind" },
        { StandardRemoteKey::FastForward, "fast_forward" },
    };

    struct BrandName
    {
        TvBrand brand;
        const char* name;
    };

    const BrandName BrandNames[] = {
        { TvBrand::SamsungTizen, "samsung_tizen" },
        { TvBrand::LgWebOs, "lg_webos" },
        { TvBrand::Roku, "roku" },
        { TvBrand::AndroidTv, "android_tv" },
        { TvBrand::Vizio, "vizio" },
        { TvBrand::FireTv, "fire_tv" },
        { TvBrand::Unknown, "unknown" },
    };
}

bool operator==(const TvDevice& left, const TvDevice& right)
{
    return left.id == right.id
        && left.ip == right.ip
        && left.port == right.port
        && left.name == right.name
        && left.brand == right.brand
        && left.model == right.model
        && left.os == right.os
        && left.resolution == right.resolution
        && left.mac == right.mac
        && left.ssdpResponse == right.ssdpResponse
        && left.metadata == right.metadata;
}

bool operator!=(const TvDevice& left, const TvDevice& right)
{
    return !(left == right);
}

const char* ToString(TvBrand brand)
{
    for (const BrandName& entry : BrandNames)
    {
        if (entry.brand == brand)
        {
            return entry.name;
        }
    }
    return "unknown";
}

const char* ToString(StandardRemoteKey key)
{
    for (const KeyName& entry : KeyNames)
    {
        if (entry.key == key)
        {
            return entry.name;
        }
    }
    return "";
}

const char* ToString(RemoteKeyGroup group)
{
    switch (group)
    {
    case RemoteKeyGroup::Power:
        return "power";
    case RemoteKeyGroup::Navigation:
        return "navigation";
    case RemoteKeyGroup::Volume:
        return "volume";
    case RemoteKeyGroup::Channels:
        return "channels";
    case RemoteKeyGroup::Numbers:
        return "numbers";
    case RemoteKeyGroup::Media:
        return "media";
    case RemoteKeyGroup::Menu:
        return "menu";
    }
    return "";
}

const char* ToString(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Disconnected:
        return "disconnected";
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Connected:
        return "connected";
    case ConnectionState::Error:
        return "error";
    }
    return "";
}

bool TryParseTvBrand(const std::string& text, TvBrand& brand)
{
    for (const BrandName& entry : BrandNames)
    {
        if (text == entry.name)
        {
            brand = entry.brand;
            return true;
        }
    }
    return false;
}

bool TryParseRemoteKey(const std::string& text, StandardRemoteKey& key)
{
    for (const KeyName& entry : KeyNames)
    {
        if (text == entry.name)
        {
            key = entry.key;
            return true;
        }
    }
    return false;
}

const std::vector<StandardRemoteKey>& AllRemoteKeys()
{
    static const std::vector<StandardRemoteKey> keys = []()
    {
        std::vector<StandardRemoteKey> result;
        for (const KeyName& entry : KeyNames)
        {
            result.push_back(entry.key);
        }
        return result;
    }();
    return keys;
}

const std::vector<RemoteKeyGroup>& AllRemoteKeyGroups()
{
    static const std::vector<RemoteKeyGroup> groups = {
        RemoteKeyGroup::Power,
        RemoteKeyGroup::Navigation,
        RemoteKeyGroup::Volume,
        RemoteKeyGroup::Channels,
        RemoteKeyGroup::Numbers,
        RemoteKeyGroup::Media,
        RemoteKeyGroup::Menu,
    };
    return groups;
}

const std::vector<StandardRemoteKey>& GetKeysInGroup(RemoteKeyGroup group)
{
    static const std::vector<StandardRemoteKey> power = {
        StandardRemoteKey::Power, StandardRemoteKey::Source };
    static const std::vector<StandardRemoteKey> navigation = {
        StandardRemoteKey::Up, StandardRemoteKey::Down, StandardRemoteKey::Left,
        StandardRemoteKey::Right, StandardRemoteKey::Enter, StandardRemoteKey::Back };
    static const std::vector<StandardRemoteKey> volume = {
        StandardRemoteKey::VolumeUp, StandardRemoteKey::VolumeDown, StandardRemoteKey::Mute };
    static const std::vector<StandardRemoteKey> channels = {
        StandardRemoteKey::ChannelUp, StandardRemoteKey::ChannelDown };
    static const std::vector<StandardRemoteKey> numbers = {
        StandardRemoteKey::Num0, StandardRemoteKey::Num1, StandardRemoteKey::Num2,
        StandardRemoteKey::Num3, StandardRemoteKey::Num4, StandardRemoteKey::Num5,
        StandardRemoteKey::Num6, StandardRemoteKey::Num7, StandardRemoteKey::Num8,
        StandardRemoteKey::Num9 };
    static const std::vector<StandardRemoteKey> media = {
        StandardRemoteKey::Play, StandardRemoteKey::Pause, StandardRemoteKey::Stop,
        StandardRemoteKey::Rewind, StandardRemoteKey::FastForward };
    static const std::vector<StandardRemoteKey> menu = {
        StandardRemoteKey::Home, StandardRemoteKey::Menu, StandardRemoteKey::Info };

    switch (group)
    {
    case RemoteKeyGroup::Power:
        return power;
    case RemoteKeyGroup::Navigation:
        return navigation;
    case RemoteKeyGroup::Volume:
        return volume;
    case RemoteKeyGroup::Channels:
        return channels;
    case RemoteKeyGroup::Numbers:
        return numbers;
    case RemoteKeyGroup::Media:
        return media;
    case RemoteKeyGroup::Menu:
        return menu;
    }
    return power;
}
