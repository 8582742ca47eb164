#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

// TV brands with a known control protocol.
enum class TvBrand
{
    SamsungTizen,
    LgWebOs,
    Roku,
    AndroidTv,
    Vizio,
    FireTv,
    Unknown,
};

// Remote keys shared by every brand; handlers map them to native codes.
enum class StandardRemoteKey
{
    Power,
    Source,
    Up,
    Down,
    Left,
    Right,
    Enter,
    Back,
    Home,
    Menu,
    Info,
    VolumeUp,
    VolumeDown,
    Mute,
    ChannelUp,
    ChannelDown,
    Num0,
    Num1,
    Num2,
    Num3,
    Num4,
    Num5,
    Num6,
    Num7,
    Num8,
    Num9,
    Play,
    Pause,
    Stop,
    Rewind,
    FastForward,
};

// Key grouping used for remote layouts.
enum class RemoteKeyGroup
{
    Power,
    Navigation,
    Volume,
    Channels,
    Numbers,
    Media,
    Menu,
};

// Optional features a handler may declare.
enum class Capability
{
    RawKey,
    AppLaunch,
};

enum class ConnectionState
{
    Disconnected,
    Connecting,
    Connected,
    Error,
};

// A TV found on the network by a successful identification.
struct TvDevice
{
    std::string id;
    std::string ip;
    unsigned short port = 0;
    std::string name;
    TvBrand brand = TvBrand::Unknown;
    std::string model;
    std::string os;
    std::string resolution;
    std::string mac;
    std::string ssdpResponse;
    std::map<std::string, std::string> metadata;
};

bool operator==(const TvDevice& left, const TvDevice& right);
bool operator!=(const TvDevice& left, const TvDevice& right);

// Point-in-time notification about a session.
struct ConnectionEvent
{
    ConnectionState state = ConnectionState::Disconnected;
    bool hasDevice = false;
    TvDevice device;
    std::string error;
};

using ConnectionListener = std::function<void(const ConnectionEvent&)>;
using Unsubscribe = std::function<void()>;

const char* ToString(TvBrand brand);
const char* ToString(StandardRemoteKey key);
const char* ToString(RemoteKeyGroup group);
const char* ToString(ConnectionState state);

bool TryParseTvBrand(const std::string& text, TvBrand& brand);
bool TryParseRemoteKey(const std::string& text, StandardRemoteKey& key);

// Every standard key in declaration order.
const std::vector<StandardRemoteKey>& AllRemoteKeys();

// Every key group in declaration order.
const std::vector<RemoteKeyGroup>& AllRemoteKeyGroups();

// Returns the keys belonging to a layout group.
const std::vector<StandardRemoteKey>& GetKeysInGroup(RemoteKeyGroup group);
