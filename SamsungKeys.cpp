#include "SamsungKeys.h"

const char* GetSamsungKeyCode(StandardRemoteKey key)
{
    switch (key)
    {
    case StandardRemoteKey::Power: return "KEY_POWER";
    case StandardRemoteKey::Source: return "KEY_SOURCE";
    case StandardRemoteKey::Up: return "KEY_UP";
    case StandardRemoteKey::Down: return "KEY_DOWN";
    case StandardRemoteKey::Left: return "KEY_LEFT";
    case StandardRemoteKey::Right: return "KEY_RIGHT";
    case StandardRemoteKey::Enter: return "KEY_ENTER";
    case StandardRemoteKey::Back: return "KEY_RETURN";
    case StandardRemoteKey::Home: return "KEY_HOME";
    case StandardRemoteKey::Menu: return "KEY_MENU";
    case StandardRemoteKey::Info: return "KEY_INFO";
    case StandardRemoteKey::VolumeUp: return "KEY_VOLUP";
    case StandardRemoteKey::VolumeDown: return "KEY_VOLDOWN";
    case StandardRemoteKey::Mute: return "KEY_MUTE";
    case StandardRemoteKey::ChannelUp: return "KEY_CHUP";
    case StandardRemoteKey::ChannelDown: return "KEY_CHDOWN";
    case StandardRemoteKey::Num0: return "KEY_0";
    case StandardRemoteKey::Num1: return "KEY_1";
    case StandardRemoteKey::Num2: return "KEY_2";
    case StandardRemoteKey::Num3: return "KEY_3";
    case StandardRemoteKey::Num4: return "KEY_4";
    case StandardRemoteKey::Num5: return "KEY_5";
    case StandardRemoteKey::Num6: return "KEY_6";
    case StandardRemoteKey::Num7: return "KEY_7";
    case StandardRemoteKey::Num8: return "KEY_8";
    case StandardRemoteKey::Num9: return "KEY_9";
    case StandardRemoteKey::Play: return "KEY_PLAY";
    case StandardRemoteKey::Pause: return "KEY_PAUSE";
    case StandardRemoteKey::Stop: return "KEY_STOP";
    case StandardRemoteKey::Rewind: return "KEY_REWIND";
    case StandardRemoteKey::FastForward: return "KEY_FF";
    }
    return nullptr;
}

bool CharToSamsungKey(char character, std::string& keyCode)
{
    if (character >= 'a' && character <= 'z')
    {
        character = static_cast<char>(character - 'a' + 'A');
    }

    if ((character >= 'A' && character <= 'Z') || (character >= '0' && character <= '9'))
    {
        keyCode = std::string("KEY_") + character;
        return true;
    }

    if (character == ' ')
    {
        keyCode = "KEY_SPACE";
        return true;
    }
    return false;
}
