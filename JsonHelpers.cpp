#include "JsonHelpers.h"

#include <cctype>
#include <cstdio>

namespace
{
    void SkipWhitespace(const std::string& json, size_t& position)
    {
        while (position < json.size()
            && std::isspace(static_cast<unsigned char>(json[position])))
        {
            ++position;
        }
    }

    // Advances past a quoted string starting at position.
    bool SkipString(const std::string& json, size_t& position)
    {
        if (position >= json.size() || json[position] != '"')
        {
            return false;
        }

        ++position;
        while (position < json.size())
        {
            char character = json[position];
            if (character == '\\')
            {
                position += 2;
                continue;
            }
            ++position;
            if (character == '"')
            {
                return true;
            }
        }
        return false;
    }

    bool SkipValue(const std::string& json, size_t& position)
    {
        if (position >= json.size())
        {
            return false;
        }

        char first = json[position];
        if (first == '"')
        {
            return SkipString(json, position);
        }

        if (first == '{' || first == '[')
        {
            int depth = 0;
            while (position < json.size())
            {
                char character = json[position];
                if (character == '"')
                {
                    if (!SkipString(json, position))
                    {
                        return false;
                    }
                    continue;
                }
                if (character == '{' || character == '[')
                {
                    ++depth;
                }
                else if (character == '}' || character == ']')
                {
                    --depth;
                    if (depth == 0)
                    {
                        ++position;
                        return true;
                    }
                }
                ++position;
            }
            return false;
        }

        size_t start = position;
        while (position < json.size())
        {
            char character = json[position];
            if (character == ',' || character == '}' || character == ']'
                || std::isspace(static_cast<unsigned char>(character)))
            {
                break;
            }
            ++position;
        }
        return position > start;
    }

    void AppendUtf8(std::string& output, unsigned int codePoint)
    {
        if (codePoint < 0x80)
        {
            output.push_back(static_cast<char>(codePoint));
        }
        else if (codePoint < 0x800)
        {
            output.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
            output.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        }
        else
        {
            output.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
            output.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
            output.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        }
    }

    // Decodes the quoted string starting at position into value.
    bool ReadString(const std::string& json, size_t& position, std::string& value)
    {
        if (position >= json.size() || json[position] != '"')
        {
            return false;
        }

        value.clear();
        ++position;
        while (position < json.size())
        {
            char character = json[position++];
            if (character == '"')
            {
                return true;
            }
            if (character != '\\')
            {
                value.push_back(character);
                continue;
            }
            if (position >= json.size())
            {
                return false;
            }

            char escaped = json[position++];
            switch (escaped)
            {
            case 'b':
                value.push_back('\b');
                break;
            case 'f':
                value.push_back('\f');
                break;
            case 'n':
                value.push_back('\n');
                break;
            case 'r':
                value.push_back('\r');
                break;
            case 't':
                value.push_back('\t');
                break;
            case 'u':
            {
                if (position + 4 > json.size())
                {
                    return false;
                }
                unsigned int codePoint = 0;
                for (size_t index = 0; index < 4; ++index)
                {
                    char digit = json[position + index];
                    codePoint <<= 4;
                    if (digit >= '0' && digit <= '9')
                    {
                        codePoint |= static_cast<unsigned int>(digit - '0');
                    }
                    else if (digit >= 'a' && digit <= 'f')
                    {
                        codePoint |= static_cast<unsigned int>(digit - 'a' + 10);
                    }
                    else if (digit >= 'A' && digit <= 'F')
                    {
                        codePoint |= static_cast<unsigned int>(digit - 'A' + 10);
                    }
                    else
                    {
                        return false;
                    }
                }
                position += 4;
                AppendUtf8(value, codePoint);
                break;
            }
            default:
                value.push_back(escaped);
                break;
            }
        }
        return false;
    }
}

bool FindMember(const std::string& json, const std::string& key, std::string& rawValue)
{
    size_t position = 0;
    SkipWhitespace(json, position);
    if (position >= json.size() || json[position] != '{')
    {
        return false;
    }
    ++position;

    std::string memberName;
    while (position < json.size())
    {
        SkipWhitespace(json, position);
        if (position < json.size() && json[position] == '}')
        {
            return false;
        }

        if (!ReadString(json, position, memberName))
        {
            return false;
        }

        SkipWhitespace(json, position);
        if (position >= json.size() || json[position] != ':')
        {
            return false;
        }
        ++position;
        SkipWhitespace(json, position);

        size_t valueStart = position;
        if (!SkipValue(json, position))
        {
            return false;
        }

        if (memberName == key)
        {
            rawValue = json.substr(valueStart, position - valueStart);
            return true;
        }

        SkipWhitespace(json, position);
        if (position < json.size() && json[position] == ',')
        {
            ++position;
            continue;
        }
        return false;
    }
    return false;
}

bool GetStringMember(const std::string& json, const std::string& key, std::string& value)
{
    std::string raw;
    if (!FindMember(json, key, raw) || raw.empty() || raw[0] != '"')
    {
        return false;
    }

    size_t position = 0;
    return ReadString(raw, position, value);
}

bool GetObjectMember(const std::string& json, const std::string& key, std::string& objectJson)
{
    std::string raw;
    if (!FindMember(json, key, raw) || raw.empty() || raw[0] != '{')
    {
        return false;
    }

    objectJson = raw;
    return true;
}

std::string GetMemberText(const std::string& json, const std::string& key)
{
    std::string raw;
    if (!FindMember(json, key, raw) || raw == "null")
    {
        return {};
    }

    if (!raw.empty() && raw[0] == '"')
    {
        std::string value;
        size_t position = 0;
        return ReadString(raw, position, value) ? value : std::string();
    }
    return raw;
}

std::string FindStringFieldAnywhere(const std::string& json, const std::string& key)
{
    const std::string token = "\"" + key + "\"";
    size_t position = json.find(token);
    while (position != std::string::npos)
    {
        size_t cursor = position + token.size();
        SkipWhitespace(json, cursor);
        if (cursor < json.size() && json[cursor] == ':')
        {
            ++cursor;
            SkipWhitespace(json, cursor);

            std::string value;
            if (ReadString(json, cursor, value))
            {
                return value;
            }
        }
        position = json.find(token, position + token.size());
    }
    return {};
}

std::string EscapeJsonString(const std::string& value)
{
    std::string escaped;
    escaped.reserve(value.size() + 8);

    for (char character : value)
    {
        switch (character)
        {
        case '"':
            escaped += "\\\"";
            break;
        case '\\':
            escaped += "\\\\";
            break;
        case '\n':
            escaped += "\\n";
            break;
        case '\r':
            escaped += "\\r";
            break;
        case '\t':
            escaped += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(character) < 0x20)
            {
                char buffer[8]{};
                std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(character));
                escaped += buffer;
            }
            else
            {
                escaped.push_back(character);
            }
            break;
        }
    }
    return escaped;
}
