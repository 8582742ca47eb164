#include "StringUtilities.h"

#include <cctype>

namespace
{
    const char Base64Alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}

std::string Base64Encode(const std::uint8_t* data, size_t size)
{
    std::string encoded;
    encoded.reserve(((size + 2) / 3) * 4);

    size_t index = 0;
    while (index + 3 <= size)
    {
        std::uint32_t triple =
            (static_cast<std::uint32_t>(data[index]) << 16)
            | (static_cast<std::uint32_t>(data[index + 1]) << 8)
            | static_cast<std::uint32_t>(data[index + 2]);
        encoded.push_back(Base64Alphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(Base64Alphabet[(triple >> 12) & 0x3F]);
        encoded.push_back(Base64Alphabet[(triple >> 6) & 0x3F]);
        encoded.push_back(Base64Alphabet[triple & 0x3F]);
        index += 3;
    }

    size_t remaining = size - index;
    if (remaining == 1)
    {
        std::uint32_t triple = static_cast<std::uint32_t>(data[index]) << 16;
        encoded.push_back(Base64Alphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(Base64Alphabet[(triple >> 12) & 0x3F]);
        encoded += "==";
    }
    else if (remaining == 2)
    {
        std::uint32_t triple =
            (static_cast<std::uint32_t>(data[index]) << 16)
            | (static_cast<std::uint32_t>(data[index + 1]) << 8);
        encoded.push_back(Base64Alphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(Base64Alphabet[(triple >> 12) & 0x3F]);
        encoded.push_back(Base64Alphabet[(triple >> 6) & 0x3F]);
        encoded.push_back('=');
    }

    return encoded;
}

std::string Base64Encode(const std::string& text)
{
    return Base64Encode(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

std::string ToLowerAscii(const std::string& value)
{
    std::string result(value);
    for (char& character : result)
    {
        character = static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
    }
    return result;
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle)
{
    return ToLowerAscii(haystack).find(ToLowerAscii(needle)) != std::string::npos;
}

std::string ExtractXmlElement(const std::string& xml, const std::string& name)
{
    const std::string openTag = "<" + name + ">";
    const std::string closeTag = "</" + name + ">";

    size_t start = xml.find(openTag);
    if (start == std::string::npos)
    {
        return {};
    }
    start += openTag.size();

    size_t end = xml.find(closeTag, start);
    if (end == std::string::npos)
    {
        return {};
    }

    return xml.substr(start, end - start);
}

std::string GetHttpHeaderValue(const std::string& message, const std::string& name)
{
    const std::string wanted = ToLowerAscii(name) + ":";

    size_t lineStart = 0;
    while (lineStart < message.size())
    {
        size_t lineEnd = message.find('\n', lineStart);
        if (lineEnd == std::string::npos)
        {
            lineEnd = message.size();
        }

        std::string line = message.substr(lineStart, lineEnd - lineStart);
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }

        if (line.size() >= wanted.size() && ToLowerAscii(line.substr(0, wanted.size())) == wanted)
        {
            size_t valueStart = line.find_first_not_of(" \t", wanted.size());
            if (valueStart == std::string::npos)
            {
                return {};
            }
            size_t valueEnd = line.find_last_not_of(" \t");
            return line.substr(valueStart, valueEnd - valueStart + 1);
        }

        lineStart = lineEnd + 1;
    }
    return {};
}
