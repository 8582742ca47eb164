#include "WebSocketFrame.h"

#include "NetworkStream.h"

#include <random>

namespace
{
    constexpr std::uint8_t FinBit = 0x80;
    constexpr std::uint8_t OpcodeMask = 0x0F;
    constexpr std::uint8_t MaskBit = 0x80;
    constexpr std::uint8_t LengthMask = 0x7F;
    constexpr std::uint8_t Length16Marker = 126;
    constexpr std::uint8_t Length64Marker = 127;
    constexpr size_t MaxControlPayload = 125;

    bool IsKnownOpcode(std::uint8_t value)
    {
        switch (value)
        {
        case 0x0:
        case 0x1:
        case 0x2:
        case 0x8:
        case 0x9:
        case 0xA:
            return true;
        default:
            return false;
        }
    }

    // Number of header bytes that follow the first two, given the second byte.
    size_t ExtendedHeaderSize(std::uint8_t secondByte)
    {
        size_t extra = 0;
        std::uint8_t lengthCode = secondByte & LengthMask;
        if (lengthCode == Length16Marker)
        {
            extra += 2;
        }
        else if (lengthCode == Length64Marker)
        {
            extra += 8;
        }
        if ((secondByte & MaskBit) != 0)
        {
            extra += 4;
        }
        return extra;
    }

    // Parses everything up to the payload and reports the payload length.
    FrameDecodeResult ParseHeader(
        ByteReader& reader,
        size_t maxPayload,
        WebSocketFrame& frame,
        std::uint64_t& payloadLength)
    {
        std::uint8_t firstByte = 0;
        std::uint8_t secondByte = 0;
        if (!reader.ReadU8(firstByte) || !reader.ReadU8(secondByte))
        {
            return FrameDecodeResult::Incomplete;
        }

        std::uint8_t opcodeValue = firstByte & OpcodeMask;
        if (!IsKnownOpcode(opcodeValue))
        {
            return FrameDecodeResult::Invalid;
        }

        frame.fin = (firstByte & FinBit) != 0;
        frame.opcode = static_cast<WebSocketOpcode>(opcodeValue);
        frame.masked = (secondByte & MaskBit) != 0;

        std::uint8_t lengthCode = secondByte & LengthMask;
        if (lengthCode == Length16Marker)
        {
            std::uint16_t length16 = 0;
            if (!reader.ReadU16(length16))
            {
                return FrameDecodeResult::Incomplete;
            }
            payloadLength = length16;
        }
        else if (lengthCode == Length64Marker)
        {
            std::uint64_t length64 = 0;
            if (!reader.ReadU64(length64))
            {
                return FrameDecodeResult::Incomplete;
            }
            if ((length64 >> 63) != 0)
            {
                return FrameDecodeResult::Invalid;
            }
            payloadLength = length64;
        }
        else
        {
            payloadLength = lengthCode;
        }

        if (IsControlOpcode(frame.opcode) && payloadLength > MaxControlPayload)
        {
            return FrameDecodeResult::Invalid;
        }

        if (payloadLength > maxPayload)
        {
            return FrameDecodeResult::TooLarge;
        }

        if (frame.masked && !reader.ReadBytes(frame.maskKey.data(), frame.maskKey.size()))
        {
            return FrameDecodeResult::Incomplete;
        }

        return FrameDecodeResult::Complete;
    }
}

ByteReader::ByteReader(const std::uint8_t* dataValue, size_t sizeValue)
    : data(dataValue),
    size(sizeValue),
    position(0)
{
}

size_t ByteReader::Remaining() const
{
    return size - position;
}

size_t ByteReader::Position() const
{
    return position;
}

bool ByteReader::ReadU8(std::uint8_t& value)
{
    if (Remaining() < 1)
    {
        return false;
    }
    value = data[position++];
    return true;
}

bool ByteReader::ReadU16(std::uint16_t& value)
{
    if (Remaining() < 2)
    {
        return false;
    }
    value = static_cast<std::uint16_t>((data[position] << 8) | data[position + 1]);
    position += 2;
    return true;
}

bool ByteReader::ReadU64(std::uint64_t& value)
{
    if (Remaining() < 8)
    {
        return false;
    }
    value = 0;
    for (size_t index = 0; index < 8; ++index)
    {
        value = (value << 8) | data[position + index];
    }
    position += 8;
    return true;
}

bool ByteReader::ReadBytes(std::uint8_t* destination, size_t count)
{
    if (Remaining() < count)
    {
        return false;
    }
    for (size_t index = 0; index < count; ++index)
    {
        destination[index] = data[position + index];
    }
    position += count;
    return true;
}

std::vector<std::uint8_t> EncodeFrame(
    WebSocketOpcode opcode,
    const std::uint8_t* payload,
    size_t length,
    const std::array<std::uint8_t, 4>& maskKey)
{
    std::vector<std::uint8_t> frame;
    frame.reserve(2 + 8 + 4 + length);

    frame.push_back(static_cast<std::uint8_t>(FinBit | static_cast<std::uint8_t>(opcode)));

    if (length <= 125)
    {
        frame.push_back(static_cast<std::uint8_t>(MaskBit | length));
    }
    else if (length <= 0xFFFF)
    {
        frame.push_back(MaskBit | Length16Marker);
        frame.push_back(static_cast<std::uint8_t>((length >> 8) & 0xFF));
        frame.push_back(static_cast<std::uint8_t>(length & 0xFF));
    }
    else
    {
        frame.push_back(MaskBit | Length64Marker);
        std::uint64_t length64 = static_cast<std::uint64_t>(length);
        for (int shift = 56; shift >= 0; shift -= 8)
        {
            frame.push_back(static_cast<std::uint8_t>((length64 >> shift) & 0xFF));
        }
    }

    frame.insert(frame.end(), maskKey.begin(), maskKey.end());

    size_t payloadOffset = frame.size();
    frame.insert(frame.end(), payload, payload + length);
    ApplyMask(frame.data() + payloadOffset, length, maskKey);

    return frame;
}

std::vector<std::uint8_t> EncodeTextFrame(const std::string& text)
{
    return EncodeFrame(
        WebSocketOpcode::Text,
        reinterpret_cast<const std::uint8_t*>(text.data()),
        text.size(),
        GenerateMaskKey());
}

std::vector<std::uint8_t> EncodeControlFrame(WebSocketOpcode opcode, const std::vector<std::uint8_t>& payload)
{
    size_t length = payload.size() > MaxControlPayload ? MaxControlPayload : payload.size();
    return EncodeFrame(opcode, payload.data(), length, GenerateMaskKey());
}

std::array<std::uint8_t, 4> GenerateMaskKey()
{
    thread_local std::mt19937 generator(std::random_device{}());
    std::uniform_int_distribution<unsigned int> distribution(0, 255);

    std::array<std::uint8_t, 4> maskKey{};
    for (std::uint8_t& value : maskKey)
    {
        value = static_cast<std::uint8_t>(distribution(generator));
    }
    return maskKey;
}

void ApplyMask(std::uint8_t* data, size_t length, const std::array<std::uint8_t, 4>& maskKey)
{
    for (size_t index = 0; index < length; ++index)
    {
        data[index] ^= maskKey[index % 4];
    }
}

FrameDecodeResult DecodeFrame(
    const std::uint8_t* data,
    size_t size,
    size_t maxPayload,
    WebSocketFrame& frame,
    size_t& consumed)
{
    consumed = 0;

    ByteReader reader(data, size);
    std::uint64_t payloadLength = 0;
    FrameDecodeResult header = ParseHeader(reader, maxPayload, frame, payloadLength);
    if (header != FrameDecodeResult::Complete)
    {
        return header;
    }

    if (reader.Remaining() < payloadLength)
    {
        return FrameDecodeResult::Incomplete;
    }

    frame.payload.resize(static_cast<size_t>(payloadLength));
    if (!reader.ReadBytes(frame.payload.data(), frame.payload.size()))
    {
        return FrameDecodeResult::Incomplete;
    }

    if (frame.masked)
    {
        ApplyMask(frame.payload.data(), frame.payload.size(), frame.maskKey);
    }

    consumed = reader.Position();
    return FrameDecodeResult::Complete;
}

bool ReadFrame(IByteStream& stream, size_t maxPayload, WebSocketFrame& frame)
{
    std::uint8_t header[14]{};
    if (!ReadExact(stream, header, 2))
    {
        return false;
    }

    size_t extra = ExtendedHeaderSize(header[1]);
    if (extra > 0 && !ReadExact(stream, header + 2, extra))
    {
        return false;
    }

    ByteReader reader(header, 2 + extra);
    std::uint64_t payloadLength = 0;
    if (ParseHeader(reader, maxPayload, frame, payloadLength) != FrameDecodeResult::Complete)
    {
        return false;
    }

    frame.payload.resize(static_cast<size_t>(payloadLength));
    if (payloadLength > 0 && !ReadExact(stream, frame.payload.data(), frame.payload.size()))
    {
        return false;
    }

    if (frame.masked)
    {
        ApplyMask(frame.payload.data(), frame.payload.size(), frame.maskKey);
    }
    return true;
}

bool IsControlOpcode(WebSocketOpcode opcode)
{
    return (static_cast<std::uint8_t>(opcode) & 0x08) != 0;
}
