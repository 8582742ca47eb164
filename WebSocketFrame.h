#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class IByteStream;

enum class WebSocketOpcode : std::uint8_t
{
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

struct WebSocketFrame
{
    bool fin = true;
    WebSocketOpcode opcode = WebSocketOpcode::Text;
    bool masked = false;
    std::array<std::uint8_t, 4> maskKey{};
    std::vector<std::uint8_t> payload;
};

enum class FrameDecodeResult
{
    Complete,
    Incomplete,
    TooLarge,
    Invalid,
};

// Largest payload accepted from the peer unless configured otherwise.
constexpr size_t DefaultMaxFramePayload = 1024 * 1024;

// Bounds-checked big-endian reader over a byte buffer.
class ByteReader
{
public:
    ByteReader(const std::uint8_t* data, size_t size);

    size_t Remaining() const;
    size_t Position() const;

    bool ReadU8(std::uint8_t& value);
    bool ReadU16(std::uint16_t& value);
    bool ReadU64(std::uint64_t& value);
    bool ReadBytes(std::uint8_t* destination, size_t count);

private:
    const std::uint8_t* data;
    size_t size;
    size_t position;
};

// Encodes a single FIN frame masked with the given key.
std::vector<std::uint8_t> EncodeFrame(
    WebSocketOpcode opcode,
    const std::uint8_t* payload,
    size_t length,
    const std::array<std::uint8_t, 4>& maskKey);

// Encodes a masked text frame using a fresh random mask key.
std::vector<std::uint8_t> EncodeTextFrame(const std::string& text);

// Encodes a masked control frame (ping, pong, close) with a random mask key.
std::vector<std::uint8_t> EncodeControlFrame(WebSocketOpcode opcode, const std::vector<std::uint8_t>& payload);

// Returns four bytes from a random source for frame masking.
std::array<std::uint8_t, 4> GenerateMaskKey();

// XORs data in place with mask[i % 4].
void ApplyMask(std::uint8_t* data, size_t length, const std::array<std::uint8_t, 4>& maskKey);

// Decodes one frame from the front of a buffer. On Complete, consumed holds the
// frame size and the payload is already unmasked.
FrameDecodeResult DecodeFrame(
    const std::uint8_t* data,
    size_t size,
    size_t maxPayload,
    WebSocketFrame& frame,
    size_t& consumed);

// Reads one frame from a stream; false on I/O failure or a malformed header.
bool ReadFrame(IByteStream& stream, size_t maxPayload, WebSocketFrame& frame);

bool IsControlOpcode(WebSocketOpcode opcode);
