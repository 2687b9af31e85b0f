#ifndef RADARIQ_PACKET_CODEC_HPP
#define RADARIQ_PACKET_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace radariq {
namespace codec {

static constexpr uint8_t PACKET_HEAD = 0xB0;
static constexpr uint8_t PACKET_FOOT = 0xB1;
static constexpr uint8_t PACKET_ESC = 0xB2;
static constexpr uint8_t PACKET_XOR = 0x04;

/// Upper bound of an encoded packet on the wire.
static constexpr size_t MAX_ENCODED_LENGTH = 255;

/// Raised for packets that fail framing, escaping or the CRC check.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

/// CRC-16/CCITT (polynomial 0x1021, initial value 0xFFFF).
uint16_t crc16Ccitt(const uint8_t* data, size_t length);
uint16_t crc16Ccitt(const std::vector<uint8_t>& data);

/// Append the CRC, escape reserved bytes and wrap in header/footer.
/// Throws std::length_error if the result exceeds MAX_ENCODED_LENGTH.
std::vector<uint8_t> encode(const std::vector<uint8_t>& payload);

/// Reverse of encode(). Returns the payload without CRC.
/// Throws DecodeError on bad framing or CRC mismatch.
std::vector<uint8_t> decode(const std::vector<uint8_t>& packet);

std::string toHex(const std::vector<uint8_t>& data);

/// Splits a raw serial byte stream into HEAD ... FOOT packets.
///
/// A packet runs from the last header seen before a footer up to and
/// including that footer. Bytes in front of it are noise and are dropped.
class PacketFramer {
public:
    /// Drop buffered bytes once this many accumulate without a footer.
    static constexpr size_t MAX_BUFFERED = 64 * 1024;

    void feed(const uint8_t* data, size_t length);

    /// Extract the next complete packet. Returns false if none is buffered.
    bool next(std::vector<uint8_t>& packet);

    size_t buffered() const { return buffer_.size(); }
    void clear() { buffer_.clear(); }

private:
    std::vector<uint8_t> buffer_;
};

}  // namespace codec
}  // namespace radariq

#endif  // RADARIQ_PACKET_CODEC_HPP
