#include "radariq/packet_codec.hpp"

#include <algorithm>
#include <cstdio>

#include <ros/ros.h>

namespace radariq {
namespace codec {

namespace {
bool isReserved(uint8_t byte) {
    return byte == PACKET_HEAD || byte == PACKET_FOOT || byte == PACKET_ESC;
}
}  // namespace

uint16_t crc16Ccitt(const uint8_t* data, size_t length) {
    uint16_t crc = 0xFFFF;
    for (size_t i = 0; i < length; ++i) {
        crc ^= static_cast<uint16_t>(data[i]) << 8;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 0x8000) ? static_cast<uint16_t>((crc << 1) ^ 0x1021)
                                 : static_cast<uint16_t>(crc << 1);
        }
    }
    return crc;
}

uint16_t crc16Ccitt(const std::vector<uint8_t>& data) {
    return crc16Ccitt(data.data(), data.size());
}

std::string toHex(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve(data.size() * 2);
    char buf[3];
    for (uint8_t byte : data) {
        snprintf(buf, sizeof(buf), "%02x", byte);
        out += buf;
    }
    return out;
}

std::vector<uint8_t> encode(const std::vector<uint8_t>& payload) {
    uint16_t crc = crc16Ccitt(payload);

    std::vector<uint8_t> body(payload);
    body.push_back(static_cast<uint8_t>(crc >> 8));
    body.push_back(static_cast<uint8_t>(crc & 0xFF));

    std::vector<uint8_t> packet;
    packet.reserve(body.size() * 2 + 2);
    packet.push_back(PACKET_HEAD);
    for (uint8_t byte : body) {
        if (isReserved(byte)) {
            packet.push_back(PACKET_ESC);
            packet.push_back(static_cast<uint8_t>(byte ^ PACKET_XOR));
        } else {
            packet.push_back(byte);
        }
    }
    packet.push_back(PACKET_FOOT);

    if (packet.size() > MAX_ENCODED_LENGTH) {
        throw std::length_error("Encoded packet is " + std::to_string(packet.size())
                                + " bytes, greater than the maximum of "
                                + std::to_string(MAX_ENCODED_LENGTH));
    }
    return packet;
}

std::vector<uint8_t> decode(const std::vector<uint8_t>& packet) {
    if (packet.empty() || packet.front() != PACKET_HEAD) {
        throw DecodeError("First byte of the packet is not a header byte: " + toHex(packet));
    }
    if (packet.back() != PACKET_FOOT) {
        throw DecodeError("Last byte of the packet is not a footer byte: " + toHex(packet));
    }

    std::vector<uint8_t> body;
    body.reserve(packet.size());
    for (size_t i = 0; i + 1 < packet.size(); ++i) {
        uint8_t byte = packet[i];
        if (byte == PACKET_HEAD) {
            continue;
        }
        if (byte == PACKET_ESC) {
            if (i + 2 >= packet.size()) {
                throw DecodeError("Dangling escape byte: " + toHex(packet));
            }
            body.push_back(static_cast<uint8_t>(packet[++i] ^ PACKET_XOR));
        } else {
            body.push_back(byte);
        }
    }

    if (body.size() < 2) {
        throw DecodeError("Failed to extract CRC: " + toHex(packet));
    }

    uint16_t rx_crc = static_cast<uint16_t>((body[body.size() - 2] << 8) | body[body.size() - 1]);
    body.resize(body.size() - 2);
    if (crc16Ccitt(body) != rx_crc) {
        throw DecodeError("CRC check failed: " + toHex(packet));
    }
    return body;
}

void PacketFramer::feed(const uint8_t* data, size_t length) {
    buffer_.insert(buffer_.end(), data, data + length);
    if (buffer_.size() > MAX_BUFFERED
        && std::find(buffer_.begin(), buffer_.end(), PACKET_FOOT) == buffer_.end()) {
        ROS_WARN("Discarding %zu buffered bytes with no packet footer", buffer_.size());
        buffer_.clear();
    }
}

bool PacketFramer::next(std::vector<uint8_t>& packet) {
    size_t start = 0;
    for (size_t i = 0; i < buffer_.size(); ++i) {
        if (buffer_[i] == PACKET_HEAD) {
            start = i;
        } else if (buffer_[i] == PACKET_FOOT) {
            packet.assign(buffer_.begin() + static_cast<std::ptrdiff_t>(start),
                          buffer_.begin() + static_cast<std::ptrdiff_t>(i + 1));
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(i + 1));
            return true;
        }
    }
    return false;
}

}  // namespace codec
}  // namespace radariq
