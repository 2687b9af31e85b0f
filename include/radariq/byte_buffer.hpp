#ifndef RADARIQ_BYTE_BUFFER_HPP
#define RADARIQ_BYTE_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace radariq {

/// Little-endian reader over a decoded packet.
/// Throws std::out_of_range when reading past the end.
class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data, size_t offset = 0)
        : data_(data), pos_(offset) {}

    uint8_t readU8() {
        require(1);
        return data_[pos_++];
    }

    int8_t readI8() { return static_cast<int8_t>(readU8()); }

    uint16_t readU16() {
        require(2);
        uint16_t value = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return value;
    }

    int16_t readI16() { return static_cast<int16_t>(readU16()); }

    uint32_t readU32() {
        require(4);
        uint32_t value = static_cast<uint32_t>(data_[pos_])
                         | (static_cast<uint32_t>(data_[pos_ + 1]) << 8)
                         | (static_cast<uint32_t>(data_[pos_ + 2]) << 16)
                         | (static_cast<uint32_t>(data_[pos_ + 3]) << 24);
        pos_ += 4;
        return value;
    }

    /// Fixed-width string field; trailing NULs are stripped.
    std::string readString(size_t width) {
        require(width);
        std::string value(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                          data_.begin() + static_cast<std::ptrdiff_t>(pos_ + width));
        pos_ += width;
        size_t end = value.find_last_not_of('\0');
        value.erase(end == std::string::npos ? 0 : end + 1);
        return value;
    }

    /// Everything left in the packet, as text.
    std::string readRemainingString() { return readString(remaining()); }

    size_t remaining() const { return data_.size() - pos_; }
    size_t position() const { return pos_; }

private:
    void require(size_t count) const {
        if (pos_ + count > data_.size()) {
            throw std::out_of_range("Packet too short: need " + std::to_string(pos_ + count)
                                    + " bytes, have " + std::to_string(data_.size()));
        }
    }

    const std::vector<uint8_t>& data_;
    size_t pos_;
};

/// Little-endian writer used to build command payloads.
class ByteWriter {
public:
    ByteWriter& u8(uint8_t value) {
        data_.push_back(value);
        return *this;
    }

    ByteWriter& i8(int8_t value) { return u8(static_cast<uint8_t>(value)); }

    ByteWriter& u16(uint16_t value) {
        data_.push_back(static_cast<uint8_t>(value & 0xFF));
        data_.push_back(static_cast<uint8_t>(value >> 8));
        return *this;
    }

    ByteWriter& i16(int16_t value) { return u16(static_cast<uint16_t>(value)); }

    ByteWriter& u32(uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            data_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
        return *this;
    }

    const std::vector<uint8_t>& bytes() const { return data_; }
    std::vector<uint8_t> release() { return std::move(data_); }

private:
    std::vector<uint8_t> data_;
};

}  // namespace radariq

#endif  // RADARIQ_BYTE_BUFFER_HPP
