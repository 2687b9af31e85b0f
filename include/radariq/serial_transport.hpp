#ifndef RADARIQ_SERIAL_TRANSPORT_HPP
#define RADARIQ_SERIAL_TRANSPORT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace radariq {

static constexpr uint32_t DEFAULT_BAUD_RATE = 115200;

/// Byte-level link to the sensor.
///
/// PosixSerial drives a real tty; the tests put a fake sensor behind it.
class SerialTransport {
public:
    virtual ~SerialTransport() = default;

    /// Open the port. Throws SerialError on failure.
    virtual void open(const std::string& port, uint32_t baud_rate) = 0;

    /// Close the port. Called from destructors, so it never throws.
    virtual void close() noexcept = 0;

    virtual bool isOpen() const = 0;

    /// Write all bytes. Throws SerialError if the device is gone.
    virtual void write(const std::vector<uint8_t>& data) = 0;

    /// Read up to `size` bytes, waiting at most `timeout` for the first one.
    /// Returns 0 on timeout. Throws SerialError if the device is gone.
    virtual size_t read(uint8_t* buffer, size_t size, std::chrono::milliseconds timeout) = 0;

    /// Discard anything received but not yet read.
    virtual void flushInput() = 0;
};

}  // namespace radariq

#endif  // RADARIQ_SERIAL_TRANSPORT_HPP
