#ifndef RADARIQ_POSIX_SERIAL_HPP
#define RADARIQ_POSIX_SERIAL_HPP

#include <atomic>
#include <string>

#include "radariq/serial_transport.hpp"

namespace radariq {

/// termios implementation of the SerialTransport interface (raw 8N1).
class PosixSerial : public SerialTransport {
public:
    PosixSerial() = default;
    ~PosixSerial() override;

    // Non-copyable
    PosixSerial(const PosixSerial&) = delete;
    PosixSerial& operator=(const PosixSerial&) = delete;

    void open(const std::string& port, uint32_t baud_rate) override;
    void close() noexcept override;
    bool isOpen() const override { return fd_.load() >= 0; }
    void write(const std::vector<uint8_t>& data) override;
    size_t read(uint8_t* buffer, size_t size, std::chrono::milliseconds timeout) override;
    void flushInput() override;

private:
    std::atomic<int> fd_{-1};
    std::string port_;
};

}  // namespace radariq

#endif  // RADARIQ_POSIX_SERIAL_HPP
