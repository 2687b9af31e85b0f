#include "radariq/posix_serial.hpp"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include "radariq/errors.hpp"

namespace radariq {

namespace {
speed_t toSpeed(uint32_t baud_rate) {
    switch (baud_rate) {
        case 9600:    return B9600;
        case 19200:   return B19200;
        case 38400:   return B38400;
        case 57600:   return B57600;
        case 115200:  return B115200;
        case 230400:  return B230400;
        case 460800:  return B460800;
        case 921600:  return B921600;
        default:
            throw SerialError("Unsupported baud rate: " + std::to_string(baud_rate));
    }
}
}  // namespace

PosixSerial::~PosixSerial() {
    close();
}

void PosixSerial::open(const std::string& port, uint32_t baud_rate) {
    close();

    speed_t speed = toSpeed(baud_rate);
    int fd = ::open(port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        std::string err = errnoMessage(errno);
        throw SerialError("Could not open " + port + ": " + err);
    }

    struct termios tty;
    std::memset(&tty, 0, sizeof(tty));
    if (tcgetattr(fd, &tty) != 0) {
        std::string err = errnoMessage(errno);
        ::close(fd);
        throw SerialError("tcgetattr failed on " + port + ": " + err);
    }

    cfmakeraw(&tty);
    cfsetospeed(&tty, speed);
    cfsetispeed(&tty, speed);
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~CSIZE;
    tty.c_cflag |= CS8;
    tty.c_cflag &= ~PARENB;
    tty.c_cflag &= ~CSTOPB;
    tty.c_cflag &= ~CRTSCTS;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tty) != 0) {
        std::string err = errnoMessage(errno);
        ::close(fd);
        throw SerialError("tcsetattr failed on " + port + ": " + err);
    }

    port_ = port;
    fd_.store(fd);
}

void PosixSerial::close() noexcept {
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

void PosixSerial::write(const std::vector<uint8_t>& data) {
    size_t written = 0;
    while (written < data.size()) {
        int fd = fd_.load();
        if (fd < 0) {
            throw SerialError("Serial port is not open");
        }
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            struct pollfd pfd{fd, POLLOUT, 0};
            ::poll(&pfd, 1, 100);
            continue;
        }
        throw SerialError("Write to " + port_ + " failed: " + errnoMessage(errno));
    }
}

size_t PosixSerial::read(uint8_t* buffer, size_t size, std::chrono::milliseconds timeout) {
    int fd = fd_.load();
    if (fd < 0) {
        throw SerialError("Serial port is not open");
    }

    struct pollfd pfd{fd, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return 0;
        }
        throw SerialError("poll on " + port_ + " failed: " + errnoMessage(errno));
    }
    if (ready == 0) {
        return 0;
    }
    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
        throw SerialError("Serial device " + port_ + " disconnected");
    }

    ssize_t n = ::read(fd, buffer, size);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return 0;
        }
        throw SerialError("Read from " + port_ + " failed: " + errnoMessage(errno));
    }
    if (n == 0) {
        // Readable but no data: the tty has gone away.
        throw SerialError("Serial device " + port_ + " disconnected");
    }
    return static_cast<size_t>(n);
}

void PosixSerial::flushInput() {
    int fd = fd_.load();
    if (fd >= 0) {
        tcflush(fd, TCIFLUSH);
    }
}

}  // namespace radariq
