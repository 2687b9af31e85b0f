#ifndef RADARIQ_ERRORS_HPP
#define RADARIQ_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace radariq {

/// A command exchange with the sensor failed (timeout, bad response, ...).
class RadarError : public std::runtime_error {
public:
    explicit RadarError(const std::string& what) : std::runtime_error(what) {}
};

/// The serial transport failed or the device went away.
class SerialError : public std::runtime_error {
public:
    explicit SerialError(const std::string& what) : std::runtime_error(what) {}
};

/// Thread-safe strerror for the given errno value.
std::string errnoMessage(int errnum);

}  // namespace radariq

#endif  // RADARIQ_ERRORS_HPP
