#ifndef RADARIQ_SECURITY_HPP
#define RADARIQ_SECURITY_HPP

#include <cstdint>
#include <string>

#include <ros/ros.h>

namespace radariq {
namespace security {

/// Values of the `command` field of radariq/Control.
static constexpr int32_t CONTROL_STOP = 0;
static constexpr int32_t CONTROL_START = 1;

/// Outcome of a check; the caller logs `message` at whatever level fits.
struct ValidationResult {
    bool ok;
    std::string message;
};

/// Accepts only character devices under /dev/. Symlinks such as
/// /dev/serial/by-id/... are resolved and must land on a device under /dev/.
/// Paths containing ".." are refused.
ValidationResult validateSerialPort(const std::string& path);

/// Read and write access for the current user. On failure the message names
/// the group that owns the device.
ValidationResult checkPermissions(const std::string& path);

/// Command must be CONTROL_STOP or CONTROL_START. A start carries a sample
/// count between 0 (continuous) and 255; a stop ignores it.
ValidationResult validateControlMessage(int32_t command, int32_t samples);

/// Passes when at least `min_interval_sec` of wall time has gone by since
/// `last_time`, and then moves `last_time` to now.
ValidationResult rateLimitCheck(ros::WallTime& last_time, double min_interval_sec);

}  // namespace security
}  // namespace radariq

#endif  // RADARIQ_SECURITY_HPP
