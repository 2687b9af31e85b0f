#ifndef RADARIQ_PORT_MANAGER_HPP
#define RADARIQ_PORT_MANAGER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace radariq {

/// USB identifiers of the RadarIQ-M1 module.
static constexpr uint16_t USB_VID = 5840;
static constexpr uint16_t USB_PID = 3797;

static constexpr const char* SYSFS_TTY_ROOT = "/sys/class/tty";
static constexpr const char* DEV_ROOT = "/dev";

/// A USB serial port as seen in sysfs.
struct PortInfo {
    std::string device;  // e.g. /dev/ttyACM0
    std::string name;    // e.g. ttyACM0
    uint16_t vid = 0;
    uint16_t pid = 0;
    std::string manufacturer;
    std::string product;
    std::string serial_number;
};

/// All tty devices backed by a USB device, sorted by name.
std::vector<PortInfo> listSerialPorts(const std::string& sysfs_root = SYSFS_TTY_ROOT,
                                      const std::string& dev_root = DEV_ROOT);

bool isRadarIQ(const PortInfo& port);

/// RadarIQ modules which are not currently in use, or every RadarIQ module
/// if `all_ports` is set. Throws RadarError if none is found.
std::vector<PortInfo> findComPorts(bool all_ports = false,
                                   const std::string& sysfs_root = SYSFS_TTY_ROOT,
                                   const std::string& dev_root = DEV_ROOT);

/// The first available RadarIQ module. Throws RadarError if none is found.
PortInfo findComPort(const std::string& sysfs_root = SYSFS_TTY_ROOT,
                     const std::string& dev_root = DEV_ROOT);

}  // namespace radariq

#endif  // RADARIQ_PORT_MANAGER_HPP
