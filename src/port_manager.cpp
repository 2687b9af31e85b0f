#include "radariq/port_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <ros/ros.h>

#include "radariq/errors.hpp"
#include "radariq/posix_serial.hpp"
#include "radariq/security.hpp"

namespace fs = std::filesystem;

namespace radariq {

namespace {
std::string readAttribute(const fs::path& file) {
    std::ifstream in(file);
    std::string value;
    std::getline(in, value);
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
        value.pop_back();
    }
    return value;
}

/// Walk up from the tty's device node to the USB device carrying the ids.
bool findUsbDevice(const fs::path& device, fs::path& usb_device) {
    for (fs::path p = device; !p.empty() && p != p.root_path(); p = p.parent_path()) {
        std::error_code ec;
        if (fs::exists(p / "idVendor", ec) && fs::exists(p / "idProduct", ec)) {
            usb_device = p;
            return true;
        }
    }
    return false;
}

bool parseHexId(const std::string& text, uint16_t& value) {
    try {
        size_t used = 0;
        unsigned long parsed = std::stoul(text, &used, 16);
        if (used != text.size() || parsed > 0xFFFF) {
            return false;
        }
        value = static_cast<uint16_t>(parsed);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool isAvailable(const PortInfo& port) {
    auto perm = security::checkPermissions(port.device);
    if (!perm.ok) {
        ROS_DEBUG("%s", perm.message.c_str());
        return false;
    }
    try {
        PosixSerial serial;
        serial.open(port.device, DEFAULT_BAUD_RATE);
        serial.close();
        return true;
    } catch (const SerialError& e) {
        // Probably in use
        ROS_DEBUG("Skipping %s: %s", port.device.c_str(), e.what());
        return false;
    }
}
}  // namespace

std::vector<PortInfo> listSerialPorts(const std::string& sysfs_root, const std::string& dev_root) {
    std::vector<PortInfo> ports;

    std::error_code ec;
    fs::directory_iterator it(sysfs_root, ec);
    if (ec) {
        ROS_WARN("Cannot list %s: %s", sysfs_root.c_str(), ec.message().c_str());
        return ports;
    }

    for (const auto& entry : it) {
        fs::path device_link = entry.path() / "device";
        fs::path device = fs::canonical(device_link, ec);
        if (ec) {
            continue;  // virtual tty, no backing device
        }

        fs::path usb_device;
        if (!findUsbDevice(device, usb_device)) {
            continue;
        }

        PortInfo info;
        info.name = entry.path().filename().string();
        info.device = (fs::path(dev_root) / info.name).string();
        if (!parseHexId(readAttribute(usb_device / "idVendor"), info.vid)
            || !parseHexId(readAttribute(usb_device / "idProduct"), info.pid)) {
            ROS_DEBUG("Unreadable USB ids for %s", info.name.c_str());
            continue;
        }
        info.manufacturer = readAttribute(usb_device / "manufacturer");
        info.product = readAttribute(usb_device / "product");
        info.serial_number = readAttribute(usb_device / "serial");
        ports.push_back(info);
    }

    std::sort(ports.begin(), ports.end(),
              [](const PortInfo& a, const PortInfo& b) { return a.name < b.name; });
    return ports;
}

bool isRadarIQ(const PortInfo& port) {
    return port.vid == USB_VID && port.pid == USB_PID;
}

std::vector<PortInfo> findComPorts(bool all_ports, const std::string& sysfs_root,
                                   const std::string& dev_root) {
    std::vector<PortInfo> ports;
    for (const auto& port : listSerialPorts(sysfs_root, dev_root)) {
        if (!isRadarIQ(port)) {
            continue;
        }
        if (!all_ports && !isAvailable(port)) {
            continue;
        }
        ports.push_back(port);
    }

    if (ports.empty()) {
        throw RadarError("No available RadarIQ modules detected");
    }
    return ports;
}

PortInfo findComPort(const std::string& sysfs_root, const std::string& dev_root) {
    try {
        return findComPorts(false, sysfs_root, dev_root).front();
    } catch (const RadarError&) {
        throw RadarError("No RadarIQ modules detected");
    }
}

}  // namespace radariq
