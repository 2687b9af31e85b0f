#include "radariq/security.hpp"

#include <grp.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "radariq/errors.hpp"

namespace radariq {
namespace security {

namespace {
constexpr const char* DEV_PREFIX = "/dev/";
constexpr const char* DEFAULT_SERIAL_GROUP = "dialout";
constexpr int32_t MAX_SAMPLES = 255;

ValidationResult ok() {
    return {true, {}};
}

ValidationResult fail(const std::string& msg) {
    return {false, msg};
}

bool underDev(const std::string& path) {
    return path.compare(0, std::strlen(DEV_PREFIX), DEV_PREFIX) == 0;
}

/// Group owning the device node, or the usual serial group if it cannot be looked up.
std::string owningGroup(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return DEFAULT_SERIAL_GROUP;
    }
    struct group grp;
    struct group* found = nullptr;
    char buf[1024];
    if (getgrgid_r(st.st_gid, &grp, buf, sizeof(buf), &found) != 0 || found == nullptr) {
        return DEFAULT_SERIAL_GROUP;
    }
    return found->gr_name;
}
}  // namespace

ValidationResult validateSerialPort(const std::string& path) {
    if (!underDev(path)) {
        return fail("Serial port path must be under /dev/: " + path);
    }
    if (path.find("..") != std::string::npos) {
        return fail("Serial port path contains '..': " + path);
    }

    char resolved[PATH_MAX];
    if (realpath(path.c_str(), resolved) == nullptr) {
        return fail("Serial port does not exist: " + path + " (" + errnoMessage(errno) + ")");
    }
    std::string target(resolved);
    if (!underDev(target)) {
        return fail("Serial port " + path + " resolves outside /dev/: " + target);
    }

    struct stat st;
    if (stat(target.c_str(), &st) != 0) {
        return fail("Cannot stat serial port " + target + " (" + errnoMessage(errno) + ")");
    }
    if (!S_ISCHR(st.st_mode)) {
        return fail("Path is not a character device: " + target);
    }
    return ok();
}

ValidationResult checkPermissions(const std::string& path) {
    if (access(path.c_str(), R_OK | W_OK) != 0) {
        std::string reason = errnoMessage(errno);
        return fail("Insufficient permissions for " + path + " (" + reason + "). Add the user to the '"
                    + owningGroup(path) + "' group or install a udev rule for the RadarIQ module.");
    }
    return ok();
}

ValidationResult validateControlMessage(int32_t command, int32_t samples) {
    if (command == CONTROL_STOP) {
        return ok();
    }
    if (command != CONTROL_START) {
        return fail("Invalid control message command=" + std::to_string(command)
                    + ", expected 0 (stop) or 1 (start). Ignoring.");
    }
    if (samples < 0 || samples > MAX_SAMPLES) {
        return fail("Invalid control message samples=" + std::to_string(samples)
                    + ", expected 0 (continuous) to 255. Ignoring.");
    }
    return ok();
}

ValidationResult rateLimitCheck(ros::WallTime& last_time, double min_interval_sec) {
    ros::WallTime now = ros::WallTime::now();
    if (last_time.isZero()) {
        last_time = now;
        return ok();
    }

    double elapsed = (now - last_time).toSec();
    if (elapsed < min_interval_sec) {
        char buf[128];
        snprintf(buf, sizeof(buf), "Control message rate limited: %.2fs since the last one, %.2fs required",
                 elapsed, min_interval_sec);
        return fail(buf);
    }

    last_time = now;
    return ok();
}

}  // namespace security
}  // namespace radariq
