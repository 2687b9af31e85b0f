#include "radariq/units.hpp"

#include <cmath>
#include <map>
#include <stdexcept>

namespace radariq {
namespace units {

namespace {
// Conversion factors: user units per SI unit.
const std::map<std::string, double> kDistanceFactors = {
    {"mm", 1000.0},
    {"cm", 100.0},
    {"m", 1.0},
    {"km", 1.0 / 1000.0},
    {"in", 39.3701},
    {"ft", 3.28084},
    {"mi", 1.0 / 1609.344},
};

const std::map<std::string, double> kSpeedFactors = {
    {"mm/s", 1000.0},
    {"cm/s", 100.0},
    {"m/s", 1.0},
    {"km/h", 3.6},
    {"in/s", 39.3701},
    {"ft/s", 3.28084},
    {"mi/h", 2.237},
};

const std::map<std::string, double> kAccelerationFactors = {
    {"mm/s^2", 1000.0},
    {"cm/s^2", 100.0},
    {"m/s^2", 1.0},
    {"in/s^2", 39.3701},
    {"ft/s^2", 3.28084},
};

double factorFor(const std::map<std::string, double>& table,
                 const std::string& units, const char* quantity) {
    auto it = table.find(units);
    if (it == table.end()) {
        throw std::invalid_argument(std::string("Invalid units for ") + quantity + " conversion");
    }
    return it->second;
}
}  // namespace

double roundSig(double x, int sig) {
    if (x == 0.0) {
        return 0.0;
    }
    if (!std::isfinite(x)) {
        return x;
    }
    int digits = sig - static_cast<int>(std::floor(std::log10(std::fabs(x)))) - 1;
    // Scale with an exact power of ten on whichever side keeps it integral.
    if (digits >= 0) {
        double scale = std::pow(10.0, digits);
        return std::round(x * scale) / scale;
    }
    double scale = std::pow(10.0, -digits);
    return std::round(x / scale) * scale;
}

double convertDistanceToSi(const std::string& units, double distance) {
    return roundSig(distance / factorFor(kDistanceFactors, units, "distance"));
}

double convertDistanceFromSi(const std::string& units, double distance) {
    return roundSig(distance * factorFor(kDistanceFactors, units, "distance"));
}

double convertSpeedToSi(const std::string& units, double speed) {
    return roundSig(speed / factorFor(kSpeedFactors, units, "speed"));
}

double convertSpeedFromSi(const std::string& units, double speed) {
    return roundSig(speed * factorFor(kSpeedFactors, units, "speed"));
}

double convertAccelerationToSi(const std::string& units, double acceleration) {
    return roundSig(acceleration / factorFor(kAccelerationFactors, units, "acceleration"));
}

double convertAccelerationFromSi(const std::string& units, double acceleration) {
    return roundSig(acceleration * factorFor(kAccelerationFactors, units, "acceleration"));
}

bool isValidDistanceUnit(const std::string& units) {
    return kDistanceFactors.count(units) != 0;
}

bool isValidSpeedUnit(const std::string& units) {
    return kSpeedFactors.count(units) != 0;
}

bool isValidAccelerationUnit(const std::string& units) {
    return kAccelerationFactors.count(units) != 0;
}

}  // namespace units
}  // namespace radariq
