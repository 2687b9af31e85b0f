#ifndef RADARIQ_UNITS_HPP
#define RADARIQ_UNITS_HPP

#include <string>

namespace radariq {
namespace units {

/// Conversion between SI units (m, m/s, m/s^2) and the user-selectable units.
///
/// Distance:     "mm", "cm", "m", "km", "in", "ft", "mi"
/// Speed:        "mm/s", "cm/s", "m/s", "km/h", "in/s", "ft/s", "mi/h"
/// Acceleration: "mm/s^2", "cm/s^2", "m/s^2", "in/s^2", "ft/s^2"
///
/// All results are rounded to 4 significant figures.
/// Unknown units throw std::invalid_argument.

double convertDistanceToSi(const std::string& units, double distance);
double convertDistanceFromSi(const std::string& units, double distance);

double convertSpeedToSi(const std::string& units, double speed);
double convertSpeedFromSi(const std::string& units, double speed);

double convertAccelerationToSi(const std::string& units, double acceleration);
double convertAccelerationFromSi(const std::string& units, double acceleration);

bool isValidDistanceUnit(const std::string& units);
bool isValidSpeedUnit(const std::string& units);
bool isValidAccelerationUnit(const std::string& units);

/// Round x to `sig` significant figures. roundSig(0) == 0.
double roundSig(double x, int sig = 4);

}  // namespace units
}  // namespace radariq

#endif  // RADARIQ_UNITS_HPP
