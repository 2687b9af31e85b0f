#include "radariq/types.hpp"

#include <stdexcept>

namespace radariq {

namespace {
std::invalid_argument unknown(const char* what, const std::string& name) {
    return std::invalid_argument(std::string("Unknown ") + what + ": '" + name + "'");
}
}  // namespace

std::string toString(CaptureMode mode) {
    switch (mode) {
        case CaptureMode::PointCloud:     return "point_cloud";
        case CaptureMode::ObjectTracking: return "object_tracking";
    }
    return "unknown";
}

std::string toString(MovingFilter filter) {
    switch (filter) {
        case MovingFilter::Both:        return "both";
        case MovingFilter::ObjectsOnly: return "objects_only";
    }
    return "unknown";
}

std::string toString(PointDensity density) {
    switch (density) {
        case PointDensity::Normal:    return "normal";
        case PointDensity::Dense:     return "dense";
        case PointDensity::VeryDense: return "very_dense";
    }
    return "unknown";
}

std::string toString(ObjectType type) {
    switch (type) {
        case ObjectType::Dog:         return "dog";
        case ObjectType::Person:      return "person";
        case ObjectType::Cyclist:     return "cyclist";
        case ObjectType::SlowVehicle: return "slow_vehicle";
        case ObjectType::FastVehicle: return "fast_vehicle";
    }
    return "unknown";
}

std::string toString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Reconnected:  return "reconnected";
        case ConnectionStatus::Fatal:        return "fatal";
    }
    return "unknown";
}

std::string toString(const VersionNumber& version) {
    return std::to_string(version.major) + "." + std::to_string(version.minor)
           + "." + std::to_string(version.build);
}

CaptureMode parseCaptureMode(const std::string& name) {
    if (name == "point_cloud") return CaptureMode::PointCloud;
    if (name == "object_tracking") return CaptureMode::ObjectTracking;
    throw unknown("capture mode", name);
}

MovingFilter parseMovingFilter(const std::string& name) {
    if (name == "both") return MovingFilter::Both;
    if (name == "objects_only") return MovingFilter::ObjectsOnly;
    throw unknown("moving filter", name);
}

PointDensity parsePointDensity(const std::string& name) {
    if (name == "normal") return PointDensity::Normal;
    if (name == "dense") return PointDensity::Dense;
    if (name == "very_dense") return PointDensity::VeryDense;
    throw unknown("point density", name);
}

ObjectType parseObjectType(const std::string& name) {
    if (name == "dog") return ObjectType::Dog;
    if (name == "person") return ObjectType::Person;
    if (name == "cyclist") return ObjectType::Cyclist;
    if (name == "slow_vehicle") return ObjectType::SlowVehicle;
    if (name == "fast_vehicle") return ObjectType::FastVehicle;
    throw unknown("object type", name);
}

OutputFormat parseOutputFormat(const std::string& name) {
    if (name == "list") return OutputFormat::List;
    if (name == "array") return OutputFormat::Array;
    throw unknown("output format", name);
}

}  // namespace radariq
