#ifndef RADARIQ_TYPES_HPP
#define RADARIQ_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <Eigen/Dense>

namespace radariq {

/// Capture modes
enum class CaptureMode : uint8_t {
    PointCloud = 0,
    ObjectTracking = 1,
};

/// Moving object filter options
enum class MovingFilter : uint8_t {
    Both = 0,
    ObjectsOnly = 1,
};

/// Reset codes
enum class ResetCode : uint8_t {
    Reboot = 0,
    FactorySettings = 1,
};

/// Point densities
enum class PointDensity : uint8_t {
    Normal = 0,
    Dense = 1,
    VeryDense = 2,
};

/// Object classes used by the object type mode.
enum class ObjectType : uint8_t {
    Dog = 0,
    Person = 1,
    Cyclist = 2,
    SlowVehicle = 3,
    FastVehicle = 4,
};

/// Shape of the frames handed out by RadarIQ::getData().
enum class OutputFormat {
    List = 0,   // Frame::points / Frame::objects
    Array = 1,  // Frame::array
};

enum class ConnectionStatus {
    Connected = 0,
    Disconnected = 1,
    Reconnected = 2,
    Fatal = 3,
};

/// Single detected point in point cloud mode.
struct PointCloudPoint {
    double x;
    double y;
    double z;
    uint8_t intensity;
    double velocity;
};

/// Single tracked object in object tracking mode.
struct TrackedObject {
    int8_t tracking_id;
    double x_pos;
    double y_pos;
    double z_pos;
    double x_vel;
    double y_vel;
    double z_vel;
    double x_acc;
    double y_acc;
    double z_acc;
};

/// One frame of sensor output.
/// Only one of points/objects is filled (by mode) unless the output format
/// is Array, in which case the rows live in `array` instead.
struct Frame {
    CaptureMode mode = CaptureMode::PointCloud;
    std::vector<PointCloudPoint> points;
    std::vector<TrackedObject> objects;
    Eigen::MatrixXd array;

    size_t size() const {
        if (array.rows() > 0) {
            return static_cast<size_t>(array.rows());
        }
        return mode == CaptureMode::PointCloud ? points.size() : objects.size();
    }
    bool empty() const { return size() == 0; }
};

static constexpr int POINT_CLOUD_COLUMNS = 5;
static constexpr int OBJECT_TRACKING_COLUMNS = 10;

struct VersionNumber {
    uint8_t major;
    uint8_t minor;
    uint16_t build;
};

struct SensorVersion {
    VersionNumber firmware;
    VersionNumber hardware;
};

struct ApplicationVersion {
    std::string name;
    VersionNumber version;
};

/// Radar application firmware slots, in slot order 1..4.
struct RadarApplicationVersions {
    ApplicationVersion controller;
    ApplicationVersion application_1;
    ApplicationVersion application_2;
    ApplicationVersion application_3;
};

/// Min/max pair for the distance and height filters (in the configured units).
struct RangeFilter {
    double minimum;
    double maximum;
};

/// Min/max pair for the angle filter (degrees, 0 = centre, negative = left).
struct AngleFilter {
    int minimum;
    int maximum;
};

std::string toString(CaptureMode mode);
std::string toString(MovingFilter filter);
std::string toString(PointDensity density);
std::string toString(ObjectType type);
std::string toString(ConnectionStatus status);
std::string toString(const VersionNumber& version);

/// Parse the lower_snake_case names used in configuration files.
/// Throw std::invalid_argument on an unknown name.
CaptureMode parseCaptureMode(const std::string& name);
MovingFilter parseMovingFilter(const std::string& name);
PointDensity parsePointDensity(const std::string& name);
ObjectType parseObjectType(const std::string& name);
OutputFormat parseOutputFormat(const std::string& name);

}  // namespace radariq

#endif  // RADARIQ_TYPES_HPP
