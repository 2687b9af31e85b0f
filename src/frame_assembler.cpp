#include "radariq/frame_assembler.hpp"

#include <stdexcept>
#include <utility>

#include "radariq/units.hpp"

namespace radariq {

namespace {
constexpr double MILLI = 1000.0;
}  // namespace

void FrameAssembler::init(const Config& config) {
    if (!units::isValidDistanceUnit(config.distance_units)) {
        throw std::invalid_argument("Invalid units for distance conversion");
    }
    if (!units::isValidSpeedUnit(config.speed_units)) {
        throw std::invalid_argument("Invalid units for speed conversion");
    }
    if (!units::isValidAccelerationUnit(config.acceleration_units)) {
        throw std::invalid_argument("Invalid units for acceleration conversion");
    }
    config_ = config;
    reset();
}

void FrameAssembler::reset() {
    partial_ = Frame();
    has_partial_ = false;
}

bool FrameAssembler::process(const std::vector<uint8_t>& payload, Frame& frame) {
    protocol::SubframeHeader header = protocol::parseSubframeHeader(payload);
    CaptureMode mode = header.command == protocol::CMD_POINT_CLOUD_DATA
                           ? CaptureMode::PointCloud
                           : CaptureMode::ObjectTracking;

    // Parse before touching state so a bad packet leaves the partial frame intact.
    if (mode == CaptureMode::PointCloud) {
        std::vector<protocol::RawPoint> raw = protocol::parsePoints(payload);
        if (has_partial_ && partial_.mode != mode) {
            reset();
        }
        partial_.mode = mode;
        addPoints(raw);
    } else {
        std::vector<protocol::RawObject> raw = protocol::parseObjects(payload);
        if (has_partial_ && partial_.mode != mode) {
            reset();
        }
        partial_.mode = mode;
        addObjects(raw);
    }
    has_partial_ = true;

    if (header.type != protocol::SUBFRAME_END_OF_FRAME) {
        return false;
    }

    frame = std::move(partial_);
    if (config_.output_format == OutputFormat::Array) {
        frame.array = toArray(frame);
        frame.points.clear();
        frame.objects.clear();
    }
    reset();
    return true;
}

void FrameAssembler::addPoints(const std::vector<protocol::RawPoint>& raw) {
    const double mirror = config_.mirror ? -1.0 : 1.0;
    const std::string& du = config_.distance_units;

    partial_.points.reserve(partial_.points.size() + raw.size());
    for (const auto& p : raw) {
        PointCloudPoint point;
        point.x = mirror * units::convertDistanceFromSi(du, p.x / MILLI);
        point.y = units::convertDistanceFromSi(du, p.y / MILLI);
        point.z = units::convertDistanceFromSi(du, p.z / MILLI);
        point.intensity = p.intensity;
        point.velocity = units::convertSpeedFromSi(config_.speed_units, p.velocity / MILLI);
        partial_.points.push_back(point);
    }
}

void FrameAssembler::addObjects(const std::vector<protocol::RawObject>& raw) {
    const double mirror = config_.mirror ? -1.0 : 1.0;
    const std::string& du = config_.distance_units;
    const std::string& su = config_.speed_units;
    const std::string& au = config_.acceleration_units;

    partial_.objects.reserve(partial_.objects.size() + raw.size());
    for (const auto& o : raw) {
        TrackedObject obj;
        obj.tracking_id = o.tracking_id;
        obj.x_pos = mirror * units::convertDistanceFromSi(du, o.position[0] / MILLI);
        obj.y_pos = units::convertDistanceFromSi(du, o.position[1] / MILLI);
        obj.z_pos = units::convertDistanceFromSi(du, o.position[2] / MILLI);
        obj.x_vel = mirror * units::convertSpeedFromSi(su, o.velocity[0] / MILLI);
        obj.y_vel = units::convertSpeedFromSi(su, o.velocity[1] / MILLI);
        obj.z_vel = units::convertSpeedFromSi(su, o.velocity[2] / MILLI);
        obj.x_acc = mirror * units::convertAccelerationFromSi(au, o.acceleration[0] / MILLI);
        obj.y_acc = units::convertAccelerationFromSi(au, o.acceleration[1] / MILLI);
        obj.z_acc = units::convertAccelerationFromSi(au, o.acceleration[2] / MILLI);
        partial_.objects.push_back(obj);
    }
}

Eigen::MatrixXd FrameAssembler::toArray(const Frame& frame) {
    if (frame.mode == CaptureMode::PointCloud) {
        Eigen::MatrixXd data(static_cast<Eigen::Index>(frame.points.size()), POINT_CLOUD_COLUMNS);
        for (size_t i = 0; i < frame.points.size(); ++i) {
            const auto& p = frame.points[i];
            data.row(static_cast<Eigen::Index>(i))
                << p.x, p.y, p.z, static_cast<double>(p.intensity), p.velocity;
        }
        return data;
    }

    Eigen::MatrixXd data(static_cast<Eigen::Index>(frame.objects.size()), OBJECT_TRACKING_COLUMNS);
    for (size_t i = 0; i < frame.objects.size(); ++i) {
        const auto& o = frame.objects[i];
        data.row(static_cast<Eigen::Index>(i))
            << static_cast<double>(o.tracking_id), o.x_pos, o.y_pos, o.z_pos,
               o.x_vel, o.y_vel, o.z_vel, o.x_acc, o.y_acc, o.z_acc;
    }
    return data;
}

}  // namespace radariq
