#include "radariq/radariq_driver.hpp"

#include <stdexcept>

#include <std_msgs/Header.h>

#include "radariq/Object.h"
#include "radariq/ObjectArray.h"
#include "radariq/Point.h"
#include "radariq/PointArray.h"
#include "radariq/security.hpp"
#include "radariq/units.hpp"

namespace radariq {

namespace {
constexpr std::chrono::milliseconds READOUT_WAIT{100};

std::string stringParam(const ros::NodeHandle& pnh, const std::string& name, const std::string& def) {
    std::string value;
    pnh.param<std::string>(name, value, def);
    return value;
}
}  // namespace

DriverConfig loadDriverConfig(const ros::NodeHandle& pnh) {
    DriverConfig c;

    pnh.param<std::string>("serial_port", c.serial_port, c.serial_port);
    c.capture_mode = parseCaptureMode(stringParam(pnh, "capture_mode", "point_cloud"));

    pnh.param<int>("frame_rate", c.frame_rate, c.frame_rate);
    if (c.frame_rate < 0 || c.frame_rate > 20) {
        throw std::invalid_argument("frame_rate must be between 0 and 20, got: "
                                    + std::to_string(c.frame_rate));
    }

    pnh.param<std::string>("distance_units", c.distance_units, c.distance_units);
    pnh.param<std::string>("speed_units", c.speed_units, c.speed_units);
    pnh.param<std::string>("acceleration_units", c.acceleration_units, c.acceleration_units);
    if (!units::isValidDistanceUnit(c.distance_units)) {
        throw std::invalid_argument("Unknown distance_units: '" + c.distance_units + "'");
    }
    if (!units::isValidSpeedUnit(c.speed_units)) {
        throw std::invalid_argument("Unknown speed_units: '" + c.speed_units + "'");
    }
    if (!units::isValidAccelerationUnit(c.acceleration_units)) {
        throw std::invalid_argument("Unknown acceleration_units: '" + c.acceleration_units + "'");
    }

    pnh.param<double>("distance_min", c.distance_min, c.distance_min);
    pnh.param<double>("distance_max", c.distance_max, c.distance_max);
    pnh.param<int>("angle_min", c.angle_min, c.angle_min);
    pnh.param<int>("angle_max", c.angle_max, c.angle_max);

    c.moving_filter = parseMovingFilter(stringParam(pnh, "moving_filter", "both"));
    c.point_density = parsePointDensity(stringParam(pnh, "point_density", "normal"));
    pnh.param<int>("sensitivity", c.sensitivity, c.sensitivity);

    pnh.param<bool>("enable_height_filter", c.enable_height_filter, c.enable_height_filter);
    pnh.param<double>("height_min", c.height_min, c.height_min);
    pnh.param<double>("height_max", c.height_max, c.height_max);
    c.object_type_mode = parseObjectType(stringParam(pnh, "object_type_mode", "person"));

    pnh.param<bool>("mirror", c.mirror, c.mirror);

    pnh.param<int>("queue_length", c.queue_length, c.queue_length);
    if (c.queue_length < 0) {
        throw std::invalid_argument("queue_length must not be negative, got: "
                                    + std::to_string(c.queue_length));
    }
    pnh.param<int>("samples", c.samples, c.samples);
    if (c.samples < 0 || c.samples > 255) {
        throw std::invalid_argument("samples must be between 0 and 255, got: "
                                    + std::to_string(c.samples));
    }

    pnh.param<std::string>("frame_id", c.frame_id, c.frame_id);
    pnh.param<bool>("auto_start", c.auto_start, c.auto_start);
    return c;
}

RadarIQDriver::RadarIQDriver(ros::NodeHandle& nh, ros::NodeHandle& pnh)
    : nh_(nh)
    , pnh_(pnh)
{
    config_ = loadDriverConfig(pnh_);

    if (!config_.serial_port.empty()) {
        auto port_result = security::validateSerialPort(config_.serial_port);
        if (!port_result.ok) {
            ROS_ERROR("%s", port_result.message.c_str());
            throw std::runtime_error("Serial port validation failed: " + port_result.message);
        }
        auto perm_result = security::checkPermissions(config_.serial_port);
        if (!perm_result.ok) {
            ROS_ERROR("%s", perm_result.message.c_str());
            throw std::runtime_error("Serial port permission check failed: " + perm_result.message);
        }
    }

    RadarIQ::Options options;
    options.port = config_.serial_port;
    options.output_format = OutputFormat::List;
    options.queue_length = static_cast<size_t>(config_.queue_length);
    options.connection_status_callback = [this](ConnectionStatus status) { onConnectionStatus(status); };
    sensor_ = std::make_unique<RadarIQ>(options);

    configureSensor();

    point_cloud_pub_ = nh_.advertise<radariq::PointArray>("/radariq/point_cloud", 10);
    objects_pub_ = nh_.advertise<radariq::ObjectArray>("/radariq/objects", 10);
    control_sub_ = nh_.subscribe("/radariq/control", 10, &RadarIQDriver::controlCallback, this);

    if (config_.auto_start) {
        start(config_.samples);
    } else {
        ROS_INFO("Waiting for start command on /radariq/control (command: 1)...");
    }
}

RadarIQDriver::~RadarIQDriver() {
    stop();
    sensor_->close();
    ROS_INFO("RadarIQ driver shut down cleanly.");
}

void RadarIQDriver::configureSensor() {
    SensorVersion version = sensor_->getVersion();
    ROS_INFO("RadarIQ serial %s, firmware %s, hardware %s",
             sensor_->getSerialNumber().c_str(),
             toString(version.firmware).c_str(),
             toString(version.hardware).c_str());

    sensor_->setUnits(config_.distance_units, config_.speed_units, config_.acceleration_units);
    sensor_->setMirror(config_.mirror);
    sensor_->setMode(config_.capture_mode);
    sensor_->setFrameRate(config_.frame_rate);
    sensor_->setDistanceFilter(config_.distance_min, config_.distance_max);
    sensor_->setAngleFilter(config_.angle_min, config_.angle_max);
    sensor_->setMovingFilter(config_.moving_filter);
    sensor_->setSensitivity(config_.sensitivity);

    if (config_.capture_mode == CaptureMode::PointCloud) {
        sensor_->setPointDensity(config_.point_density);
    } else {
        sensor_->setObjectTypeMode(config_.object_type_mode);
    }
    if (config_.enable_height_filter) {
        sensor_->setHeightFilter(config_.height_min, config_.height_max);
    }

    ROS_INFO("Mode %s at %d fps, distance %.2f..%.2f %s, angle %d..%d deg",
             toString(config_.capture_mode).c_str(), config_.frame_rate,
             config_.distance_min, config_.distance_max, config_.distance_units.c_str(),
             config_.angle_min, config_.angle_max);
}

void RadarIQDriver::controlCallback(const radariq::Control::ConstPtr& msg) {
    auto ctrl_result = security::validateControlMessage(msg->command, msg->samples);
    if (!ctrl_result.ok) {
        ROS_WARN("%s", ctrl_result.message.c_str());
        return;
    }

    if (msg->command == security::CONTROL_STOP) {
        stop();
        return;
    }

    // Only starts are rate limited, a stop always goes through
    auto rate_result = security::rateLimitCheck(last_control_time_, MIN_CONTROL_INTERVAL_SEC);
    if (!rate_result.ok) {
        ROS_WARN("%s", rate_result.message.c_str());
        return;
    }
    start(msg->samples);
}

void RadarIQDriver::onConnectionStatus(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected:
            ROS_WARN("RadarIQ disconnected, capture interrupted.");
            break;
        case ConnectionStatus::Reconnected:
            ROS_INFO("RadarIQ reconnected. Send a start command to resume capture.");
            break;
        case ConnectionStatus::Fatal:
            ROS_ERROR("RadarIQ could not be reconnected, shutting down.");
            ros::requestShutdown();
            break;
        case ConnectionStatus::Connected:
            break;
    }
}

void RadarIQDriver::start(int samples) {
    std::lock_guard<std::mutex> lock(control_mutex_);

    if (running_.load()) {
        ROS_WARN("RadarIQ is already capturing.");
        return;
    }
    if (readout_thread_.joinable()) {
        readout_thread_.join();  // previous fixed-length capture
    }

    try {
        sensor_->start(samples);
        running_.store(true);
        readout_thread_ = std::thread(&RadarIQDriver::readoutLoop, this);
        ROS_INFO("Capture started, publishing on %s",
                 config_.capture_mode == CaptureMode::PointCloud ? "/radariq/point_cloud"
                                                                 : "/radariq/objects");
    } catch (const std::exception& e) {
        ROS_ERROR("Failed to start RadarIQ capture: %s", e.what());
    }
}

void RadarIQDriver::stop() {
    std::lock_guard<std::mutex> lock(control_mutex_);

    running_.store(false);
    if (readout_thread_.joinable()) {
        readout_thread_.join();
    }

    try {
        sensor_->stop();
    } catch (const std::exception& e) {
        ROS_ERROR("Failed to stop RadarIQ capture: %s", e.what());
        return;
    }
    ROS_INFO("Capture stopped.");
}

void RadarIQDriver::readoutLoop() {
    while (running_.load() && ros::ok()) {
        std::optional<Frame> frame = sensor_->getData(READOUT_WAIT);
        if (!frame) {
            if (!sensor_->isCapturing()) {
                ROS_INFO("Capture finished.");
                break;
            }
            continue;
        }

        try {
            publish(*frame);
        } catch (const std::exception& e) {
            ROS_ERROR_THROTTLE(5.0, "Error publishing frame: %s", e.what());
        }
    }
    running_.store(false);
}

void RadarIQDriver::publish(const Frame& frame) {
    std_msgs::Header header;
    header.stamp = ros::Time::now();
    header.frame_id = config_.frame_id;

    if (frame.mode == CaptureMode::PointCloud) {
        radariq::PointArray msg;
        msg.header = header;
        msg.distance_units = config_.distance_units;
        msg.speed_units = config_.speed_units;
        msg.points.reserve(frame.points.size());
        for (const auto& p : frame.points) {
            radariq::Point point;
            point.x = p.x;
            point.y = p.y;
            point.z = p.z;
            point.intensity = p.intensity;
            point.velocity = p.velocity;
            msg.points.push_back(point);
        }
        point_cloud_pub_.publish(msg);
        return;
    }

    radariq::ObjectArray msg;
    msg.header = header;
    msg.distance_units = config_.distance_units;
    msg.speed_units = config_.speed_units;
    msg.acceleration_units = config_.acceleration_units;
    msg.objects.reserve(frame.objects.size());
    for (const auto& o : frame.objects) {
        radariq::Object object;
        object.tracking_id = o.tracking_id;
        object.x_pos = o.x_pos;
        object.y_pos = o.y_pos;
        object.z_pos = o.z_pos;
        object.x_vel = o.x_vel;
        object.y_vel = o.y_vel;
        object.z_vel = o.z_vel;
        object.x_acc = o.x_acc;
        object.y_acc = o.y_acc;
        object.z_acc = o.z_acc;
        msg.objects.push_back(object);
    }
    objects_pub_.publish(msg);
}

}  // namespace radariq
