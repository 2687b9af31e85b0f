#ifndef RADARIQ_RADARIQ_DRIVER_HPP
#define RADARIQ_RADARIQ_DRIVER_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <ros/ros.h>

#include "radariq/Control.h"
#include "radariq/radar_iq.hpp"

namespace radariq {

/// Driver parameters, read from the node's private namespace.
struct DriverConfig {
    std::string serial_port;  // empty = auto-detect
    CaptureMode capture_mode = CaptureMode::PointCloud;
    int frame_rate = 5;
    std::string distance_units = "m";
    std::string speed_units = "m/s";
    std::string acceleration_units = "m/s^2";
    double distance_min = 0.0;
    double distance_max = 10.0;
    int angle_min = -55;
    int angle_max = 55;
    MovingFilter moving_filter = MovingFilter::Both;
    PointDensity point_density = PointDensity::Normal;
    int sensitivity = 5;
    bool enable_height_filter = false;
    double height_min = -10.0;
    double height_max = 10.0;
    ObjectType object_type_mode = ObjectType::Person;
    bool mirror = false;
    int queue_length = 2;
    int samples = 0;
    std::string frame_id = "radariq";
    bool auto_start = true;
};

/// Load and check DriverConfig. Throws std::invalid_argument on bad values.
DriverConfig loadDriverConfig(const ros::NodeHandle& pnh);

class RadarIQDriver {
public:
    RadarIQDriver(ros::NodeHandle& nh, ros::NodeHandle& pnh);
    ~RadarIQDriver();

    // Non-copyable, non-movable
    RadarIQDriver(const RadarIQDriver&) = delete;
    RadarIQDriver& operator=(const RadarIQDriver&) = delete;

private:
    void configureSensor();
    void controlCallback(const radariq::Control::ConstPtr& msg);
    void onConnectionStatus(ConnectionStatus status);
    void readoutLoop();
    void publish(const Frame& frame);
    void start(int samples);
    void stop();

    // Device
    std::unique_ptr<RadarIQ> sensor_;
    std::mutex control_mutex_;
    std::atomic<bool> running_{false};
    std::thread readout_thread_;

    // ROS
    ros::NodeHandle nh_;
    ros::NodeHandle pnh_;
    ros::Subscriber control_sub_;
    ros::Publisher point_cloud_pub_;
    ros::Publisher objects_pub_;

    DriverConfig config_;

    // Security
    ros::WallTime last_control_time_;
    static constexpr double MIN_CONTROL_INTERVAL_SEC = 1.0;
};

}  // namespace radariq

#endif  // RADARIQ_RADARIQ_DRIVER_HPP
