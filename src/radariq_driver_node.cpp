#include <ros/ros.h>
#include "radariq/radariq_driver.hpp"

int main(int argc, char** argv) {
    ros::init(argc, argv, "radariq");
    ros::NodeHandle nh;
    ros::NodeHandle pnh("~");

    try {
        radariq::RadarIQDriver driver(nh, pnh);
        ros::spin();
    } catch (const std::exception& e) {
        ROS_FATAL("RadarIQ driver failed: %s", e.what());
        return 1;
    }

    return 0;
}
