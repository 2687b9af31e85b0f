// Receives 10 point cloud frames and prints them.

#include <cstdio>

#include <ros/console.h>

#include "radariq/radar_iq.hpp"

namespace {
constexpr int FRAME_COUNT = 10;

void printFrame(const radariq::Frame& frame) {
    std::printf("frame: %zu points\n", frame.points.size());
    for (const auto& p : frame.points) {
        std::printf("  x=%.3f y=%.3f z=%.3f intensity=%u velocity=%.3f\n",
                    p.x, p.y, p.z, p.intensity, p.velocity);
    }
}
}  // namespace

int main() {
    try {
        radariq::RadarIQ riq;
        riq.setMode(radariq::CaptureMode::PointCloud);
        riq.setUnits("m", "m/s");
        riq.setFrameRate(5);
        riq.setDistanceFilter(0, 10);
        riq.setAngleFilter(-45, 45);
        riq.start(FRAME_COUNT);

        while (riq.isCapturing() || riq.getQueueSize() > 0) {
            if (auto frame = riq.getData()) {
                printFrame(*frame);
            }
        }
    } catch (const std::exception& e) {
        ROS_ERROR("%s", e.what());
        return 1;
    }
    return 0;
}
