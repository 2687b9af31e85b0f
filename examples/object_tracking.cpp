// Receives object tracking frames until interrupted.

#include <atomic>
#include <csignal>
#include <cstdio>

#include <ros/console.h>

#include "radariq/radar_iq.hpp"

namespace {
std::atomic<bool> interrupted{false};

void onSignal(int) {
    interrupted.store(true);
}

void printFrame(const radariq::Frame& frame) {
    std::printf("frame: %zu objects\n", frame.objects.size());
    for (const auto& o : frame.objects) {
        std::printf("  id=%d pos=(%.3f, %.3f, %.3f) vel=(%.3f, %.3f, %.3f) acc=(%.3f, %.3f, %.3f)\n",
                    o.tracking_id, o.x_pos, o.y_pos, o.z_pos,
                    o.x_vel, o.y_vel, o.z_vel, o.x_acc, o.y_acc, o.z_acc);
    }
}
}  // namespace

int main() {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try {
        radariq::RadarIQ riq;
        riq.setMode(radariq::CaptureMode::ObjectTracking);
        riq.setUnits("m", "m/s");
        riq.setFrameRate(5);
        riq.setDistanceFilter(0, 10);
        riq.setAngleFilter(-45, 45);
        riq.start();

        while (!interrupted.load() && riq.isCapturing()) {
            if (auto frame = riq.getData()) {
                printFrame(*frame);
            }
        }
        riq.stop();
    } catch (const std::exception& e) {
        ROS_ERROR("%s", e.what());
        return 1;
    }
    return 0;
}
