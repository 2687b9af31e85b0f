// Captures point cloud data by polling getFrame() instead of waiting in getData().
// Frames are printed as rows of the Array output format.

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <ros/console.h>

#include "radariq/radar_iq.hpp"

namespace {
std::atomic<bool> interrupted{false};

void onSignal(int) {
    interrupted.store(true);
}
}  // namespace

int main() {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try {
        radariq::RadarIQ::Options options;
        options.output_format = radariq::OutputFormat::Array;

        radariq::RadarIQ riq(options);
        riq.setMode(radariq::CaptureMode::PointCloud);
        riq.setUnits("m", "m/s");
        riq.setFrameRate(5);
        riq.setDistanceFilter(0, 10);
        riq.setAngleFilter(-45, 45);
        riq.start();

        while (!interrupted.load() && riq.isCapturing()) {
            auto frame = riq.getFrame();
            if (!frame) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                continue;
            }
            std::cout << "x y z intensity velocity\n" << frame->array << "\n\n";
        }
        riq.stop();
    } catch (const std::exception& e) {
        ROS_ERROR("%s", e.what());
        return 1;
    }
    return 0;
}
