#ifndef RADARIQ_FRAME_ASSEMBLER_HPP
#define RADARIQ_FRAME_ASSEMBLER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "radariq/protocol.hpp"
#include "radariq/types.hpp"

namespace radariq {

/// Builds frames out of point cloud / object subframes.
///
/// Raw sensor values (mm, mm/s, mm/s^2) are converted to the configured
/// units and optionally mirrored in X. A frame is complete when a subframe
/// flagged end-of-frame arrives.
class FrameAssembler {
public:
    /// Configuration for the assembler.
    struct Config {
        std::string distance_units = "m";
        std::string speed_units = "m/s";
        std::string acceleration_units = "m/s^2";
        bool mirror = false;
        OutputFormat output_format = OutputFormat::List;
    };

    FrameAssembler() = default;
    explicit FrameAssembler(const Config& config) { init(config); }

    // Non-copyable, movable
    FrameAssembler(const FrameAssembler&) = delete;
    FrameAssembler& operator=(const FrameAssembler&) = delete;
    FrameAssembler(FrameAssembler&&) = default;
    FrameAssembler& operator=(FrameAssembler&&) = default;

    /// Apply a new configuration and drop any partial frame.
    /// Throws std::invalid_argument for unknown units.
    void init(const Config& config);

    /// Feed one data packet (point cloud or object subframe).
    /// Returns true and fills `frame` when the packet completes a frame.
    /// Throws codec::DecodeError for malformed packets.
    bool process(const std::vector<uint8_t>& payload, Frame& frame);

    /// Drop the partially assembled frame.
    void reset();

    const Config& config() const { return config_; }
    size_t pending() const { return partial_.size(); }

    /// Convert a list-form frame to its matrix form.
    static Eigen::MatrixXd toArray(const Frame& frame);

private:
    void addPoints(const std::vector<protocol::RawPoint>& raw);
    void addObjects(const std::vector<protocol::RawObject>& raw);

    Config config_;
    Frame partial_;
    bool has_partial_ = false;
};

}  // namespace radariq

#endif  // RADARIQ_FRAME_ASSEMBLER_HPP
