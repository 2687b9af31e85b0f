#ifndef RADARIQ_PROTOCOL_HPP
#define RADARIQ_PROTOCOL_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace radariq {
namespace protocol {

// Command identifiers (first payload byte)
static constexpr uint8_t CMD_MESSAGE = 0x00;
static constexpr uint8_t CMD_VERSION = 0x01;
static constexpr uint8_t CMD_SERIAL_NUMBER = 0x02;
static constexpr uint8_t CMD_RESET = 0x03;
static constexpr uint8_t CMD_FRAME_RATE = 0x04;
static constexpr uint8_t CMD_MODE = 0x05;
static constexpr uint8_t CMD_DISTANCE_FILTER = 0x06;
static constexpr uint8_t CMD_ANGLE_FILTER = 0x07;
static constexpr uint8_t CMD_MOVING_FILTER = 0x08;
static constexpr uint8_t CMD_SAVE = 0x09;
static constexpr uint8_t CMD_POINT_DENSITY = 0x10;
static constexpr uint8_t CMD_SENSITIVITY = 0x11;
static constexpr uint8_t CMD_HEIGHT_FILTER = 0x12;
static constexpr uint8_t CMD_RADAR_APP_VERSION = 0x14;
static constexpr uint8_t CMD_SCENE_CALIBRATION = 0x15;
static constexpr uint8_t CMD_OBJECT_TYPE_MODE = 0x16;
static constexpr uint8_t CMD_AUTO_START = 0x17;
static constexpr uint8_t CMD_CAPTURE_START = 0x64;
static constexpr uint8_t CMD_CAPTURE_STOP = 0x65;
static constexpr uint8_t CMD_POINT_CLOUD_DATA = 0x66;
static constexpr uint8_t CMD_OBJECT_DATA = 0x67;
static constexpr uint8_t CMD_CORE_STATISTICS = 0x68;
static constexpr uint8_t CMD_POINT_CLOUD_STATISTICS = 0x70;

// Variants (second payload byte)
static constexpr uint8_t VARIANT_REQUEST = 0x00;
static constexpr uint8_t VARIANT_RESPONSE = 0x01;
static constexpr uint8_t VARIANT_SET = 0x02;

// Subframe types for point cloud / object data
static constexpr uint8_t SUBFRAME_PARTIAL = 0x01;
static constexpr uint8_t SUBFRAME_END_OF_FRAME = 0x02;

static constexpr size_t APP_NAME_LENGTH = 20;

/// Encoded size of one point cloud record (i16 x, y, z, u8 intensity, i16 velocity).
static constexpr size_t POINT_RECORD_SIZE = 9;
/// Encoded size of one tracked object record (i8 id, 9 x i16).
static constexpr size_t OBJECT_RECORD_SIZE = 19;

/// Log message pushed by the sensor firmware.
struct SensorMessage {
    uint8_t type;
    uint8_t code;
    std::string text;
};

/// Level a sensor message is logged at.
enum class MessageLevel { Debug, Info, Warning, Error };

/// Timing and temperature statistics of the radar core.
struct CoreStatistics {
    uint32_t active_frame_cpu;
    uint32_t inter_frame_cpu;
    uint32_t inter_frame_proc_time;
    uint32_t transmit_output_time;
    uint32_t inter_frame_proc_margin;
    uint32_t inter_chirp_proc_margin;
    uint32_t packet_transmit_time;
    int16_t temperature_sensor_0;
    int16_t temperature_sensor_1;
    int16_t temperature_power_management;
    int16_t temperature_rx_0;
    int16_t temperature_rx_1;
    int16_t temperature_rx_2;
    int16_t temperature_rx_3;
    int16_t temperature_tx_0;
    int16_t temperature_tx_1;
    int16_t temperature_tx_2;
};

/// Point cloud processing statistics.
struct PointCloudStatistics {
    uint32_t points_aggregation_time;
    uint32_t intensity_sort_time;
    uint32_t nearest_neighbours_time;
    uint32_t uart_transmission_time;
    uint32_t filter_points_removed;
    uint32_t num_transmitted_points;
    uint8_t input_points_truncated_flag;
    uint8_t output_points_truncated_flag;
};

/// Header of a point cloud or object subframe.
struct SubframeHeader {
    uint8_t command;
    uint8_t type;
    uint8_t count;
};

/// Raw point as sent by the sensor (millimetres, mm/s).
struct RawPoint {
    int16_t x;
    int16_t y;
    int16_t z;
    uint8_t intensity;
    int16_t velocity;
};

/// Raw tracked object as sent by the sensor (mm, mm/s, mm/s^2).
struct RawObject {
    int8_t tracking_id;
    int16_t position[3];
    int16_t velocity[3];
    int16_t acceleration[3];
};

/// Build a request payload: {command, variant, args...}.
std::vector<uint8_t> request(uint8_t command, uint8_t variant,
                             const std::vector<uint8_t>& args = {});

/// True if the payload starts with {command, VARIANT_RESPONSE}.
bool isResponse(const std::vector<uint8_t>& payload, uint8_t command);

bool isMessage(const std::vector<uint8_t>& payload);
bool isStatistics(const std::vector<uint8_t>& payload);
bool isDataPacket(const std::vector<uint8_t>& payload);

// The parse functions throw codec::DecodeError on short or mismatched payloads.

SensorMessage parseMessage(const std::vector<uint8_t>& payload);
MessageLevel messageLevel(uint8_t type);

CoreStatistics parseCoreStatistics(const std::vector<uint8_t>& payload);
PointCloudStatistics parsePointCloudStatistics(const std::vector<uint8_t>& payload);

SubframeHeader parseSubframeHeader(const std::vector<uint8_t>& payload);
std::vector<RawPoint> parsePoints(const std::vector<uint8_t>& payload);
std::vector<RawObject> parseObjects(const std::vector<uint8_t>& payload);

}  // namespace protocol
}  // namespace radariq

#endif  // RADARIQ_PROTOCOL_HPP
