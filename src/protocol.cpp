#include "radariq/protocol.hpp"

#include "radariq/byte_buffer.hpp"
#include "radariq/packet_codec.hpp"

namespace radariq {
namespace protocol {

namespace {
void expectHeader(const std::vector<uint8_t>& payload, uint8_t command, const char* what) {
    if (!isResponse(payload, command)) {
        throw codec::DecodeError(std::string("Not a ") + what + " packet: " + codec::toHex(payload));
    }
}

/// Run a parse step, turning a short read into a DecodeError.
template <typename Fn>
auto guarded(const std::vector<uint8_t>& payload, const char* what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::out_of_range& e) {
        throw codec::DecodeError(std::string("Truncated ") + what + " packet ("
                                 + e.what() + "): " + codec::toHex(payload));
    }
}
}  // namespace

std::vector<uint8_t> request(uint8_t command, uint8_t variant, const std::vector<uint8_t>& args) {
    std::vector<uint8_t> payload;
    payload.reserve(args.size() + 2);
    payload.push_back(command);
    payload.push_back(variant);
    payload.insert(payload.end(), args.begin(), args.end());
    return payload;
}

bool isResponse(const std::vector<uint8_t>& payload, uint8_t command) {
    return payload.size() >= 2 && payload[0] == command && payload[1] == VARIANT_RESPONSE;
}

bool isMessage(const std::vector<uint8_t>& payload) {
    return !payload.empty() && payload[0] == CMD_MESSAGE;
}

bool isStatistics(const std::vector<uint8_t>& payload) {
    return isResponse(payload, CMD_CORE_STATISTICS)
           || isResponse(payload, CMD_POINT_CLOUD_STATISTICS);
}

bool isDataPacket(const std::vector<uint8_t>& payload) {
    return isResponse(payload, CMD_POINT_CLOUD_DATA) || isResponse(payload, CMD_OBJECT_DATA);
}

SensorMessage parseMessage(const std::vector<uint8_t>& payload) {
    expectHeader(payload, CMD_MESSAGE, "message");
    return guarded(payload, "message", [&] {
        ByteReader reader(payload, 2);
        SensorMessage msg;
        msg.type = reader.readU8();
        msg.code = reader.readU8();
        msg.text = reader.readRemainingString();
        return msg;
    });
}

MessageLevel messageLevel(uint8_t type) {
    switch (type) {
        case 0:
        case 1:
            return MessageLevel::Debug;
        case 3:
            return MessageLevel::Warning;
        case 4:
            return MessageLevel::Error;
        default:
            return MessageLevel::Info;
    }
}

CoreStatistics parseCoreStatistics(const std::vector<uint8_t>& payload) {
    expectHeader(payload, CMD_CORE_STATISTICS, "core statistics");
    return guarded(payload, "core statistics", [&] {
        ByteReader reader(payload, 2);
        CoreStatistics s;
        s.active_frame_cpu = reader.readU32();
        s.inter_frame_cpu = reader.readU32();
        s.inter_frame_proc_time = reader.readU32();
        s.transmit_output_time = reader.readU32();
        s.inter_frame_proc_margin = reader.readU32();
        s.inter_chirp_proc_margin = reader.readU32();
        s.packet_transmit_time = reader.readU32();
        s.temperature_sensor_0 = reader.readI16();
        s.temperature_sensor_1 = reader.readI16();
        s.temperature_power_management = reader.readI16();
        s.temperature_rx_0 = reader.readI16();
        s.temperature_rx_1 = reader.readI16();
        s.temperature_rx_2 = reader.readI16();
        s.temperature_rx_3 = reader.readI16();
        s.temperature_tx_0 = reader.readI16();
        s.temperature_tx_1 = reader.readI16();
        s.temperature_tx_2 = reader.readI16();
        return s;
    });
}

PointCloudStatistics parsePointCloudStatistics(const std::vector<uint8_t>& payload) {
    expectHeader(payload, CMD_POINT_CLOUD_STATISTICS, "point cloud statistics");
    return guarded(payload, "point cloud statistics", [&] {
        ByteReader reader(payload, 2);
        PointCloudStatistics s;
        s.points_aggregation_time = reader.readU32();
        s.intensity_sort_time = reader.readU32();
        s.nearest_neighbours_time = reader.readU32();
        s.uart_transmission_time = reader.readU32();
        s.filter_points_removed = reader.readU32();
        s.num_transmitted_points = reader.readU32();
        s.input_points_truncated_flag = reader.readU8();
        s.output_points_truncated_flag = reader.readU8();
        return s;
    });
}

SubframeHeader parseSubframeHeader(const std::vector<uint8_t>& payload) {
    if (!isDataPacket(payload)) {
        throw codec::DecodeError("Not a data packet: " + codec::toHex(payload));
    }
    return guarded(payload, "subframe", [&] {
        ByteReader reader(payload, 2);
        SubframeHeader header;
        header.command = payload[0];
        header.type = reader.readU8();
        header.count = reader.readU8();
        return header;
    });
}

std::vector<RawPoint> parsePoints(const std::vector<uint8_t>& payload) {
    SubframeHeader header = parseSubframeHeader(payload);
    if (header.command != CMD_POINT_CLOUD_DATA) {
        throw codec::DecodeError("Not a point cloud packet: " + codec::toHex(payload));
    }
    if (payload.size() < 4 + header.count * POINT_RECORD_SIZE) {
        throw codec::DecodeError("Truncated point cloud packet (" + std::to_string(header.count)
                                 + " points): " + codec::toHex(payload));
    }
    return guarded(payload, "point cloud", [&] {
        ByteReader reader(payload, 4);
        std::vector<RawPoint> points;
        points.reserve(header.count);
        for (uint8_t i = 0; i < header.count; ++i) {
            RawPoint p;
            p.x = reader.readI16();
            p.y = reader.readI16();
            p.z = reader.readI16();
            p.intensity = reader.readU8();
            p.velocity = reader.readI16();
            points.push_back(p);
        }
        return points;
    });
}

std::vector<RawObject> parseObjects(const std::vector<uint8_t>& payload) {
    SubframeHeader header = parseSubframeHeader(payload);
    if (header.command != CMD_OBJECT_DATA) {
        throw codec::DecodeError("Not an object packet: " + codec::toHex(payload));
    }
    if (payload.size() < 4 + header.count * OBJECT_RECORD_SIZE) {
        throw codec::DecodeError("Truncated object packet (" + std::to_string(header.count)
                                 + " objects): " + codec::toHex(payload));
    }
    return guarded(payload, "object", [&] {
        ByteReader reader(payload, 4);
        std::vector<RawObject> objects;
        objects.reserve(header.count);
        for (uint8_t i = 0; i < header.count; ++i) {
            RawObject o;
            o.tracking_id = reader.readI8();
            for (int16_t& v : o.position) v = reader.readI16();
            for (int16_t& v : o.velocity) v = reader.readI16();
            for (int16_t& v : o.acceleration) v = reader.readI16();
            objects.push_back(o);
        }
        return objects;
    });
}

}  // namespace protocol
}  // namespace radariq
