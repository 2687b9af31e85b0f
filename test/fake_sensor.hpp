#ifndef RADARIQ_TEST_FAKE_SENSOR_HPP
#define RADARIQ_TEST_FAKE_SENSOR_HPP

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "radariq/byte_buffer.hpp"
#include "radariq/errors.hpp"
#include "radariq/packet_codec.hpp"
#include "radariq/protocol.hpp"
#include "radariq/serial_transport.hpp"

namespace radariq {
namespace test {

/// State shared between a FakeSensor and the test holding it, so the test can
/// keep poking at the sensor after the transport has been handed to RadarIQ.
struct FakeSensorState {
    std::mutex mutex;
    std::condition_variable cv;

    std::vector<uint8_t> input;  // bytes waiting to be read by the host
    bool open = false;
    bool unplugged = false;
    int open_calls = 0;
    int refused_opens = 0;  // opens to fail before succeeding again

    // Sensor settings, keyed by command: the payload bytes after {cmd, variant}.
    std::map<uint8_t, std::vector<uint8_t>> settings;
    // Replies that replace the emulated one, keyed by command.
    std::map<uint8_t, std::vector<uint8_t>> overrides;
    // Commands the sensor never answers.
    std::set<uint8_t> silent;
    // Sent ahead of every reply when non-empty.
    std::vector<uint8_t> chatter;

    std::vector<std::vector<uint8_t>> received;  // every request payload
    int start_requests = 0;
    int stop_requests = 0;
    int last_samples = -1;
};

/// SerialTransport that behaves like a RadarIQ-M1 on the other end of the cable.
class FakeSensor : public SerialTransport {
public:
    explicit FakeSensor(std::shared_ptr<FakeSensorState> state) : state_(std::move(state)) {
        // Power-on defaults, unless the test already chose a value.
        auto def = [this](uint8_t command, std::vector<uint8_t> value) {
            state_->settings.emplace(command, std::move(value));
        };
        def(protocol::CMD_FRAME_RATE, {5});
        def(protocol::CMD_MODE, {0});
        def(protocol::CMD_DISTANCE_FILTER, ByteWriter().u16(0).u16(10000).release());
        def(protocol::CMD_ANGLE_FILTER, ByteWriter().i8(-55).i8(55).release());
        def(protocol::CMD_MOVING_FILTER, {0});
        def(protocol::CMD_POINT_DENSITY, {0});
        def(protocol::CMD_SENSITIVITY, {5});
        def(protocol::CMD_HEIGHT_FILTER, ByteWriter().i16(-2000).i16(2000).release());
        def(protocol::CMD_OBJECT_TYPE_MODE, {1});
        def(protocol::CMD_AUTO_START, {0});
    }

    void open(const std::string& port, uint32_t) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->open_calls;
        if (state_->refused_opens > 0) {
            --state_->refused_opens;
            throw SerialError("Cannot open " + port);
        }
        state_->open = true;
        state_->unplugged = false;
    }

    void close() noexcept override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->open = false;
        state_->cv.notify_all();
    }

    bool isOpen() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->open;
    }

    void write(const std::vector<uint8_t>& data) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->open) {
            throw SerialError("Port is not open");
        }
        framer_.feed(data.data(), data.size());
        std::vector<uint8_t> packet;
        while (framer_.next(packet)) {
            handle(codec::decode(packet));
        }
        state_->cv.notify_all();
    }

    size_t read(uint8_t* buffer, size_t size, std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_for(lock, timeout, [this] {
            return !state_->input.empty() || state_->unplugged || !state_->open;
        });
        if (state_->unplugged || !state_->open) {
            throw SerialError("Device disconnected");
        }
        size_t n = std::min(size, state_->input.size());
        if (n == 0) {
            return 0;
        }
        std::memcpy(buffer, state_->input.data(), n);
        state_->input.erase(state_->input.begin(), state_->input.begin() + static_cast<std::ptrdiff_t>(n));
        return n;
    }

    void flushInput() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->input.clear();
    }

private:
    void reply(const std::vector<uint8_t>& payload) {
        std::vector<uint8_t> packet = codec::encode(payload);
        state_->input.insert(state_->input.end(), packet.begin(), packet.end());
    }

    void respond(uint8_t command, const std::vector<uint8_t>& body) {
        if (state_->silent.count(command)) {
            return;
        }
        if (!state_->chatter.empty()) {
            reply(state_->chatter);
        }
        auto it = state_->overrides.find(command);
        if (it != state_->overrides.end()) {
            reply(it->second);
            return;
        }
        std::vector<uint8_t> payload = {command, protocol::VARIANT_RESPONSE};
        payload.insert(payload.end(), body.begin(), body.end());
        reply(payload);
    }

    void handle(const std::vector<uint8_t>& payload) {
        using namespace protocol;
        state_->received.push_back(payload);
        uint8_t command = payload.at(0);
        uint8_t variant = payload.at(1);
        std::vector<uint8_t> args(payload.begin() + 2, payload.end());

        switch (command) {
            case CMD_VERSION:
                respond(command, ByteWriter().u8(1).u8(2).u16(345).u8(3).u8(0).u16(7).release());
                return;
            case CMD_SERIAL_NUMBER:
                respond(command, ByteWriter().u32(12345).u32(678).release());
                return;
            case CMD_RADAR_APP_VERSION: {
                uint8_t slot = args.at(0);
                ByteWriter w;
                w.u8(slot);
                std::string name = "app" + std::to_string(slot);
                name.resize(APP_NAME_LENGTH, '\0');
                for (char c : name) {
                    w.u8(static_cast<uint8_t>(c));
                }
                w.u8(1).u8(slot).u16(static_cast<uint16_t>(100 + slot));
                respond(command, w.release());
                return;
            }
            case CMD_RESET:
            case CMD_SAVE:
            case CMD_SCENE_CALIBRATION:
                respond(command, {});
                return;
            case CMD_CAPTURE_START:
                ++state_->start_requests;
                state_->last_samples = args.empty() ? -1 : args[0];
                return;
            case CMD_CAPTURE_STOP:
                ++state_->stop_requests;
                return;
            default:
                break;
        }

        if (variant == VARIANT_SET) {
            state_->settings[command] = args;
        }
        respond(command, state_->settings[command]);
    }

    std::shared_ptr<FakeSensorState> state_;
    codec::PacketFramer framer_;
};

// ---------------------------------------------------------------------------
// Helpers for pushing sensor output at the host
// ---------------------------------------------------------------------------

inline void inject(FakeSensorState& state, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> packet = codec::encode(payload);
    std::lock_guard<std::mutex> lock(state.mutex);
    state.input.insert(state.input.end(), packet.begin(), packet.end());
    state.cv.notify_all();
}

inline void injectRaw(FakeSensorState& state, const std::vector<uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(state.mutex);
    state.input.insert(state.input.end(), bytes.begin(), bytes.end());
    state.cv.notify_all();
}

inline void unplug(FakeSensorState& state) {
    std::lock_guard<std::mutex> lock(state.mutex);
    state.unplugged = true;
    state.cv.notify_all();
}

inline std::vector<uint8_t> pointSubframe(uint8_t type, const std::vector<protocol::RawPoint>& points) {
    ByteWriter w;
    w.u8(protocol::CMD_POINT_CLOUD_DATA).u8(protocol::VARIANT_RESPONSE).u8(type);
    w.u8(static_cast<uint8_t>(points.size()));
    for (const auto& p : points) {
        w.i16(p.x).i16(p.y).i16(p.z).u8(p.intensity).i16(p.velocity);
    }
    return w.release();
}

inline std::vector<uint8_t> objectSubframe(uint8_t type, const std::vector<protocol::RawObject>& objects) {
    ByteWriter w;
    w.u8(protocol::CMD_OBJECT_DATA).u8(protocol::VARIANT_RESPONSE).u8(type);
    w.u8(static_cast<uint8_t>(objects.size()));
    for (const auto& o : objects) {
        w.i8(o.tracking_id);
        for (int16_t v : o.position) w.i16(v);
        for (int16_t v : o.velocity) w.i16(v);
        for (int16_t v : o.acceleration) w.i16(v);
    }
    return w.release();
}

inline std::vector<uint8_t> sensorMessage(uint8_t type, uint8_t code, const std::string& text) {
    ByteWriter w;
    w.u8(protocol::CMD_MESSAGE).u8(protocol::VARIANT_RESPONSE).u8(type).u8(code);
    for (char c : text) {
        w.u8(static_cast<uint8_t>(c));
    }
    return w.release();
}

}  // namespace test
}  // namespace radariq

#endif  // RADARIQ_TEST_FAKE_SENSOR_HPP
