#include "radariq/radar_iq.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include <ros/ros.h>

#include "radariq/byte_buffer.hpp"
#include "radariq/errors.hpp"
#include "radariq/packet_codec.hpp"
#include "radariq/port_manager.hpp"
#include "radariq/posix_serial.hpp"
#include "radariq/units.hpp"

namespace radariq {

using namespace protocol;

namespace {
constexpr std::chrono::milliseconds CAPTURE_POLL{10};

constexpr int MAX_FRAME_RATE = 20;
constexpr int MAX_SENSITIVITY = 9;
constexpr int MAX_SAMPLES = 255;
constexpr long MAX_DISTANCE_MM = 10000;
constexpr int MAX_ANGLE_DEG = 55;

/// Run one sensor exchange, reporting any failure as RadarError("Failed to <operation>: ...").
/// Argument errors (std::invalid_argument) pass through untouched.
template <typename Fn>
auto guard(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::invalid_argument&) {
        throw;
    } catch (const std::exception& e) {
        throw RadarError(std::string("Failed to ") + operation + ": " + e.what());
    }
}

RadarIQ::Options withPort(RadarIQ::Options options) {
    if (options.port.empty()) {
        options.port = findComPort().device;
        ROS_INFO("Found RadarIQ module on %s", options.port.c_str());
    }
    return options;
}

long toMillimetres(const std::string& distance_units, double value) {
    return std::lround(units::convertDistanceToSi(distance_units, value) * 1000.0);
}

VersionNumber readVersion(ByteReader& reader) {
    VersionNumber v;
    v.major = reader.readU8();
    v.minor = reader.readU8();
    v.build = reader.readU16();
    return v;
}
}  // namespace

RadarIQ::RadarIQ()
    : RadarIQ(Options())
{
}

RadarIQ::RadarIQ(const Options& options)
    : RadarIQ(std::make_unique<PosixSerial>(), withPort(options))
{
}

RadarIQ::RadarIQ(std::unique_ptr<SerialTransport> transport, const Options& options)
    : options_(options)
{
    connection_ = std::make_unique<Connection>(
        std::move(transport), options_.port, options_.baud_rate,
        [this](ConnectionStatus status) { onConnectionStatus(status); },
        options_.reconnect_policy);

    cleanStart();
    ROS_INFO("RadarIQ connected on %s", options_.port.c_str());
}

RadarIQ::~RadarIQ() {
    close();
}

void RadarIQ::cleanStart() {
    stop();
    std::this_thread::sleep_for(options_.settle_time);  // let the sensor stop if it was running
    connection_->emptyQueue();
}

void RadarIQ::close() noexcept {
    if (closed_.exchange(true)) {
        return;
    }
    try {
        stop();
        std::this_thread::sleep_for(options_.settle_time);
    } catch (const std::exception& e) {
        ROS_WARN("Closing RadarIQ: %s", e.what());
    }
    connection_->close();
}

// ---------------------------------------------------------------------------
// Local settings
// ---------------------------------------------------------------------------

bool RadarIQ::getMirror() const {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return mirror_;
}

void RadarIQ::setMirror(bool mirror) {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    mirror_ = mirror;
}

void RadarIQ::setUnits(const std::string& distance_units,
                       const std::string& speed_units,
                       const std::string& acceleration_units) {
    if (!distance_units.empty() && !units::isValidDistanceUnit(distance_units)) {
        throw std::invalid_argument("Invalid units for distance conversion");
    }
    if (!speed_units.empty() && !units::isValidSpeedUnit(speed_units)) {
        throw std::invalid_argument("Invalid units for speed conversion");
    }
    if (!acceleration_units.empty() && !units::isValidAccelerationUnit(acceleration_units)) {
        throw std::invalid_argument("Invalid units for acceleration conversion");
    }

    std::lock_guard<std::mutex> lock(settings_mutex_);
    if (!distance_units.empty()) distance_units_ = distance_units;
    if (!speed_units.empty()) speed_units_ = speed_units;
    if (!acceleration_units.empty()) acceleration_units_ = acceleration_units;
}

std::string RadarIQ::getDistanceUnits() const {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return distance_units_;
}

std::string RadarIQ::getSpeedUnits() const {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return speed_units_;
}

std::string RadarIQ::getAccelerationUnits() const {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return acceleration_units_;
}

FrameAssembler::Config RadarIQ::assemblerConfig() const {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    FrameAssembler::Config config;
    config.distance_units = distance_units_;
    config.speed_units = speed_units_;
    config.acceleration_units = acceleration_units_;
    config.mirror = mirror_;
    config.output_format = options_.output_format;
    return config;
}

// ---------------------------------------------------------------------------
// Command exchange
// ---------------------------------------------------------------------------

void RadarIQ::ensureIdle(const char* operation) const {
    if (capturing_.load()) {
        throw RadarError(std::string("Failed to ") + operation
                         + ": the sensor is capturing, call stop() first");
    }
}

std::vector<uint8_t> RadarIQ::exchange(const std::vector<uint8_t>& req, uint8_t command,
                                       size_t response_length) {
    std::lock_guard<std::mutex> lock(command_mutex_);
    connection_->flushAll();
    connection_->sendPacket(req);

    std::vector<uint8_t> response = readResponse();
    if (!isResponse(response, command)) {
        throw RadarError("Invalid response: " + codec::toHex(response));
    }
    if (response.size() < response_length) {
        throw RadarError("Response too short: " + codec::toHex(response));
    }
    return response;
}

std::vector<uint8_t> RadarIQ::readResponse() {
    auto deadline = std::chrono::steady_clock::now() + options_.response_timeout;
    std::vector<uint8_t> packet;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (!connection_->waitForPacket(packet, remaining)) {
            continue;
        }

        if (isMessage(packet)) {
            logSensorMessage(packet);
        } else if (isDataPacket(packet) || isStatistics(packet)) {
            ROS_DEBUG("Skipping stray capture packet: %s", codec::toHex(packet).c_str());
        } else {
            return packet;
        }
    }
    throw RadarError("Timeout while reading from the RadarIQ sensor");
}

template <typename T>
T RadarIQ::getByte(uint8_t command, const char* operation) {
    ensureIdle(operation);
    return guard(operation, [&] {
        std::vector<uint8_t> res = exchange(request(command, VARIANT_REQUEST), command, 3);
        return static_cast<T>(res[2]);
    });
}

void RadarIQ::setByte(uint8_t command, uint8_t value, const char* operation, const char* setting) {
    ensureIdle(operation);
    guard(operation, [&] {
        std::vector<uint8_t> res = exchange(request(command, VARIANT_SET, {value}), command, 3);
        if (res[2] != value) {
            throw RadarError(std::string(setting) + " did not set correctly");
        }
    });
}

void RadarIQ::logSensorMessage(const std::vector<uint8_t>& payload) {
    SensorMessage msg;
    try {
        msg = parseMessage(payload);
    } catch (const codec::DecodeError& e) {
        ROS_WARN("Failed to process message from the RadarIQ sensor: %s", e.what());
        return;
    }

    switch (messageLevel(msg.type)) {
        case MessageLevel::Debug:
            ROS_DEBUG("RadarIQ %u %s", msg.code, msg.text.c_str());
            break;
        case MessageLevel::Info:
            ROS_INFO("RadarIQ %u %s", msg.code, msg.text.c_str());
            break;
        case MessageLevel::Warning:
            ROS_WARN("RadarIQ %u %s", msg.code, msg.text.c_str());
            break;
        case MessageLevel::Error:
            ROS_ERROR("RadarIQ %u %s", msg.code, msg.text.c_str());
            break;
    }
}

// ---------------------------------------------------------------------------
// Sensor settings
// ---------------------------------------------------------------------------

SensorVersion RadarIQ::getVersion() {
    ensureIdle("get version");
    return guard("get version", [&] {
        std::vector<uint8_t> res = exchange(request(CMD_VERSION, VARIANT_REQUEST), CMD_VERSION, 10);
        ByteReader reader(res, 2);
        SensorVersion version;
        version.firmware = readVersion(reader);
        version.hardware = readVersion(reader);
        return version;
    });
}

RadarApplicationVersions RadarIQ::getRadarApplicationVersions() {
    ensureIdle("get radar application versions");
    return guard("get radar application versions", [&] {
        RadarApplicationVersions versions{};
        ApplicationVersion* slots[] = {&versions.controller, &versions.application_1,
                                       &versions.application_2, &versions.application_3};

        for (uint8_t slot = 1; slot <= 4; ++slot) {
            std::vector<uint8_t> res = exchange(request(CMD_RADAR_APP_VERSION, VARIANT_REQUEST, {slot}),
                                                CMD_RADAR_APP_VERSION, 3 + APP_NAME_LENGTH + 4);
            ByteReader reader(res, 2);
            if (reader.readU8() != slot) {
                ROS_WARN("Radar application version response for the wrong slot, expected %u", slot);
                continue;
            }
            ApplicationVersion* app = slots[slot - 1];
            app->name = reader.readString(APP_NAME_LENGTH);
            app->version = readVersion(reader);
        }
        return versions;
    });
}

std::string RadarIQ::getSerialNumber() {
    ensureIdle("get serial number");
    return guard("get serial number", [&] {
        std::vector<uint8_t> res = exchange(request(CMD_SERIAL_NUMBER, VARIANT_REQUEST),
                                            CMD_SERIAL_NUMBER, 10);
        ByteReader reader(res, 2);
        uint32_t first = reader.readU32();
        uint32_t second = reader.readU32();
        return std::to_string(first) + "-" + std::to_string(second);
    });
}

void RadarIQ::reset(ResetCode code) {
    uint8_t value = static_cast<uint8_t>(code);
    if (value > static_cast<uint8_t>(ResetCode::FactorySettings)) {
        throw std::invalid_argument("Invalid reset code");
    }
    ensureIdle("reset sensor");
    guard("reset sensor", [&] {
        exchange(request(CMD_RESET, VARIANT_SET, {value}), CMD_RESET, 2);
    });
}

int RadarIQ::getFrameRate() {
    return getByte<int>(CMD_FRAME_RATE, "get frame rate");
}

void RadarIQ::setFrameRate(int frame_rate) {
    if (frame_rate < 0 || frame_rate > MAX_FRAME_RATE) {
        throw std::invalid_argument("Frame rate must be between 0 and 20 fps");
    }
    setByte(CMD_FRAME_RATE, static_cast<uint8_t>(frame_rate), "set frame rate", "Frame rate");
}

CaptureMode RadarIQ::getMode() {
    return getByte<CaptureMode>(CMD_MODE, "get mode");
}

void RadarIQ::setMode(CaptureMode mode) {
    uint8_t value = static_cast<uint8_t>(mode);
    if (value > static_cast<uint8_t>(CaptureMode::ObjectTracking)) {
        throw std::invalid_argument("Invalid mode");
    }
    setByte(CMD_MODE, value, "set mode", "Mode");
}

RangeFilter RadarIQ::getDistanceFilter() {
    ensureIdle("get distance filter");
    std::string du = getDistanceUnits();
    return guard("get distance filter", [&] {
        std::vector<uint8_t> res = exchange(request(CMD_DISTANCE_FILTER, VARIANT_REQUEST),
                                            CMD_DISTANCE_FILTER, 6);
        ByteReader reader(res, 2);
        RangeFilter filter;
        filter.minimum = units::convertDistanceFromSi(du, reader.readU16() / 1000.0);
        filter.maximum = units::convertDistanceFromSi(du, reader.readU16() / 1000.0);
        return filter;
    });
}

void RadarIQ::setDistanceFilter(double minimum, double maximum) {
    std::string du = getDistanceUnits();
    long min_mm = toMillimetres(du, minimum);
    long max_mm = toMillimetres(du, maximum);

    if (min_mm < 0 || min_mm > MAX_DISTANCE_MM) {
        throw std::invalid_argument("Distance filter minimum must be a number between 0 and 10000mm");
    }
    if (max_mm < 0 || max_mm > MAX_DISTANCE_MM) {
        throw std::invalid_argument("Distance filter maximum must be a number between 0 and 10000mm");
    }
    if (max_mm < min_mm) {
        throw std::invalid_argument("Distance filter maximum must be greater than the minimum");
    }

    ensureIdle("set distance filter");
    guard("set distance filter", [&] {
        std::vector<uint8_t> args = ByteWriter()
                                        .u16(static_cast<uint16_t>(min_mm))
                                        .u16(static_cast<uint16_t>(max_mm))
                                        .release();
        std::vector<uint8_t> res = exchange(request(CMD_DISTANCE_FILTER, VARIANT_SET, args),
                                            CMD_DISTANCE_FILTER, 6);
        ByteReader reader(res, 2);
        if (reader.readU16() != min_mm || reader.readU16() != max_mm) {
            throw RadarError("Distance filter did not set correctly");
        }
    });
}

AngleFilter RadarIQ::getAngleFilter() {
    ensureIdle("get angle filter");
    return guard("get angle filter", [&] {
        std::vector<uint8_t> res = exchange(request(CMD_ANGLE_FILTER, VARIANT_REQUEST),
                                            CMD_ANGLE_FILTER, 4);
        ByteReader reader(res, 2);
        AngleFilter filter;
        filter.minimum = reader.readI8();
        filter.maximum = reader.readI8();
        return filter;
    });
}

void RadarIQ::setAngleFilter(int minimum, int maximum) {
    if (minimum < -MAX_ANGLE_DEG || minimum > MAX_ANGLE_DEG) {
        throw std::invalid_argument("Angle filter minimum must be an integer between -55 and +55");
    }
    if (maximum < -MAX_ANGLE_DEG || maximum > MAX_ANGLE_DEG) {
        throw std::invalid_argument("Angle filter maximum must be an integer between -55 and +55");
    }
    if (maximum < minimum) {
        throw std::invalid_argument("Angle filter maximum must be greater than the minimum");
    }

    ensureIdle("set angle filter");
    guard("set angle filter", [&] {
        std::vector<uint8_t> args = ByteWriter()
                                        .i8(static_cast<int8_t>(minimum))
                                        .i8(static_cast<int8_t>(maximum))
                                        .release();
        exchange(request(CMD_ANGLE_FILTER, VARIANT_SET, args), CMD_ANGLE_FILTER, 4);
    });
}

MovingFilter RadarIQ::getMovingFilter() {
    return getByte<MovingFilter>(CMD_MOVING_FILTER, "get moving filter");
}

void RadarIQ::setMovingFilter(MovingFilter filter) {
    uint8_t value = static_cast<uint8_t>(filter);
    if (value > static_cast<uint8_t>(MovingFilter::ObjectsOnly)) {
        throw std::invalid_argument("Moving filter value is invalid");
    }
    setByte(CMD_MOVING_FILTER, value, "set moving filter", "Moving filter");
}

void RadarIQ::save() {
    ensureIdle("save settings");
    guard("save settings", [&] {
        exchange(request(CMD_SAVE, VARIANT_SET), CMD_SAVE, 2);
    });
}

PointDensity RadarIQ::getPointDensity() {
    return getByte<PointDensity>(CMD_POINT_DENSITY, "get point density setting");
}

void RadarIQ::setPointDensity(PointDensity density) {
    uint8_t value = static_cast<uint8_t>(density);
    if (value > static_cast<uint8_t>(PointDensity::VeryDense)) {
        throw std::invalid_argument("Invalid point density setting");
    }
    setByte(CMD_POINT_DENSITY, value, "set the point density", "Point density");
}

int RadarIQ::getSensitivity() {
    return getByte<int>(CMD_SENSITIVITY, "get sensitivity setting");
}

void RadarIQ::setSensitivity(int sensitivity) {
    if (sensitivity < 0 || sensitivity > MAX_SENSITIVITY) {
        throw std::invalid_argument("Sensitivity must be an integer between 0 and 9");
    }
    setByte(CMD_SENSITIVITY, static_cast<uint8_t>(sensitivity), "set the sensitivity setting",
            "Sensitivity setting");
}

RangeFilter RadarIQ::getHeightFilter() {
    ensureIdle("get height filter");
    std::string du = getDistanceUnits();
    return guard("get height filter", [&] {
        std::vector<uint8_t> res = exchange(request(CMD_HEIGHT_FILTER, VARIANT_REQUEST),
                                            CMD_HEIGHT_FILTER, 6);
        ByteReader reader(res, 2);
        RangeFilter filter;
        filter.minimum = units::convertDistanceFromSi(du, reader.readI16() / 1000.0);
        filter.maximum = units::convertDistanceFromSi(du, reader.readI16() / 1000.0);
        return filter;
    });
}

void RadarIQ::setHeightFilter(double minimum, double maximum) {
    std::string du = getDistanceUnits();
    long min_mm = toMillimetres(du, minimum);
    long max_mm = toMillimetres(du, maximum);
    constexpr long lo = std::numeric_limits<int16_t>::min();
    constexpr long hi = std::numeric_limits<int16_t>::max();

    if (min_mm < lo || min_mm > hi) {
        throw std::invalid_argument("Height filter minimum must be between -32768 and 32767mm");
    }
    if (max_mm < lo || max_mm > hi) {
        throw std::invalid_argument("Height filter maximum must be between -32768 and 32767mm");
    }
    if (max_mm < min_mm) {
        throw std::invalid_argument("Height filter maximum must be greater than the minimum");
    }

    ensureIdle("set height filter");
    guard("set height filter", [&] {
        std::vector<uint8_t> args = ByteWriter()
                                        .i16(static_cast<int16_t>(min_mm))
                                        .i16(static_cast<int16_t>(max_mm))
                                        .release();
        std::vector<uint8_t> res = exchange(request(CMD_HEIGHT_FILTER, VARIANT_SET, args),
                                            CMD_HEIGHT_FILTER, 6);
        ByteReader reader(res, 2);
        if (reader.readI16() != min_mm || reader.readI16() != max_mm) {
            throw RadarError("Height filter did not set correctly");
        }
    });
}

ObjectType RadarIQ::getObjectTypeMode() {
    return getByte<ObjectType>(CMD_OBJECT_TYPE_MODE, "get object type mode");
}

void RadarIQ::setObjectTypeMode(ObjectType type) {
    uint8_t value = static_cast<uint8_t>(type);
    if (value > static_cast<uint8_t>(ObjectType::FastVehicle)) {
        throw std::invalid_argument("Invalid object type mode");
    }
    setByte(CMD_OBJECT_TYPE_MODE, value, "set object type mode", "Object type mode");
}

void RadarIQ::sceneCalibration() {
    ensureIdle("perform scene calibration");
    guard("perform scene calibration", [&] {
        exchange(request(CMD_SCENE_CALIBRATION, VARIANT_SET), CMD_SCENE_CALIBRATION, 2);
    });
}

bool RadarIQ::getAutoStart() {
    return getByte<uint8_t>(CMD_AUTO_START, "get auto start") != 0;
}

void RadarIQ::setAutoStart(bool auto_start) {
    setByte(CMD_AUTO_START, auto_start ? 1 : 0, "set auto start", "Auto start");
}

// ---------------------------------------------------------------------------
// Capture
// ---------------------------------------------------------------------------

void RadarIQ::start(int samples, bool clear_buffer) {
    if (samples < 0 || samples > MAX_SAMPLES) {
        throw std::invalid_argument("Samples must be between 0 and 255 (0 = continuous)");
    }
    if (capturing_.load()) {
        ROS_WARN("RadarIQ is already capturing.");
        return;
    }
    joinCapture();  // a previous fixed-length capture may have ended on its own

    if (clear_buffer) {
        connection_->emptyQueue();
        std::lock_guard<std::mutex> lock(frame_mutex_);
        frames_.clear();
    }

    FrameAssembler::Config config = assemblerConfig();
    guard("start data capture", [&] {
        std::lock_guard<std::mutex> lock(command_mutex_);
        connection_->sendPacket(request(CMD_CAPTURE_START, VARIANT_REQUEST,
                                        {static_cast<uint8_t>(samples)}));
    });

    capturing_.store(true);
    capture_thread_ = std::thread(&RadarIQ::captureLoop, this, samples, config);
    ROS_INFO("Capture started (%s, %s)",
             samples == 0 ? "continuous" : (std::to_string(samples) + " frames").c_str(),
             options_.output_format == OutputFormat::List ? "list output" : "array output");
}

void RadarIQ::stop() {
    capturing_.store(false);
    joinCapture();
    frame_cv_.notify_all();

    guard("stop data capture", [&] {
        std::lock_guard<std::mutex> lock(command_mutex_);
        sendStop();
    });
}

void RadarIQ::sendStop() {
    connection_->sendPacket(request(CMD_CAPTURE_STOP, VARIANT_REQUEST));
}

void RadarIQ::joinCapture() {
    if (capture_thread_.joinable() && capture_thread_.get_id() != std::this_thread::get_id()) {
        capture_thread_.join();
    }
}

void RadarIQ::captureLoop(int samples, FrameAssembler::Config config) {
    FrameAssembler assembler(config);
    int captured = 0;
    std::vector<uint8_t> packet;

    while (capturing_.load()) {
        if (!connection_->waitForPacket(packet, CAPTURE_POLL)) {
            continue;
        }

        try {
            if (isMessage(packet)) {
                logSensorMessage(packet);
            } else if (isStatistics(packet)) {
                handleStatistics(packet);
            } else if (isDataPacket(packet)) {
                Frame frame;
                if (assembler.process(packet, frame)) {
                    ++captured;
                    pushFrame(std::move(frame));
                    if (samples > 0 && captured >= samples) {
                        break;
                    }
                }
            } else {
                ROS_DEBUG("Ignoring packet during capture: %s", codec::toHex(packet).c_str());
            }
        } catch (const codec::DecodeError& e) {
            ROS_WARN_THROTTLE(5.0, "Discarding malformed capture packet: %s", e.what());
            assembler.reset();
        }
    }

    // Finished by sample count rather than stop(): tell the sensor.
    if (capturing_.exchange(false)) {
        ROS_INFO("Captured %d frames, stopping.", captured);
        try {
            std::lock_guard<std::mutex> lock(command_mutex_);
            sendStop();
        } catch (const std::exception& e) {
            ROS_ERROR("Failed to stop data capture: %s", e.what());
        }
    }
    frame_cv_.notify_all();
}

void RadarIQ::pushFrame(Frame&& frame) {
    {
        std::lock_guard<std::mutex> lock(frame_mutex_);
        if (options_.queue_length > 0 && frames_.size() >= options_.queue_length) {
            ROS_DEBUG_THROTTLE(5.0, "Frame queue full (%zu), dropping frame", frames_.size());
            return;
        }
        frames_.push_back(std::move(frame));
    }
    frame_cv_.notify_one();
}

void RadarIQ::handleStatistics(const std::vector<uint8_t>& payload) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (payload[0] == CMD_CORE_STATISTICS) {
        statistics_.core = parseCoreStatistics(payload);
    } else {
        statistics_.point_cloud = parsePointCloudStatistics(payload);
    }
    statistics_.rx_buffer_length = connection_->rxBufferLength();
    statistics_.rx_packet_queue = getQueueSize();
}

std::optional<Frame> RadarIQ::getData(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(frame_mutex_);
    if (!frame_cv_.wait_for(lock, timeout, [this] { return !frames_.empty(); })) {
        return std::nullopt;
    }
    Frame frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

std::optional<Frame> RadarIQ::getFrame() {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    if (frames_.empty()) {
        return std::nullopt;
    }
    Frame frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

Statistics RadarIQ::getStatistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return statistics_;
}

size_t RadarIQ::getQueueSize() const {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    return frames_.size();
}

void RadarIQ::onConnectionStatus(ConnectionStatus status) {
    if (status == ConnectionStatus::Disconnected) {
        capturing_.store(false);
        frame_cv_.notify_all();
    }
    if (options_.connection_status_callback) {
        options_.connection_status_callback(status);
    }
}

}  // namespace radariq
