#ifndef RADARIQ_RADAR_IQ_HPP
#define RADARIQ_RADAR_IQ_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "radariq/connection.hpp"
#include "radariq/frame_assembler.hpp"
#include "radariq/protocol.hpp"
#include "radariq/serial_transport.hpp"
#include "radariq/types.hpp"

namespace radariq {

/// Latest sensor performance statistics.
struct Statistics {
    std::optional<protocol::CoreStatistics> core;
    std::optional<protocol::PointCloudStatistics> point_cloud;
    size_t rx_buffer_length = 0;
    size_t rx_packet_queue = 0;
};

/// API wrapper for the RadarIQ-M1 sensor.
///
/// Typical use:
///
///     radariq::RadarIQ riq;
///     riq.setMode(radariq::CaptureMode::PointCloud);
///     riq.setUnits("m", "m/s");
///     riq.setFrameRate(5);
///     riq.setDistanceFilter(0, 10);
///     riq.setAngleFilter(-45, 45);
///     riq.start();
///     while (riq.isCapturing()) {
///         if (auto frame = riq.getData()) { ... }
///     }
///
/// Settings are exchanged with the sensor synchronously; frames are
/// collected by a capture thread into a bounded queue.
class RadarIQ {
public:
    using ConnectionStatusCallback = std::function<void(ConnectionStatus)>;

    struct Options {
        /// Serial device; empty searches for a module (see findComPort()).
        std::string port;
        OutputFormat output_format = OutputFormat::List;
        /// Maximum number of buffered frames; 0 buffers without limit.
        /// New frames are dropped while the queue is full.
        size_t queue_length = 2;
        uint32_t baud_rate = DEFAULT_BAUD_RATE;
        std::chrono::milliseconds response_timeout{5000};
        /// Time given to the sensor to stop streaming before the queues are cleared.
        std::chrono::milliseconds settle_time{500};
        ReconnectPolicy reconnect_policy;
        ConnectionStatusCallback connection_status_callback;
    };

    /// Connect to the first RadarIQ module found, with default options.
    RadarIQ();

    /// Connect through the serial port named in `options` (or the first module found).
    explicit RadarIQ(const Options& options);

    /// Connect through a caller-supplied transport.
    RadarIQ(std::unique_ptr<SerialTransport> transport, const Options& options);

    ~RadarIQ();

    // Non-copyable, non-movable
    RadarIQ(const RadarIQ&) = delete;
    RadarIQ& operator=(const RadarIQ&) = delete;

    /// Stop the sensor and close the serial connection. Never throws.
    void close() noexcept;

    // Local settings

    bool getMirror() const;
    /// Mirror the X-dimension of all returned data.
    void setMirror(bool mirror);

    /// Units used by the filters and the returned data. Empty keeps the current value.
    /// Throws std::invalid_argument for unknown units.
    void setUnits(const std::string& distance_units = "",
                  const std::string& speed_units = "",
                  const std::string& acceleration_units = "");
    std::string getDistanceUnits() const;
    std::string getSpeedUnits() const;
    std::string getAccelerationUnits() const;

    // Sensor settings

    SensorVersion getVersion();
    RadarApplicationVersions getRadarApplicationVersions();
    std::string getSerialNumber();

    void reset(ResetCode code);

    int getFrameRate();
    void setFrameRate(int frame_rate);

    CaptureMode getMode();
    void setMode(CaptureMode mode);

    RangeFilter getDistanceFilter();
    void setDistanceFilter(double minimum, double maximum);

    /// Degrees; 0 is centre, negative angles are to the left of the sensor.
    AngleFilter getAngleFilter();
    void setAngleFilter(int minimum, int maximum);

    MovingFilter getMovingFilter();
    void setMovingFilter(MovingFilter filter);

    /// Persist the current settings on the sensor.
    void save();

    PointDensity getPointDensity();
    void setPointDensity(PointDensity density);

    int getSensitivity();
    void setSensitivity(int sensitivity);

    RangeFilter getHeightFilter();
    void setHeightFilter(double minimum, double maximum);

    ObjectType getObjectTypeMode();
    void setObjectTypeMode(ObjectType type);

    /// Remove near-field objects from the scene. Requires no objects within
    /// 1 m of the mounted sensor; the calibration is saved on the sensor.
    void sceneCalibration();

    bool getAutoStart();
    /// Start capturing immediately on power on.
    void setAutoStart(bool auto_start);

    // Capture

    /// Start capturing `samples` frames (0 = continuous). Units, mirroring and
    /// output format are fixed for the duration of the capture.
    void start(int samples = 0, bool clear_buffer = true);

    /// Stop capturing.
    void stop();

    bool isCapturing() const { return capturing_.load(); }

    /// Next frame, waiting up to `timeout`. Empty if none arrived.
    std::optional<Frame> getData(std::chrono::milliseconds timeout = std::chrono::milliseconds(1000));

    /// Next frame if one is queued.
    std::optional<Frame> getFrame();

    Statistics getStatistics() const;

    /// Number of frames received but not yet fetched.
    size_t getQueueSize() const;

private:
    void cleanStart();
    std::vector<uint8_t> exchange(const std::vector<uint8_t>& request, uint8_t command,
                                  size_t response_length);
    std::vector<uint8_t> readResponse();
    void ensureIdle(const char* operation) const;
    void logSensorMessage(const std::vector<uint8_t>& payload);
    void handleStatistics(const std::vector<uint8_t>& payload);
    void captureLoop(int samples, FrameAssembler::Config config);
    void pushFrame(Frame&& frame);
    void sendStop();
    void joinCapture();
    void onConnectionStatus(ConnectionStatus status);
    FrameAssembler::Config assemblerConfig() const;

    template <typename T>
    T getByte(uint8_t command, const char* operation);
    void setByte(uint8_t command, uint8_t value, const char* operation, const char* setting);

    Options options_;
    std::unique_ptr<Connection> connection_;
    std::atomic<bool> closed_{false};

    mutable std::mutex settings_mutex_;
    std::string distance_units_ = "m";
    std::string speed_units_ = "m/s";
    std::string acceleration_units_ = "m/s^2";
    bool mirror_ = false;

    std::mutex command_mutex_;

    std::atomic<bool> capturing_{false};
    std::thread capture_thread_;

    mutable std::mutex frame_mutex_;
    std::condition_variable frame_cv_;
    std::deque<Frame> frames_;

    mutable std::mutex stats_mutex_;
    Statistics statistics_;
};

}  // namespace radariq

#endif  // RADARIQ_RADAR_IQ_HPP
