#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "fake_sensor.hpp"
#include "radariq/errors.hpp"
#include "radariq/radar_iq.hpp"

using namespace radariq;
using namespace radariq::protocol;
using namespace std::chrono_literals;
using radariq::test::inject;
using radariq::test::objectSubframe;
using radariq::test::pointSubframe;

namespace {
bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

template <typename Fn>
void expectMessage(Fn&& fn, const std::string& expected) {
    try {
        fn();
        ADD_FAILURE() << "expected an exception with message: " << expected;
    } catch (const std::exception& e) {
        EXPECT_EQ(std::string(e.what()), expected);
    }
}

std::vector<uint8_t> pointFrame(int16_t x) {
    return pointSubframe(SUBFRAME_END_OF_FRAME, {RawPoint{x, 1000, 0, 10, 0}});
}

class RadarIQTest : public ::testing::Test {
protected:
    RadarIQ::Options defaultOptions() {
        RadarIQ::Options options;
        options.port = "/dev/ttyFAKE0";
        options.response_timeout = 300ms;
        options.settle_time = 10ms;
        options.reconnect_policy = {3, 20ms};
        options.connection_status_callback = [this](ConnectionStatus status) {
            std::lock_guard<std::mutex> lock(status_mutex_);
            statuses_.push_back(status);
        };
        return options;
    }

    RadarIQ& radar(const RadarIQ::Options& options) {
        riq_ = std::make_unique<RadarIQ>(std::make_unique<test::FakeSensor>(state_), options);
        return *riq_;
    }

    RadarIQ& radar() { return radar(defaultOptions()); }

    template <typename Fn>
    auto sensor(Fn&& fn) -> decltype(fn(std::declval<test::FakeSensorState&>())) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return fn(*state_);
    }

    std::vector<uint8_t> setting(uint8_t command) {
        return sensor([&](test::FakeSensorState& s) { return s.settings[command]; });
    }

    std::vector<uint8_t> lastRequest() {
        return sensor([](test::FakeSensorState& s) { return s.received.back(); });
    }

    int stopRequests() {
        return sensor([](test::FakeSensorState& s) { return s.stop_requests; });
    }

    bool sawStatus(ConnectionStatus status) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        for (auto s : statuses_) {
            if (s == status) return true;
        }
        return false;
    }

    std::shared_ptr<test::FakeSensorState> state_ = std::make_shared<test::FakeSensorState>();
    std::mutex status_mutex_;
    std::vector<ConnectionStatus> statuses_;
    std::unique_ptr<RadarIQ> riq_;
};
}  // namespace

// ---------------------------------------------------------------------------
// Connection and sensor information
// ---------------------------------------------------------------------------

TEST_F(RadarIQTest, StopsSensorOnConnect) {
    radar();
    EXPECT_EQ(stopRequests(), 1);
    EXPECT_TRUE(sawStatus(ConnectionStatus::Connected));
    EXPECT_FALSE(riq_->isCapturing());
}

TEST_F(RadarIQTest, CloseIsIdempotent) {
    radar();
    riq_->close();
    riq_->close();
    EXPECT_EQ(stopRequests(), 2);
    EXPECT_FALSE(sensor([](test::FakeSensorState& s) { return s.open; }));
}

TEST_F(RadarIQTest, ReadsVersion) {
    SensorVersion version = radar().getVersion();
    EXPECT_EQ(toString(version.firmware), "1.2.345");
    EXPECT_EQ(toString(version.hardware), "3.0.7");
    EXPECT_EQ(lastRequest(), (std::vector<uint8_t>{CMD_VERSION, VARIANT_REQUEST}));
}

TEST_F(RadarIQTest, ReadsSerialNumber) {
    EXPECT_EQ(radar().getSerialNumber(), "12345-678");
}

TEST_F(RadarIQTest, ReadsRadarApplicationVersions) {
    RadarApplicationVersions versions = radar().getRadarApplicationVersions();
    EXPECT_EQ(versions.controller.name, "app1");
    EXPECT_EQ(versions.application_1.name, "app2");
    EXPECT_EQ(versions.application_3.name, "app4");
    EXPECT_EQ(toString(versions.application_2.version), "1.3.103");
}

TEST_F(RadarIQTest, Reset) {
    radar().reset(ResetCode::FactorySettings);
    EXPECT_EQ(lastRequest(), (std::vector<uint8_t>{CMD_RESET, VARIANT_SET, 1}));
    EXPECT_THROW(riq_->reset(static_cast<ResetCode>(2)), std::invalid_argument);
}

TEST_F(RadarIQTest, SaveAndSceneCalibration) {
    radar().save();
    EXPECT_EQ(lastRequest(), (std::vector<uint8_t>{CMD_SAVE, VARIANT_SET}));
    riq_->sceneCalibration();
    EXPECT_EQ(lastRequest(), (std::vector<uint8_t>{CMD_SCENE_CALIBRATION, VARIANT_SET}));
}

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

TEST_F(RadarIQTest, FrameRate) {
    RadarIQ& riq = radar();
    EXPECT_EQ(riq.getFrameRate(), 5);
    riq.setFrameRate(12);
    EXPECT_EQ(setting(CMD_FRAME_RATE), (std::vector<uint8_t>{12}));
    EXPECT_EQ(riq.getFrameRate(), 12);

    expectMessage([&] { riq.setFrameRate(21); }, "Frame rate must be between 0 and 20 fps");
    EXPECT_THROW(riq.setFrameRate(-1), std::invalid_argument);
}

TEST_F(RadarIQTest, SettingNotAppliedBySensor) {
    RadarIQ& riq = radar();
    sensor([](test::FakeSensorState& s) {
        s.overrides[CMD_FRAME_RATE] = {CMD_FRAME_RATE, VARIANT_RESPONSE, 9};
    });
    expectMessage([&] { riq.setFrameRate(3); },
                  "Failed to set frame rate: Frame rate did not set correctly");
}

TEST_F(RadarIQTest, Mode) {
    RadarIQ& riq = radar();
    EXPECT_EQ(riq.getMode(), CaptureMode::PointCloud);
    riq.setMode(CaptureMode::ObjectTracking);
    EXPECT_EQ(riq.getMode(), CaptureMode::ObjectTracking);
    expectMessage([&] { riq.setMode(static_cast<CaptureMode>(5)); }, "Invalid mode");
}

TEST_F(RadarIQTest, DistanceFilterInMetres) {
    RadarIQ& riq = radar();
    riq.setDistanceFilter(0.5, 2.01);
    EXPECT_EQ(setting(CMD_DISTANCE_FILTER), ByteWriter().u16(500).u16(2010).release());

    RangeFilter filter = riq.getDistanceFilter();
    EXPECT_DOUBLE_EQ(filter.minimum, 0.5);
    EXPECT_DOUBLE_EQ(filter.maximum, 2.01);
}

TEST_F(RadarIQTest, DistanceFilterInConfiguredUnits) {
    RadarIQ& riq = radar();
    riq.setUnits("mm");
    riq.setDistanceFilter(250, 8000);
    EXPECT_EQ(setting(CMD_DISTANCE_FILTER), ByteWriter().u16(250).u16(8000).release());
    EXPECT_DOUBLE_EQ(riq.getDistanceFilter().maximum, 8000.0);
}

TEST_F(RadarIQTest, DistanceFilterValidation) {
    RadarIQ& riq = radar();
    expectMessage([&] { riq.setDistanceFilter(-1, 5); },
                  "Distance filter minimum must be a number between 0 and 10000mm");
    expectMessage([&] { riq.setDistanceFilter(0, 10.5); },
                  "Distance filter maximum must be a number between 0 and 10000mm");
    expectMessage([&] { riq.setDistanceFilter(5, 4); },
                  "Distance filter maximum must be greater than the minimum");
}

TEST_F(RadarIQTest, AngleFilter) {
    RadarIQ& riq = radar();
    riq.setAngleFilter(-45, 30);
    EXPECT_EQ(setting(CMD_ANGLE_FILTER), ByteWriter().i8(-45).i8(30).release());

    AngleFilter filter = riq.getAngleFilter();
    EXPECT_EQ(filter.minimum, -45);
    EXPECT_EQ(filter.maximum, 30);

    expectMessage([&] { riq.setAngleFilter(-56, 0); },
                  "Angle filter minimum must be an integer between -55 and +55");
    expectMessage([&] { riq.setAngleFilter(0, 56); },
                  "Angle filter maximum must be an integer between -55 and +55");
    expectMessage([&] { riq.setAngleFilter(10, -10); },
                  "Angle filter maximum must be greater than the minimum");
}

TEST_F(RadarIQTest, MovingFilter) {
    RadarIQ& riq = radar();
    riq.setMovingFilter(MovingFilter::ObjectsOnly);
    EXPECT_EQ(riq.getMovingFilter(), MovingFilter::ObjectsOnly);
    expectMessage([&] { riq.setMovingFilter(static_cast<MovingFilter>(2)); },
                  "Moving filter value is invalid");
}

TEST_F(RadarIQTest, PointDensity) {
    RadarIQ& riq = radar();
    riq.setPointDensity(PointDensity::VeryDense);
    EXPECT_EQ(riq.getPointDensity(), PointDensity::VeryDense);
    expectMessage([&] { riq.setPointDensity(static_cast<PointDensity>(3)); },
                  "Invalid point density setting");
}

TEST_F(RadarIQTest, Sensitivity) {
    RadarIQ& riq = radar();
    riq.setSensitivity(9);
    EXPECT_EQ(riq.getSensitivity(), 9);
    expectMessage([&] { riq.setSensitivity(10); }, "Sensitivity must be an integer between 0 and 9");
}

TEST_F(RadarIQTest, HeightFilter) {
    RadarIQ& riq = radar();
    riq.setHeightFilter(-1.5, 2);
    EXPECT_EQ(setting(CMD_HEIGHT_FILTER), ByteWriter().i16(-1500).i16(2000).release());

    RangeFilter filter = riq.getHeightFilter();
    EXPECT_DOUBLE_EQ(filter.minimum, -1.5);
    EXPECT_DOUBLE_EQ(filter.maximum, 2.0);
    EXPECT_THROW(riq.setHeightFilter(1, -1), std::invalid_argument);
    EXPECT_THROW(riq.setHeightFilter(-40, 0), std::invalid_argument);
}

TEST_F(RadarIQTest, ObjectTypeMode) {
    RadarIQ& riq = radar();
    EXPECT_EQ(riq.getObjectTypeMode(), ObjectType::Person);
    riq.setObjectTypeMode(ObjectType::FastVehicle);
    EXPECT_EQ(riq.getObjectTypeMode(), ObjectType::FastVehicle);
    expectMessage([&] { riq.setObjectTypeMode(static_cast<ObjectType>(5)); }, "Invalid object type mode");
}

TEST_F(RadarIQTest, AutoStart) {
    RadarIQ& riq = radar();
    EXPECT_FALSE(riq.getAutoStart());
    riq.setAutoStart(true);
    EXPECT_TRUE(riq.getAutoStart());
    EXPECT_EQ(setting(CMD_AUTO_START), (std::vector<uint8_t>{1}));
}

TEST_F(RadarIQTest, Units) {
    RadarIQ& riq = radar();
    EXPECT_EQ(riq.getDistanceUnits(), "m");
    riq.setUnits("ft", "mi/h");
    EXPECT_EQ(riq.getDistanceUnits(), "ft");
    EXPECT_EQ(riq.getSpeedUnits(), "mi/h");
    EXPECT_EQ(riq.getAccelerationUnits(), "m/s^2");

    // A bad unit leaves every setting untouched.
    EXPECT_THROW(riq.setUnits("cm", "furlong/fortnight"), std::invalid_argument);
    EXPECT_EQ(riq.getDistanceUnits(), "ft");
}

TEST_F(RadarIQTest, Mirror) {
    RadarIQ& riq = radar();
    EXPECT_FALSE(riq.getMirror());
    riq.setMirror(true);
    EXPECT_TRUE(riq.getMirror());
}

// ---------------------------------------------------------------------------
// Exchange failures
// ---------------------------------------------------------------------------

TEST_F(RadarIQTest, TimesOutWhenSensorIsSilent) {
    RadarIQ& riq = radar();
    sensor([](test::FakeSensorState& s) { s.silent.insert(CMD_SENSITIVITY); });
    expectMessage([&] { riq.getSensitivity(); },
                  "Failed to get sensitivity setting: Timeout while reading from the RadarIQ sensor");
}

TEST_F(RadarIQTest, RejectsResponseToAnotherCommand) {
    RadarIQ& riq = radar();
    sensor([](test::FakeSensorState& s) {
        s.overrides[CMD_MODE] = {CMD_FRAME_RATE, VARIANT_RESPONSE, 5};
    });
    EXPECT_THROW(riq.getMode(), RadarError);
}

TEST_F(RadarIQTest, RejectsShortResponse) {
    RadarIQ& riq = radar();
    sensor([](test::FakeSensorState& s) {
        s.overrides[CMD_VERSION] = {CMD_VERSION, VARIANT_RESPONSE, 1, 2};
    });
    EXPECT_THROW(riq.getVersion(), RadarError);
}

TEST_F(RadarIQTest, SkipsSensorMessagesWhileWaiting) {
    RadarIQ& riq = radar();
    sensor([](test::FakeSensorState& s) { s.chatter = test::sensorMessage(3, 7, "Low voltage"); });
    EXPECT_EQ(riq.getFrameRate(), 5);
    EXPECT_EQ(riq.getSerialNumber(), "12345-678");
}

// ---------------------------------------------------------------------------
// Capture
// ---------------------------------------------------------------------------

TEST_F(RadarIQTest, CapturesFixedNumberOfFrames) {
    RadarIQ& riq = radar();
    riq.start(2);
    EXPECT_TRUE(riq.isCapturing());
    EXPECT_EQ(sensor([](test::FakeSensorState& s) { return s.last_samples; }), 2);

    inject(*state_, pointSubframe(SUBFRAME_PARTIAL, {RawPoint{100, 200, 300, 1, 0}}));
    inject(*state_, pointFrame(1000));
    inject(*state_, pointFrame(2000));

    auto first = riq.getData(1000ms);
    ASSERT_TRUE(first);
    ASSERT_EQ(first->points.size(), 2u);
    EXPECT_DOUBLE_EQ(first->points[0].x, 0.1);
    EXPECT_DOUBLE_EQ(first->points[1].x, 1.0);

    auto second = riq.getData(1000ms);
    ASSERT_TRUE(second);
    EXPECT_DOUBLE_EQ(second->points[0].x, 2.0);

    // The capture stops itself and tells the sensor.
    EXPECT_TRUE(waitUntil([&] { return !riq.isCapturing(); }));
    EXPECT_TRUE(waitUntil([&] { return stopRequests() == 2; }));

    inject(*state_, pointFrame(3000));
    EXPECT_FALSE(riq.getData(100ms));
}

TEST_F(RadarIQTest, RejectsBadSampleCount) {
    RadarIQ& riq = radar();
    EXPECT_THROW(riq.start(256), std::invalid_argument);
    EXPECT_THROW(riq.start(-1), std::invalid_argument);
    EXPECT_FALSE(riq.isCapturing());
}

TEST_F(RadarIQTest, FullQueueDropsNewFrames) {
    RadarIQ& riq = radar();
    riq.start();
    for (int16_t x = 1000; x <= 4000; x += 1000) {
        inject(*state_, pointFrame(x));
    }
    ASSERT_TRUE(waitUntil([&] { return riq.getQueueSize() == 2; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(riq.getQueueSize(), 2u);

    EXPECT_DOUBLE_EQ(riq.getFrame()->points[0].x, 1.0);
    EXPECT_DOUBLE_EQ(riq.getFrame()->points[0].x, 2.0);
    EXPECT_FALSE(riq.getFrame());
}

TEST_F(RadarIQTest, UnboundedQueue) {
    RadarIQ::Options options = defaultOptions();
    options.queue_length = 0;
    RadarIQ& riq = radar(options);
    riq.start();
    for (int16_t x = 1000; x <= 5000; x += 1000) {
        inject(*state_, pointFrame(x));
    }
    EXPECT_TRUE(waitUntil([&] { return riq.getQueueSize() == 5; }));
}

TEST_F(RadarIQTest, CommandsRefusedWhileCapturing) {
    RadarIQ& riq = radar();
    riq.start();
    EXPECT_THROW(riq.getFrameRate(), RadarError);
    EXPECT_THROW(riq.setMode(CaptureMode::ObjectTracking), RadarError);

    riq.stop();
    EXPECT_FALSE(riq.isCapturing());
    EXPECT_EQ(riq.getFrameRate(), 5);
}

TEST_F(RadarIQTest, StartWhileCapturingIsIgnored) {
    RadarIQ& riq = radar();
    riq.start();
    riq.start();
    EXPECT_EQ(sensor([](test::FakeSensorState& s) { return s.start_requests; }), 1);
}

TEST_F(RadarIQTest, FramesSurviveStop) {
    RadarIQ& riq = radar();
    riq.start();
    inject(*state_, pointFrame(1000));
    ASSERT_TRUE(waitUntil([&] { return riq.getQueueSize() == 1; }));
    riq.stop();
    EXPECT_TRUE(riq.getData(10ms));
}

TEST_F(RadarIQTest, StartClearsOldFrames) {
    RadarIQ& riq = radar();
    riq.start();
    inject(*state_, pointFrame(1000));
    ASSERT_TRUE(waitUntil([&] { return riq.getQueueSize() == 1; }));
    riq.stop();

    riq.start(0, false);
    EXPECT_EQ(riq.getQueueSize(), 1u);
    riq.stop();

    riq.start();
    EXPECT_EQ(riq.getQueueSize(), 0u);
}

TEST_F(RadarIQTest, ObjectFramesUseConfiguredUnitsAndMirror) {
    RadarIQ& riq = radar();
    riq.setUnits("mm", "mm/s", "mm/s^2");
    riq.setMirror(true);
    riq.start();
    inject(*state_, objectSubframe(SUBFRAME_END_OF_FRAME,
                                   {RawObject{4, {1500, 200, 0}, {10, 0, 0}, {5, 0, 0}}}));

    auto frame = riq.getData(1000ms);
    ASSERT_TRUE(frame);
    EXPECT_EQ(frame->mode, CaptureMode::ObjectTracking);
    ASSERT_EQ(frame->objects.size(), 1u);
    EXPECT_EQ(frame->objects[0].tracking_id, 4);
    EXPECT_DOUBLE_EQ(frame->objects[0].x_pos, -1500.0);
    EXPECT_DOUBLE_EQ(frame->objects[0].y_pos, 200.0);
    EXPECT_DOUBLE_EQ(frame->objects[0].x_vel, -10.0);
    EXPECT_DOUBLE_EQ(frame->objects[0].x_acc, -5.0);
}

TEST_F(RadarIQTest, ArrayOutput) {
    RadarIQ::Options options = defaultOptions();
    options.output_format = OutputFormat::Array;
    RadarIQ& riq = radar(options);
    riq.start();
    inject(*state_, pointSubframe(SUBFRAME_END_OF_FRAME,
                                  {RawPoint{1000, 0, 0, 5, 0}, RawPoint{2000, 0, 0, 6, 0}}));

    auto frame = riq.getData(1000ms);
    ASSERT_TRUE(frame);
    ASSERT_EQ(frame->array.rows(), 2);
    ASSERT_EQ(frame->array.cols(), POINT_CLOUD_COLUMNS);
    EXPECT_DOUBLE_EQ(frame->array(1, 0), 2.0);
    EXPECT_DOUBLE_EQ(frame->array(1, 3), 6.0);
}

TEST_F(RadarIQTest, CollectsStatisticsDuringCapture) {
    RadarIQ& riq = radar();
    EXPECT_FALSE(riq.getStatistics().core);

    riq.start();
    ByteWriter core;
    core.u8(CMD_CORE_STATISTICS).u8(VARIANT_RESPONSE);
    for (int i = 0; i < 7; ++i) core.u32(10);
    for (int i = 0; i < 10; ++i) core.i16(45);
    inject(*state_, core.release());
    inject(*state_, ByteWriter()
                        .u8(CMD_POINT_CLOUD_STATISTICS).u8(VARIANT_RESPONSE)
                        .u32(1).u32(2).u32(3).u32(4).u32(5).u32(64)
                        .u8(0).u8(0)
                        .release());

    ASSERT_TRUE(waitUntil([&] {
        Statistics stats = riq.getStatistics();
        return stats.core && stats.point_cloud;
    }));
    Statistics stats = riq.getStatistics();
    EXPECT_EQ(stats.core->temperature_rx_0, 45);
    EXPECT_EQ(stats.point_cloud->num_transmitted_points, 64u);
}

TEST_F(RadarIQTest, SurvivesMessagesAndGarbageDuringCapture) {
    RadarIQ& riq = radar();
    riq.start();
    inject(*state_, test::sensorMessage(4, 2, "Frame overrun"));
    std::vector<uint8_t> truncated = pointFrame(1000);
    truncated[3] = 5;  // claims more points than it carries
    inject(*state_, truncated);
    inject(*state_, pointFrame(2000));

    auto frame = riq.getData(1000ms);
    ASSERT_TRUE(frame);
    ASSERT_EQ(frame->points.size(), 1u);
    EXPECT_DOUBLE_EQ(frame->points[0].x, 2.0);
}

TEST_F(RadarIQTest, DisconnectEndsCapture) {
    RadarIQ& riq = radar();
    riq.start();
    test::unplug(*state_);

    EXPECT_TRUE(waitUntil([&] { return sawStatus(ConnectionStatus::Disconnected); }));
    EXPECT_TRUE(waitUntil([&] { return !riq.isCapturing(); }));
    EXPECT_TRUE(waitUntil([&] { return sawStatus(ConnectionStatus::Reconnected); }));

    // Usable again after the reconnect.
    EXPECT_EQ(riq.getFrameRate(), 5);
}

TEST_F(RadarIQTest, GetDataTimesOut) {
    RadarIQ& riq = radar();
    riq.start();
    auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(riq.getData(50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - begin, 50ms);
}

TEST(RadarIQPort, NamedPortThatCannotBeOpenedFails) {
    RadarIQ::Options options;
    options.port = "/dev/radariq_does_not_exist";
    try {
        RadarIQ riq(options);
        FAIL() << "expected SerialError";
    } catch (const SerialError& e) {
        EXPECT_NE(std::string(e.what()).find("/dev/radariq_does_not_exist"), std::string::npos);
    }
}
