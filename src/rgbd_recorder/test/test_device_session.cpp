#include <gtest/gtest.h>

#include <memory>

#include <rclcpp/logger.hpp>

#include "fake_camera_device.hpp"
#include "rgbd_recorder/device_session.hpp"

using rgbd_recorder::ErrorKind;
using rgbd_recorder::device_session::DeviceSession;
using rgbd_recorder::test::FakeCameraDevice;

namespace
{
    class DeviceSessionTest : public ::testing::Test
    {
    protected:
        std::shared_ptr<FakeCameraDevice> fake_ = std::make_shared<FakeCameraDevice>();
        rclcpp::Logger logger_ = rclcpp::get_logger("test_device_session");
    };
} // namespace

TEST_F(DeviceSessionTest, ListDevicesReturnsEnumeratedIdentities)
{
    DeviceSession session(fake_, logger_);
    const auto devices = session.listDevices();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].name, "Fake RealSense D456");
    EXPECT_EQ(devices[0].serial, "000111");
    EXPECT_EQ(devices[1].firmware, "5.15.1.0");
    EXPECT_EQ(devices[1].product_id, "0B07");
}

TEST_F(DeviceSessionTest, EnumerationFailureDegradesToEmptyList)
{
    fake_->enumerate_throws = true;
    DeviceSession session(fake_, logger_);
    EXPECT_TRUE(session.listDevices().empty());
}

TEST_F(DeviceSessionTest, ConnectWithoutDevicesIsConnectionError)
{
    fake_->devices.clear();
    DeviceSession session(fake_, logger_);
    const auto status = session.connect(0);
    EXPECT_EQ(status.kind(), ErrorKind::Connection);
    EXPECT_TRUE(status.isCameraError());
    EXPECT_FALSE(session.isConnected());
    EXPECT_EQ(fake_->start_calls, 0);
}

TEST_F(DeviceSessionTest, ConnectWithIndexOutOfRangeIsConnectionError)
{
    DeviceSession session(fake_, logger_);
    const auto status = session.connect(5);
    EXPECT_EQ(status.kind(), ErrorKind::Connection);
    EXPECT_NE(status.message().find("out of range"), std::string::npos);
    EXPECT_FALSE(session.isConnected());
    EXPECT_EQ(fake_->start_calls, 0);

    EXPECT_EQ(session.connect(-1).kind(), ErrorKind::Connection);
}

TEST_F(DeviceSessionTest, RejectedStreamConfigurationIsWrappedAsConnectionError)
{
    fake_->stream_supported = false;
    DeviceSession session(fake_, logger_);
    const auto status = session.connect(0);
    EXPECT_EQ(status.kind(), ErrorKind::Connection);
    EXPECT_EQ(status.causeKind(), ErrorKind::Configuration);
    EXPECT_NE(status.message().find("1280x800@30fps"), std::string::npos);
    EXPECT_FALSE(session.isConnected());
}

TEST_F(DeviceSessionTest, StartFailureKeepsTheCauseInTheMessage)
{
    fake_->start_throws = true;
    DeviceSession session(fake_, logger_);
    const auto status = session.connect(1);
    EXPECT_EQ(status.kind(), ErrorKind::Connection);
    EXPECT_NE(status.message().find("Couldn't resolve requests"), std::string::npos);
    EXPECT_FALSE(session.isConnected());
}

TEST_F(DeviceSessionTest, ConnectStartsTheSelectedDevice)
{
    DeviceSession session(fake_, logger_);
    ASSERT_TRUE(session.connect(1).ok());
    EXPECT_TRUE(session.isConnected());
    EXPECT_EQ(session.deviceIndex(), 1);
    EXPECT_EQ(fake_->started_serial, "000222");

    const auto info = session.getCameraInfo();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->serial, "000222");
    EXPECT_EQ(info->name, "Fake RealSense D435");

    const auto intr = session.getIntrinsics();
    ASSERT_TRUE(intr.has_value());
    EXPECT_EQ(intr->color.width, 1280);
    EXPECT_EQ(intr->color.height, 800);
    EXPECT_EQ(intr->depth.height, 720);
    EXPECT_DOUBLE_EQ(intr->color.fx, 640.5);
}

TEST_F(DeviceSessionTest, SecondConnectIsRejected)
{
    DeviceSession session(fake_, logger_);
    ASSERT_TRUE(session.connect(0).ok());
    EXPECT_EQ(session.connect(1).kind(), ErrorKind::Connection);
    EXPECT_EQ(fake_->start_calls, 1);
    EXPECT_EQ(fake_->started_serial, "000111");
}

TEST_F(DeviceSessionTest, DiagnosticsAreEmptyWhenNotConnected)
{
    DeviceSession session(fake_, logger_);
    EXPECT_FALSE(session.getIntrinsics().has_value());
    EXPECT_FALSE(session.getCameraInfo().has_value());
}

TEST_F(DeviceSessionTest, IntrinsicsAreEmptyWhenQueryFails)
{
    fake_->intrinsics_throw = true;
    DeviceSession session(fake_, logger_);
    ASSERT_TRUE(session.connect(0).ok());
    EXPECT_FALSE(session.getIntrinsics().has_value());
    EXPECT_TRUE(session.getCameraInfo().has_value());
}

TEST_F(DeviceSessionTest, DisconnectIsIdempotent)
{
    DeviceSession session(fake_, logger_);
    session.disconnect();
    EXPECT_EQ(fake_->stop_calls, 0);

    ASSERT_TRUE(session.connect(0).ok());
    session.disconnect();
    session.disconnect();
    EXPECT_FALSE(session.isConnected());
    EXPECT_EQ(fake_->stop_calls, 1);
    EXPECT_FALSE(session.getCameraInfo().has_value());
}

TEST_F(DeviceSessionTest, DisconnectSwallowsStopFailure)
{
    fake_->stop_throws = true;
    DeviceSession session(fake_, logger_);
    ASSERT_TRUE(session.connect(0).ok());
    EXPECT_NO_THROW(session.disconnect());
    EXPECT_FALSE(session.isConnected());
}

TEST_F(DeviceSessionTest, DestructionReleasesTheDevice)
{
    {
        DeviceSession session(fake_, logger_);
        ASSERT_TRUE(session.connect(0).ok());
    }
    EXPECT_EQ(fake_->stop_calls, 1);
    EXPECT_FALSE(fake_->isStreaming());
}

TEST_F(DeviceSessionTest, ReconnectAfterDisconnect)
{
    DeviceSession session(fake_, logger_);
    ASSERT_TRUE(session.connect(0).ok());
    session.disconnect();
    ASSERT_TRUE(session.connect(1).ok());
    EXPECT_EQ(session.getCameraInfo()->serial, "000222");
}
