#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include <rclcpp/logger.hpp>

#include "fake_camera_device.hpp"
#include "rgbd_recorder/device_session.hpp"
#include "rgbd_recorder/frame_acquirer.hpp"

using rgbd_recorder::ErrorKind;
using rgbd_recorder::device_session::DeviceSession;
using rgbd_recorder::frame_acquirer::FrameAcquirer;
using rgbd_recorder::frame_acquirer::FramePair;
using rgbd_recorder::test::FakeCameraDevice;

namespace
{
    class FrameAcquirerTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            session_ = std::make_unique<DeviceSession>(fake_, logger_);
        }

        std::unique_ptr<FrameAcquirer> connectAndCreate()
        {
            EXPECT_TRUE(session_->connect(0).ok());
            std::unique_ptr<FrameAcquirer> acq;
            EXPECT_TRUE(FrameAcquirer::create(*session_, logger_, acq).ok());
            return acq;
        }

        std::shared_ptr<FakeCameraDevice> fake_ = std::make_shared<FakeCameraDevice>();
        rclcpp::Logger logger_ = rclcpp::get_logger("test_frame_acquirer");
        std::unique_ptr<DeviceSession> session_;
    };
} // namespace

TEST_F(FrameAcquirerTest, CreateRequiresConnectedSession)
{
    std::unique_ptr<FrameAcquirer> acq;
    const auto status = FrameAcquirer::create(*session_, logger_, acq);
    EXPECT_EQ(status.kind(), ErrorKind::Connection);
    EXPECT_TRUE(acq == nullptr);
    EXPECT_EQ(fake_->start_calls, 0);
}

TEST_F(FrameAcquirerTest, SequentialCapturesHaveConsecutiveIndices)
{
    auto acq = connectAndCreate();
    ASSERT_TRUE(acq != nullptr);

    constexpr uint64_t N = 12;
    for (uint64_t i = 0; i < N; ++i)
    {
        FramePair pair;
        ASSERT_TRUE(acq->captureFrame(pair).ok());
        EXPECT_EQ(pair.index, i);
    }
    EXPECT_EQ(acq->getFrameCount(), N);
}

TEST_F(FrameAcquirerTest, AlignedPairSharesColorGeometry)
{
    auto acq = connectAndCreate();
    FramePair pair;
    ASSERT_TRUE(acq->captureFrame(pair).ok());
    EXPECT_EQ(pair.color.type(), CV_8UC3);
    EXPECT_EQ(pair.depth.type(), CV_16UC1);
    EXPECT_EQ(pair.color.size(), cv::Size(1280, 800));
    EXPECT_EQ(pair.depth.size(), pair.color.size());
}

TEST_F(FrameAcquirerTest, PairsOwnTheirPixels)
{
    auto acq = connectAndCreate();
    FramePair first, second;
    ASSERT_TRUE(acq->captureFrame(first).ok());
    ASSERT_TRUE(acq->captureFrame(second).ok());

    // The fake rewrites the same buffers on every call.
    EXPECT_EQ(first.color.at<cv::Vec3b>(10, 10), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(first.depth.at<uint16_t>(10, 10), 1000);
    EXPECT_EQ(second.color.at<cv::Vec3b>(10, 10), cv::Vec3b(1, 1, 1));
    EXPECT_EQ(second.depth.at<uint16_t>(10, 10), 1001);
    EXPECT_NE(first.color.data, second.color.data);
}

TEST_F(FrameAcquirerTest, TimeoutIsCaptureErrorAndDoesNotCount)
{
    fake_->timeout_at = 1;
    auto acq = connectAndCreate();

    FramePair pair;
    ASSERT_TRUE(acq->captureFrame(pair).ok());
    const auto status = acq->captureFrame(pair);
    EXPECT_EQ(status.kind(), ErrorKind::Capture);
    EXPECT_NE(status.message().find("timeout"), std::string::npos);
    EXPECT_EQ(acq->getFrameCount(), 1u);

    ASSERT_TRUE(acq->captureFrame(pair).ok());
    EXPECT_EQ(pair.index, 1u);
}

TEST_F(FrameAcquirerTest, MissingAlignedDepthIsCaptureError)
{
    fake_->drop_depth_at = 0;
    auto acq = connectAndCreate();

    FramePair pair;
    const auto status = acq->captureFrame(pair);
    EXPECT_EQ(status.kind(), ErrorKind::Capture);
    EXPECT_EQ(status.message(), "Missing aligned frames");
    EXPECT_EQ(acq->getFrameCount(), 0u);
}

TEST_F(FrameAcquirerTest, SdkFailureIsCaptureError)
{
    fake_->throw_at = 0;
    auto acq = connectAndCreate();

    FramePair pair;
    const auto status = acq->captureFrame(pair);
    EXPECT_EQ(status.kind(), ErrorKind::Capture);
    EXPECT_TRUE(status.isCameraError());
}

TEST_F(FrameAcquirerTest, CaptureAfterDisconnectFails)
{
    auto acq = connectAndCreate();
    session_->disconnect();

    FramePair pair;
    EXPECT_EQ(acq->captureFrame(pair).kind(), ErrorKind::Capture);
    EXPECT_EQ(fake_->wait_calls, 0u);
}

TEST_F(FrameAcquirerTest, DepthScaleIsQueriedOnce)
{
    fake_->depth_scales = {0.00025f, 0.5f};
    auto acq = connectAndCreate();

    EXPECT_FLOAT_EQ(acq->getDepthScale(), 0.00025f);
    EXPECT_FLOAT_EQ(acq->getDepthScale(), 0.00025f);
    EXPECT_EQ(fake_->depth_scale_queries, 1);
}

TEST_F(FrameAcquirerTest, DepthScaleFallsBackToDefaultAndCachesIt)
{
    fake_->depth_scale_throws = true;
    auto acq = connectAndCreate();

    EXPECT_FLOAT_EQ(acq->getDepthScale(), FrameAcquirer::kDefaultDepthScale);
    fake_->depth_scale_throws = false;
    fake_->depth_scales = {0.5f};
    EXPECT_FLOAT_EQ(acq->getDepthScale(), 0.001f);
    EXPECT_EQ(fake_->depth_scale_queries, 1);
}

TEST_F(FrameAcquirerTest, StreamIntrinsics)
{
    auto acq = connectAndCreate();
    const auto depth = acq->getDepthIntrinsics();
    const auto rgb = acq->getRgbIntrinsics();
    ASSERT_TRUE(depth.has_value());
    ASSERT_TRUE(rgb.has_value());
    EXPECT_EQ(depth->width, 1280);
    EXPECT_EQ(depth->height, 720);
    EXPECT_DOUBLE_EQ(rgb->ppy, 401.5);

    fake_->intrinsics_throw = true;
    EXPECT_FALSE(acq->getDepthIntrinsics().has_value());
    EXPECT_FALSE(acq->getRgbIntrinsics().has_value());
}
