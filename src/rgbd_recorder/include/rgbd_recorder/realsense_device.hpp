// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#pragma once

#include "rgbd_recorder/camera_device.hpp"

#include <librealsense2/rs.hpp>

namespace rgbd_recorder
{

    // CameraDevice backed by librealsense2 (D4xx family).
    class RealSenseDevice : public CameraDevice
    {
    public:
        RealSenseDevice();
        ~RealSenseDevice() override;

        std::vector<DeviceIdentity> enumerate() override;
        bool supports(const std::string &serial, const StreamConfig &config) override;

        void start(const std::string &serial, const StreamConfig &config) override;
        void stop() override;
        bool isStreaming() const override { return streaming_; }
        DeviceIdentity activeIdentity() const override;

        bool waitForFrames(std::chrono::milliseconds timeout, FrameSet &out) override;
        FrameSet alignToColor(const FrameSet &frames) override;

        StreamIntrinsics intrinsics(StreamKind stream) const override;
        float depthScale() const override;

    private:
        static rs2::config makeConfig(const std::string &serial, const StreamConfig &config);
        static DeviceIdentity identityOf(const rs2::device &dev);
        static FrameSet viewsOf(const std::shared_ptr<rs2::frameset> &frames);

        rs2::context ctx_;
        rs2::pipeline pipeline_;
        rs2::pipeline_profile profile_;
        rs2::align align_{RS2_STREAM_COLOR};
        bool streaming_ = false;
    };

} // namespace rgbd_recorder
