// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include <opencv2/core.hpp>
#include <rclcpp/logger.hpp>

#include "rgbd_recorder/camera_device.hpp"
#include "rgbd_recorder/status.hpp"

namespace rgbd_recorder::device_session { class DeviceSession; }

namespace rgbd_recorder::frame_acquirer
{

    // One aligned color/depth pair. Both Mats own their pixels.
    struct FramePair
    {
        uint64_t index = 0;
        cv::Mat color; // CV_8UC3, BGR
        cv::Mat depth; // CV_16UC1, raw sensor units in color geometry
    };

    class FrameAcquirer
    {
        struct ConstructionKey
        {
            explicit ConstructionKey() = default;
        };

    public:
        static constexpr std::chrono::milliseconds kCaptureTimeout{1000};
        static constexpr float kDefaultDepthScale = 0.001f; // millimeter sensor

        // Fails with a Connection error when @p session is not connected.
        static Status create(device_session::DeviceSession &session,
                             rclcpp::Logger logger,
                             std::unique_ptr<FrameAcquirer> &out);

        // Block up to kCaptureTimeout for the next frame set, align depth to
        // color and copy both images out of the SDK buffers.
        Status captureFrame(FramePair &out);

        uint64_t getFrameCount() const { return frame_count_; }

        // Meters per raw depth unit. Queried once, falls back to kDefaultDepthScale.
        float getDepthScale();

        std::optional<StreamIntrinsics> getDepthIntrinsics();
        std::optional<StreamIntrinsics> getRgbIntrinsics();

        // Only reachable through create().
        FrameAcquirer(ConstructionKey, device_session::DeviceSession &session, rclcpp::Logger logger);

    private:

        std::optional<StreamIntrinsics> streamIntrinsics(StreamKind stream, const char *label);

        device_session::DeviceSession &session_;
        rclcpp::Logger logger_;
        uint64_t frame_count_ = 0;
        std::optional<float> depth_scale_;
    };

} // namespace rgbd_recorder::frame_acquirer
