// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <opencv2/core.hpp>

namespace rgbd_recorder
{

    struct DeviceIdentity
    {
        std::string name, serial, firmware, product_id;
    };

    enum class StreamKind
    {
        Color,
        Depth
    };

    // Fixed stream parameters negotiated on connect.
    struct StreamConfig
    {
        int color_width = 1280;
        int color_height = 800;
        int color_fps = 30; // BGR8
        int depth_width = 1280;
        int depth_height = 720;
        int depth_fps = 30; // Z16
    };

    struct StreamIntrinsics
    {
        int width = 0;
        int height = 0;
        double fx = 0.0, fy = 0.0;
        double ppx = 0.0, ppy = 0.0;
        std::string distortion_model = "plumb_bob";
        std::vector<double> distortion;

        Eigen::Matrix3d cameraMatrix() const;
    };

    struct CameraIntrinsics
    {
        StreamIntrinsics color;
        StreamIntrinsics depth;
    };

    // Frames handed out by the device. The Mats may point into SDK memory
    // that is only valid while `keep` is alive; callers copy before releasing it.
    struct FrameSet
    {
        cv::Mat color; // CV_8UC3, BGR
        cv::Mat depth; // CV_16UC1, raw units
        std::shared_ptr<void> keep;

        bool empty() const { return color.empty() && depth.empty(); }
    };

    // Capability set of the sensor SDK. Implementations throw
    // std::runtime_error (or a subclass) on SDK failures; callers convert.
    class CameraDevice
    {
    public:
        virtual ~CameraDevice() = default;

        virtual std::vector<DeviceIdentity> enumerate() = 0;

        /// True when the device with @p serial can provide @p config.
        virtual bool supports(const std::string &serial, const StreamConfig &config) = 0;

        virtual void start(const std::string &serial, const StreamConfig &config) = 0;
        virtual void stop() = 0;
        virtual bool isStreaming() const = 0;

        /// Identity of the device currently streaming.
        virtual DeviceIdentity activeIdentity() const = 0;

        /// Returns false when nothing arrived within @p timeout.
        virtual bool waitForFrames(std::chrono::milliseconds timeout, FrameSet &out) = 0;

        /// Reproject depth into the color sensor geometry. Missing streams come back empty.
        virtual FrameSet alignToColor(const FrameSet &frames) = 0;

        virtual StreamIntrinsics intrinsics(StreamKind stream) const = 0;
        virtual float depthScale() const = 0;
    };

} // namespace rgbd_recorder
