// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#include "rgbd_recorder/frame_acquirer.hpp"
#include "rgbd_recorder/device_session.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <rclcpp/logging.hpp>

namespace rgbd_recorder::frame_acquirer
{

    FrameAcquirer::FrameAcquirer(ConstructionKey, device_session::DeviceSession &session, rclcpp::Logger logger)
        : session_(session), logger_(std::move(logger))
    {
        RCLCPP_INFO(logger_, "FrameAcquirer initialized");
    }

    Status FrameAcquirer::create(device_session::DeviceSession &session,
                                 rclcpp::Logger logger,
                                 std::unique_ptr<FrameAcquirer> &out)
    {
        if (!session.isConnected())
        {
            RCLCPP_ERROR(logger, "FrameAcquirer requires a connected device session");
            return Status::Error(ErrorKind::Connection,
                                 "Device session must be connected before creating a frame acquirer");
        }
        out = std::make_unique<FrameAcquirer>(ConstructionKey{}, session, std::move(logger));
        return Status::Ok();
    }

    Status FrameAcquirer::captureFrame(FramePair &out)
    {
        if (!session_.isConnected())
            return Status::Error(ErrorKind::Capture, "Frame capture failed: device session is not connected");

        CameraDevice &device = session_.device();
        try
        {
            FrameSet raw;
            if (!device.waitForFrames(kCaptureTimeout, raw))
            {
                return Status::Error(ErrorKind::Capture,
                                     "Frame capture timeout: no frame set within " +
                                         std::to_string(kCaptureTimeout.count()) + " ms");
            }
            if (raw.empty())
                return Status::Error(ErrorKind::Capture, "Received empty frameset");

            const FrameSet aligned = device.alignToColor(raw);
            if (aligned.color.empty() || aligned.depth.empty())
                return Status::Error(ErrorKind::Capture, "Missing aligned frames");

            if (aligned.color.type() != CV_8UC3 || aligned.depth.type() != CV_16UC1)
            {
                return Status::Error(ErrorKind::Capture,
                                     "Unexpected aligned frame formats (color type " +
                                         std::to_string(aligned.color.type()) + ", depth type " +
                                         std::to_string(aligned.depth.type()) + ")");
            }

            // Deep copies; the SDK recycles its buffers once `aligned` and `raw` go away.
            out.color = aligned.color.clone();
            out.depth = aligned.depth.clone();
        }
        catch (const std::exception &e)
        {
            const std::string what = e.what();
            if (what.find("timeout") != std::string::npos || what.find("didn't arrive") != std::string::npos)
                return Status::Error(ErrorKind::Capture, "Frame capture timeout: " + what);
            return Status::Error(ErrorKind::Capture, "Frame capture failed: " + what);
        }

        out.index = frame_count_++;
        RCLCPP_DEBUG(logger_, "Captured frame %llu (%dx%d)",
                     static_cast<unsigned long long>(out.index), out.color.cols, out.color.rows);
        return Status::Ok();
    }

    float FrameAcquirer::getDepthScale()
    {
        if (depth_scale_)
            return *depth_scale_;

        try
        {
            if (!session_.isConnected())
                throw std::runtime_error("device session is not connected");
            depth_scale_ = session_.device().depthScale();
            RCLCPP_INFO(logger_, "Depth scale: %f m/unit", static_cast<double>(*depth_scale_));
        }
        catch (const std::exception &e)
        {
            RCLCPP_WARN(logger_, "Could not get depth scale: %s. Falling back to default value %f",
                        e.what(), static_cast<double>(kDefaultDepthScale));
            depth_scale_ = kDefaultDepthScale;
        }
        return *depth_scale_;
    }

    std::optional<StreamIntrinsics> FrameAcquirer::streamIntrinsics(StreamKind stream, const char *label)
    {
        try
        {
            if (!session_.isConnected())
                throw std::runtime_error("device session is not connected");
            return session_.device().intrinsics(stream);
        }
        catch (const std::exception &e)
        {
            RCLCPP_ERROR(logger_, "Could not get %s intrinsics: %s", label, e.what());
            return std::nullopt;
        }
    }

    std::optional<StreamIntrinsics> FrameAcquirer::getDepthIntrinsics()
    {
        return streamIntrinsics(StreamKind::Depth, "depth");
    }

    std::optional<StreamIntrinsics> FrameAcquirer::getRgbIntrinsics()
    {
        return streamIntrinsics(StreamKind::Color, "RGB");
    }

} // namespace rgbd_recorder::frame_acquirer
