// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#include "rgbd_recorder/realsense_device.hpp"

#include <iterator>
#include <stdexcept>

namespace rgbd_recorder
{

    RealSenseDevice::RealSenseDevice()
        : pipeline_(ctx_)
    {
    }

    RealSenseDevice::~RealSenseDevice()
    {
        if (!streaming_)
            return;
        try
        {
            pipeline_.stop();
        }
        catch (const rs2::error &)
        {
            // device already gone; nothing left to release
        }
    }

    std::vector<DeviceIdentity> RealSenseDevice::enumerate()
    {
        std::vector<DeviceIdentity> out;
        for (auto &&dev : ctx_.query_devices())
            out.push_back(identityOf(dev));
        return out;
    }

    rs2::config RealSenseDevice::makeConfig(const std::string &serial, const StreamConfig &config)
    {
        rs2::config cfg;
        cfg.enable_device(serial);
        cfg.enable_stream(RS2_STREAM_COLOR, config.color_width, config.color_height,
                          RS2_FORMAT_BGR8, config.color_fps);
        cfg.enable_stream(RS2_STREAM_DEPTH, config.depth_width, config.depth_height,
                          RS2_FORMAT_Z16, config.depth_fps);
        return cfg;
    }

    bool RealSenseDevice::supports(const std::string &serial, const StreamConfig &config)
    {
        rs2::config cfg = makeConfig(serial, config);
        return cfg.can_resolve(pipeline_);
    }

    void RealSenseDevice::start(const std::string &serial, const StreamConfig &config)
    {
        if (streaming_)
            throw std::runtime_error("pipeline already started");
        rs2::config cfg = makeConfig(serial, config);
        profile_ = pipeline_.start(cfg);
        streaming_ = true;
    }

    void RealSenseDevice::stop()
    {
        if (!streaming_)
            return;
        streaming_ = false;
        profile_ = rs2::pipeline_profile();
        pipeline_.stop();
    }

    DeviceIdentity RealSenseDevice::identityOf(const rs2::device &dev)
    {
        auto info = [&dev](rs2_camera_info key) -> std::string
        {
            return dev.supports(key) ? std::string(dev.get_info(key)) : std::string();
        };
        DeviceIdentity id;
        id.name = info(RS2_CAMERA_INFO_NAME);
        id.serial = info(RS2_CAMERA_INFO_SERIAL_NUMBER);
        id.firmware = info(RS2_CAMERA_INFO_FIRMWARE_VERSION);
        id.product_id = info(RS2_CAMERA_INFO_PRODUCT_ID);
        return id;
    }

    DeviceIdentity RealSenseDevice::activeIdentity() const
    {
        if (!streaming_)
            throw std::runtime_error("pipeline not started");
        return identityOf(profile_.get_device());
    }

    FrameSet RealSenseDevice::viewsOf(const std::shared_ptr<rs2::frameset> &frames)
    {
        FrameSet out;
        out.keep = frames;

        if (rs2::video_frame color = frames->get_color_frame())
        {
            out.color = cv::Mat(color.get_height(), color.get_width(), CV_8UC3,
                                const_cast<void *>(color.get_data()),
                                static_cast<size_t>(color.get_stride_in_bytes()));
        }
        if (rs2::depth_frame depth = frames->get_depth_frame())
        {
            out.depth = cv::Mat(depth.get_height(), depth.get_width(), CV_16UC1,
                                const_cast<void *>(depth.get_data()),
                                static_cast<size_t>(depth.get_stride_in_bytes()));
        }
        return out;
    }

    bool RealSenseDevice::waitForFrames(std::chrono::milliseconds timeout, FrameSet &out)
    {
        if (!streaming_)
            throw std::runtime_error("pipeline not started");
        rs2::frameset frames;
        if (!pipeline_.try_wait_for_frames(&frames, static_cast<unsigned int>(timeout.count())))
            return false;
        out = viewsOf(std::make_shared<rs2::frameset>(frames));
        return true;
    }

    FrameSet RealSenseDevice::alignToColor(const FrameSet &frames)
    {
        auto raw = std::static_pointer_cast<rs2::frameset>(frames.keep);
        if (!raw)
            throw std::runtime_error("frame set does not come from this device");
        return viewsOf(std::make_shared<rs2::frameset>(align_.process(*raw)));
    }

    StreamIntrinsics RealSenseDevice::intrinsics(StreamKind stream) const
    {
        if (!streaming_)
            throw std::runtime_error("pipeline not started");
        const rs2_stream type = stream == StreamKind::Color ? RS2_STREAM_COLOR : RS2_STREAM_DEPTH;
        const rs2_intrinsics intr =
            profile_.get_stream(type).as<rs2::video_stream_profile>().get_intrinsics();

        StreamIntrinsics out;
        out.width = intr.width;
        out.height = intr.height;
        out.fx = intr.fx;
        out.fy = intr.fy;
        out.ppx = intr.ppx;
        out.ppy = intr.ppy;
        out.distortion_model = rs2_distortion_to_string(intr.model);
        out.distortion.assign(std::begin(intr.coeffs), std::end(intr.coeffs));
        return out;
    }

    float RealSenseDevice::depthScale() const
    {
        if (!streaming_)
            throw std::runtime_error("pipeline not started");
        rs2::depth_sensor sensor = profile_.get_device().first<rs2::depth_sensor>();
        return sensor.get_depth_scale();
    }

} // namespace rgbd_recorder
