// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "rgbd_recorder/camera_device.hpp"

namespace rgbd_recorder::test
{

    // In-memory camera. Frames are written into buffers that are reused on
    // every call, the way the SDK recycles its frame pool.
    class FakeCameraDevice : public CameraDevice
    {
    public:
        FakeCameraDevice()
        {
            devices = {{"Fake RealSense D456", "000111", "5.16.0.1", "0B5C"},
                       {"Fake RealSense D435", "000222", "5.15.1.0", "0B07"}};
        }

        // ---- behaviour knobs
        std::vector<DeviceIdentity> devices;
        bool enumerate_throws = false;
        bool stream_supported = true;
        bool start_throws = false;
        bool stop_throws = false;
        bool intrinsics_throw = false;
        bool depth_scale_throws = false;
        std::vector<float> depth_scales = {0.001f};
        std::optional<uint64_t> timeout_at;     // wait call index that times out
        std::optional<uint64_t> throw_at;       // wait call index that throws
        std::optional<uint64_t> drop_depth_at;  // wait call index whose aligned depth is missing
        cv::Size color_size{1280, 800};
        cv::Size depth_size{1280, 720};

        // ---- observations
        int start_calls = 0;
        int stop_calls = 0;
        mutable int depth_scale_queries = 0;
        uint64_t wait_calls = 0;
        std::string started_serial;

        std::vector<DeviceIdentity> enumerate() override
        {
            if (enumerate_throws)
                throw std::runtime_error("usb enumeration failed");
            return devices;
        }

        bool supports(const std::string &, const StreamConfig &) override { return stream_supported; }

        void start(const std::string &serial, const StreamConfig &) override
        {
            ++start_calls;
            if (start_throws)
                throw std::runtime_error("Couldn't resolve requests");
            started_serial = serial;
            streaming_ = true;
        }

        void stop() override
        {
            ++stop_calls;
            streaming_ = false;
            if (stop_throws)
                throw std::runtime_error("stop() cannot be called before start()");
        }

        bool isStreaming() const override { return streaming_; }

        DeviceIdentity activeIdentity() const override
        {
            for (const auto &d : devices)
                if (d.serial == started_serial)
                    return d;
            throw std::runtime_error("no active device");
        }

        bool waitForFrames(std::chrono::milliseconds, FrameSet &out) override
        {
            const uint64_t call = wait_calls++;
            if (timeout_at && *timeout_at == call)
                return false;
            if (throw_at && *throw_at == call)
                throw std::runtime_error("Frame didn't arrive within 1000");

            color_buf_.create(color_size, CV_8UC3);
            depth_buf_.create(depth_size, CV_16UC1);
            color_buf_.setTo(cv::Scalar::all(static_cast<double>(call % 256)));
            depth_buf_.setTo(cv::Scalar(static_cast<double>(1000 + call)));

            out.color = color_buf_;
            out.depth = depth_buf_;
            out.keep = std::make_shared<uint64_t>(call);
            return true;
        }

        FrameSet alignToColor(const FrameSet &frames) override
        {
            FrameSet out;
            out.keep = frames.keep;
            out.color = frames.color;
            const uint64_t call = *std::static_pointer_cast<uint64_t>(frames.keep);
            if (drop_depth_at && *drop_depth_at == call)
                return out;
            cv::resize(frames.depth, aligned_depth_buf_, frames.color.size(), 0, 0, cv::INTER_NEAREST);
            out.depth = aligned_depth_buf_;
            return out;
        }

        StreamIntrinsics intrinsics(StreamKind stream) const override
        {
            if (intrinsics_throw)
                throw std::runtime_error("profile has no intrinsics");
            StreamIntrinsics intr;
            const bool color = stream == StreamKind::Color;
            intr.width = color ? color_size.width : depth_size.width;
            intr.height = color ? color_size.height : depth_size.height;
            intr.fx = color ? 640.5 : 635.25;
            intr.fy = color ? 641.0 : 635.25;
            intr.ppx = color ? 639.75 : 642.0;
            intr.ppy = color ? 401.5 : 360.5;
            intr.distortion_model = color ? "Inverse Brown Conrady" : "Brown Conrady";
            intr.distortion = {0.0, 0.0, 0.0, 0.0, 0.0};
            return intr;
        }

        float depthScale() const override
        {
            ++depth_scale_queries;
            if (depth_scale_throws)
                throw std::runtime_error("depth sensor not found");
            const std::size_t i = static_cast<std::size_t>(depth_scale_queries - 1);
            return depth_scales.at(std::min(i, depth_scales.size() - 1));
        }

    private:
        bool streaming_ = false;
        cv::Mat color_buf_;
        cv::Mat depth_buf_;
        cv::Mat aligned_depth_buf_;
    };

} // namespace rgbd_recorder::test
