// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <rclcpp/logger.hpp>

#include "rgbd_recorder/camera_device.hpp"
#include "rgbd_recorder/device_session.hpp"
#include "rgbd_recorder/preview.hpp"
#include "rgbd_recorder/session_recorder.hpp"
#include "rgbd_recorder/status.hpp"

namespace rgbd_recorder::recording_pipeline
{

    struct Options
    {
        int device_index = 0;
        std::string output_dir = "~/rgbd_recorder/sessions";
        bool preview = true;
        std::string log_level = "INFO";
        uint64_t max_frames = 0; // 0 = until stopped
    };

    struct RunResult
    {
        Status status;
        uint64_t frames_written = 0;
        std::string session_dir; // empty when no session was started

        // 0 for normal, interrupted or capture-terminated runs; 1 otherwise.
        int exitCode() const;
    };

    // connect -> session directory -> capture/persist loop -> metadata + disconnect
    class RecordingPipeline
    {
    public:
        RecordingPipeline(std::shared_ptr<CameraDevice> device,
                          Options options,
                          rclcpp::Logger logger,
                          std::shared_ptr<preview::PreviewSink> preview = nullptr);

        // @p keep_running is polled between frames; returning false ends the
        // loop and the session is finalized as a normal stop.
        RunResult run(const std::function<bool()> &keep_running);

        device_session::DeviceSession &session() { return session_; }

    private:
        Options options_;
        rclcpp::Logger logger_;
        device_session::DeviceSession session_;
        session_recorder::SessionRecorder recorder_;
        std::shared_ptr<preview::PreviewSink> preview_;
    };

} // namespace rgbd_recorder::recording_pipeline
