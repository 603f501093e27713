// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#include "rgbd_recorder/recording_pipeline.hpp"
#include "rgbd_recorder/frame_acquirer.hpp"
#include "rgbd_recorder/util.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include <rclcpp/logging.hpp>

namespace rgbd_recorder::recording_pipeline
{

    int RunResult::exitCode() const
    {
        if (status.ok() || status.kind() == ErrorKind::Capture)
            return 0;
        return 1;
    }

    RecordingPipeline::RecordingPipeline(std::shared_ptr<CameraDevice> device,
                                         Options options,
                                         rclcpp::Logger logger,
                                         std::shared_ptr<preview::PreviewSink> preview)
        : options_(std::move(options)),
          logger_(logger),
          session_(std::move(device), logger.get_child("device_session")),
          recorder_(logger.get_child("session_recorder"),
                    cv::Size(session_.streamConfig().color_width, session_.streamConfig().color_height)),
          preview_(std::move(preview))
    {
    }

    RunResult RecordingPipeline::run(const std::function<bool()> &keep_running)
    {
        RunResult result;

        RCLCPP_INFO(logger_, "Starting camera recording session");
        RCLCPP_INFO(logger_, "Using device index: %d", options_.device_index);
        RCLCPP_INFO(logger_, "Output directory: %s", options_.output_dir.c_str());
        RCLCPP_INFO(logger_, "Preview: %s", options_.preview ? "enabled" : "disabled");
        RCLCPP_INFO(logger_, "Log level: %s", options_.log_level.c_str());

        // ---------------- CONNECT ----------------
        result.status = session_.connect(options_.device_index);
        if (!result.status)
        {
            RCLCPP_ERROR(logger_, "Camera initialization failed: %s", result.status.message().c_str());
            return result;
        }

        std::unique_ptr<frame_acquirer::FrameAcquirer> acquirer;
        result.status = frame_acquirer::FrameAcquirer::create(session_, logger_.get_child("frame_acquirer"), acquirer);
        if (!result.status)
        {
            session_.disconnect();
            return result;
        }

        // ---------------- SESSION ----------------
        result.status = recorder_.createSessionDirectory(options_.output_dir, result.session_dir);
        if (!result.status)
        {
            RCLCPP_ERROR(logger_, "Could not create session directory: %s", result.status.message().c_str());
            session_.disconnect();
            return result;
        }
        RCLCPP_INFO(logger_, "Recording to session directory: %s", result.session_dir.c_str());

        session_recorder::SessionMetadata metadata;
        metadata.session_start = util::isoTimestampUtc(std::chrono::system_clock::now());
        metadata.device_index = options_.device_index;
        metadata.camera_info = session_.getCameraInfo();
        metadata.intrinsics = session_.getIntrinsics();
        metadata.stream_config = session_.streamConfig();
        metadata.log_level = options_.log_level;
        metadata.preview_enabled = options_.preview;

        if (metadata.intrinsics)
        {
            const Status calib = recorder_.saveCalibration(result.session_dir, *metadata.intrinsics);
            if (!calib)
                RCLCPP_WARN(logger_, "Calibration files not written: %s", calib.message().c_str());
        }

        // ---------------- LOOP ----------------
        const bool show_preview = options_.preview && preview_;
        try
        {
            while (true)
            {
                if (!keep_running())
                {
                    RCLCPP_INFO(logger_, "Recording interrupted by user");
                    break;
                }
                if (options_.max_frames > 0 && result.frames_written >= options_.max_frames)
                {
                    RCLCPP_INFO(logger_, "Reached max_frames=%llu, stopping recording",
                                static_cast<unsigned long long>(options_.max_frames));
                    break;
                }

                frame_acquirer::FramePair pair;
                result.status = acquirer->captureFrame(pair);
                if (!result.status)
                {
                    RCLCPP_ERROR(logger_, "Frame capture error: %s", result.status.message().c_str());
                    break;
                }

                session_recorder::FilePaths paths;
                result.status = recorder_.saveFramePair(pair.index, pair.color, pair.depth, result.session_dir, paths);
                if (!result.status)
                {
                    RCLCPP_ERROR(logger_, "Failed to save frame %llu: %s",
                                 static_cast<unsigned long long>(pair.index), result.status.toString().c_str());
                    break;
                }
                ++result.frames_written;

                if (show_preview && !preview_->show(pair.color, pair.depth))
                {
                    RCLCPP_INFO(logger_, "Preview exit key detected, stopping recording");
                    break;
                }
            }
        }
        catch (const std::exception &e)
        {
            // finalization below still runs
            RCLCPP_ERROR(logger_, "Recording loop aborted after %llu frame(s): %s",
                         static_cast<unsigned long long>(result.frames_written), e.what());
            result.status = Status::Error(ErrorKind::Capture, std::string("Recording loop aborted: ") + e.what());
        }

        // ---------------- FINALIZE ----------------
        metadata.session_end = util::isoTimestampUtc(std::chrono::system_clock::now());
        metadata.frame_count = result.frames_written;
        metadata.depth_scale = acquirer->getDepthScale();

        const Status saved = recorder_.saveMetadata(result.session_dir, metadata.toJson());
        if (!saved)
        {
            RCLCPP_ERROR(logger_, "Session metadata not written: %s", saved.message().c_str());
            if (result.status.ok() || result.status.kind() == ErrorKind::Capture)
                result.status = saved;
        }
        session_.disconnect();

        RCLCPP_INFO(logger_, "Recording session complete - frames captured: %llu",
                    static_cast<unsigned long long>(result.frames_written));
        return result;
    }

} // namespace rgbd_recorder::recording_pipeline
