// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <rclcpp/logger.hpp>

#include "rgbd_recorder/camera_device.hpp"
#include "rgbd_recorder/status.hpp"

namespace rgbd_recorder::session_recorder
{

    // Paths written for a single frame pair
    struct FilePaths
    {
        std::string rgb, depth;
    };

    // Manifest contents, serialized to metadata.json at the end of a session.
    struct SessionMetadata
    {
        std::string session_start; // UTC ISO-8601
        std::string session_end;   // UTC ISO-8601
        int device_index = 0;
        std::optional<DeviceIdentity> camera_info;
        std::optional<CameraIntrinsics> intrinsics;
        StreamConfig stream_config{};
        std::string log_level = "INFO";
        bool preview_enabled = true;
        uint64_t frame_count = 0;
        std::optional<float> depth_scale;

        nlohmann::json toJson() const;
    };

    class SessionRecorder
    {
    public:
        static constexpr const char *kRgbDir = "rgb";
        static constexpr const char *kDepthDir = "depth";
        static constexpr const char *kMetadataFile = "metadata.json";

        explicit SessionRecorder(rclcpp::Logger logger, cv::Size color_size = cv::Size(1280, 800));

        // Create <base_dir>/session_YYYYMMDD_HHMMSS/{rgb,depth} from the local time.
        // Two sessions started within the same second share the directory.
        Status createSessionDirectory(const std::string &base_dir, std::string &session_dir);
        Status createSessionDirectory(const std::string &base_dir,
                                      std::chrono::system_clock::time_point now,
                                      std::string &session_dir);

        // Validate and write rgb/frame_NNNNNN_rgb.png and depth/frame_NNNNNN_depth.npy.
        Status saveFramePair(uint64_t index, const cv::Mat &color, const cv::Mat &depth,
                             const std::string &session_dir, FilePaths &out_paths);

        // Write metadata.json (2-space indented) into the session directory.
        Status saveMetadata(const std::string &session_dir, const nlohmann::json &metadata);

        // Write color_intrinsics.yaml and depth_intrinsics.yaml into the session directory.
        Status saveCalibration(const std::string &session_dir, const CameraIntrinsics &intrinsics);

        static std::string rgbFileName(uint64_t index);
        static std::string depthFileName(uint64_t index);

    private:
        bool writeCalibrationYaml(const StreamIntrinsics &intr, const std::string &camera_name,
                                  const std::string &path);

        rclcpp::Logger logger_;
        cv::Size color_size_;
    };

} // namespace rgbd_recorder::session_recorder
