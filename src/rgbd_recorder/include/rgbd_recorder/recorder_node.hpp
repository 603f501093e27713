// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#pragma once

#include <optional>
#include <string>

#include <rclcpp/rclcpp.hpp>

#include "rgbd_recorder/recording_pipeline.hpp"

namespace rgbd_recorder
{

    /// Map DEBUG/INFO/WARN(ING)/ERROR/FATAL/CRITICAL (any case) to an rcutils severity.
    std::optional<int> logSeverityFromString(const std::string &level);

    // Process boundary: reads ROS parameters, configures logging once and
    // runs the recording pipeline against the RealSense device.
    class RecorderNode : public rclcpp::Node
    {
    public:
        explicit RecorderNode(const rclcpp::NodeOptions &options = rclcpp::NodeOptions());

        // Returns the process exit code.
        int run();

    private:
        void initParams();
        void applyLogLevel();
        int listDevices();

        recording_pipeline::Options opts_;
        bool list_devices_ = false;
    };

} // namespace rgbd_recorder
