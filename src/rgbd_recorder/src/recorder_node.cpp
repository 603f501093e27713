// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#include "rgbd_recorder/recorder_node.hpp"
#include "rgbd_recorder/device_session.hpp"
#include "rgbd_recorder/realsense_device.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

#include <opencv2/core.hpp>
#include <rcutils/error_handling.h>
#include <rcutils/logging.h>

namespace rgbd_recorder
{

    std::optional<int> logSeverityFromString(const std::string &level)
    {
        std::string upper = level;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });

        if (upper == "DEBUG")
            return RCUTILS_LOG_SEVERITY_DEBUG;
        if (upper == "INFO")
            return RCUTILS_LOG_SEVERITY_INFO;
        if (upper == "WARN" || upper == "WARNING")
            return RCUTILS_LOG_SEVERITY_WARN;
        if (upper == "ERROR")
            return RCUTILS_LOG_SEVERITY_ERROR;
        if (upper == "FATAL" || upper == "CRITICAL")
            return RCUTILS_LOG_SEVERITY_FATAL;
        return std::nullopt;
    }

    RecorderNode::RecorderNode(const rclcpp::NodeOptions &options)
        : rclcpp::Node("rgbd_recorder", options)
    {
        initParams();
        applyLogLevel();
    }

    void RecorderNode::initParams()
    {
        opts_.device_index = static_cast<int>(this->declare_parameter<int>("device_index", opts_.device_index));
        opts_.output_dir = this->declare_parameter<std::string>("output_dir", opts_.output_dir);
        opts_.preview = this->declare_parameter<bool>("preview", opts_.preview);
        opts_.log_level = this->declare_parameter<std::string>("log_level", opts_.log_level);
        const int max_frames = static_cast<int>(this->declare_parameter<int>("max_frames", 0));
        opts_.max_frames = max_frames > 0 ? static_cast<uint64_t>(max_frames) : 0;
        list_devices_ = this->declare_parameter<bool>("list_devices", false);
    }

    void RecorderNode::applyLogLevel()
    {
        std::optional<int> severity = logSeverityFromString(opts_.log_level);
        if (!severity)
        {
            RCLCPP_WARN(get_logger(), "Unknown log_level '%s', using INFO", opts_.log_level.c_str());
            opts_.log_level = "INFO";
            severity = RCUTILS_LOG_SEVERITY_INFO;
        }
        if (rcutils_logging_set_logger_level(get_logger().get_name(), *severity) != RCUTILS_RET_OK)
        {
            RCLCPP_WARN(get_logger(), "Could not set log level %s: %s", opts_.log_level.c_str(),
                        rcutils_get_error_string().str);
            rcutils_reset_error();
        }
    }

    int RecorderNode::listDevices()
    {
        device_session::DeviceSession session(std::make_shared<RealSenseDevice>(),
                                              get_logger().get_child("device_session"));
        const auto devices = session.listDevices();
        for (std::size_t i = 0; i < devices.size(); ++i)
        {
            RCLCPP_INFO(get_logger(), "[%zu] %s serial=%s firmware=%s product_id=%s", i,
                        devices[i].name.c_str(), devices[i].serial.c_str(),
                        devices[i].firmware.c_str(), devices[i].product_id.c_str());
        }
        return 0;
    }

    int RecorderNode::run()
    {
        if (list_devices_)
            return listDevices();

        std::shared_ptr<preview::PreviewSink> sink;
        if (opts_.preview)
        {
            try
            {
                sink = std::make_shared<preview::OpenCvPreview>();
            }
            catch (const cv::Exception &e)
            {
                RCLCPP_WARN(get_logger(), "Preview unavailable, recording without it: %s", e.what());
            }
        }

        recording_pipeline::RecordingPipeline pipeline(std::make_shared<RealSenseDevice>(), opts_,
                                                       get_logger(), sink);
        const recording_pipeline::RunResult result = pipeline.run([]()
                                                                  { return rclcpp::ok(); });
        return result.exitCode();
    }

} // namespace rgbd_recorder
