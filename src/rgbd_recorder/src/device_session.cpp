// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#include "rgbd_recorder/device_session.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <rclcpp/logging.hpp>

namespace rgbd_recorder::device_session
{

    DeviceSession::DeviceSession(std::shared_ptr<CameraDevice> device, rclcpp::Logger logger)
        : device_(std::move(device)), logger_(std::move(logger))
    {
        if (!device_)
            throw std::invalid_argument("DeviceSession requires a camera device");
    }

    DeviceSession::~DeviceSession()
    {
        disconnect();
    }

    std::vector<DeviceIdentity> DeviceSession::listDevices()
    {
        try
        {
            std::vector<DeviceIdentity> devices = device_->enumerate();
            RCLCPP_INFO(logger_, "Found %zu camera device(s)", devices.size());
            return devices;
        }
        catch (const std::exception &e)
        {
            RCLCPP_ERROR(logger_, "Failed to enumerate devices: %s", e.what());
            return {};
        }
    }

    Status DeviceSession::connect(int index)
    {
        if (connected_)
        {
            return Status::Error(ErrorKind::Connection,
                                 "Already connected to device " + std::to_string(index_));
        }

        const std::vector<DeviceIdentity> devices = listDevices();
        if (devices.empty())
        {
            RCLCPP_ERROR(logger_, "Camera connection failed: no devices detected");
            return Status::Error(ErrorKind::Connection, "No camera devices detected");
        }
        if (index < 0 || static_cast<std::size_t>(index) >= devices.size())
        {
            const std::string msg = "Device index " + std::to_string(index) + " out of range (found " +
                                    std::to_string(devices.size()) + " device(s))";
            RCLCPP_ERROR(logger_, "Camera connection failed: %s", msg.c_str());
            return Status::Error(ErrorKind::Connection, msg);
        }

        const DeviceIdentity &target = devices[static_cast<std::size_t>(index)];
        Status cause;
        try
        {
            if (!device_->supports(target.serial, config_))
            {
                cause = Status::Error(ErrorKind::Configuration,
                                      "Stream configuration rejected: color " +
                                          std::to_string(config_.color_width) + "x" + std::to_string(config_.color_height) +
                                          "@" + std::to_string(config_.color_fps) + "fps, depth " +
                                          std::to_string(config_.depth_width) + "x" + std::to_string(config_.depth_height) +
                                          "@" + std::to_string(config_.depth_fps) + "fps");
            }
            else
            {
                RCLCPP_INFO(logger_, "Streams configured: RGB %dx%d@%dfps, Depth %dx%d@%dfps",
                            config_.color_width, config_.color_height, config_.color_fps,
                            config_.depth_width, config_.depth_height, config_.depth_fps);
                device_->start(target.serial, config_);
            }
        }
        catch (const std::exception &e)
        {
            cause = Status::Error(ErrorKind::Connection, e.what());
        }

        if (!cause.ok())
        {
            RCLCPP_ERROR(logger_, "Camera connection failed: %s", cause.message().c_str());
            disconnect();
            return Status::Wrap(ErrorKind::Connection, "Failed to connect", cause);
        }

        connected_ = true;
        index_ = index;
        identity_ = target;
        try
        {
            identity_ = device_->activeIdentity();
        }
        catch (const std::exception &e)
        {
            RCLCPP_WARN(logger_, "Could not read identity from active device, using enumerated one: %s", e.what());
        }

        RCLCPP_INFO(logger_, "Connected to %s (serial %s, firmware %s)",
                    identity_->name.c_str(), identity_->serial.c_str(), identity_->firmware.c_str());
        return Status::Ok();
    }

    void DeviceSession::disconnect()
    {
        const bool was_connected = connected_;
        connected_ = false;
        index_ = -1;
        identity_.reset();
        try
        {
            if (device_->isStreaming())
                device_->stop();
            if (was_connected)
                RCLCPP_INFO(logger_, "Camera disconnected");
        }
        catch (const std::exception &e)
        {
            RCLCPP_ERROR(logger_, "Error during disconnect: %s", e.what());
        }
    }

    std::optional<CameraIntrinsics> DeviceSession::getIntrinsics()
    {
        if (!connected_)
        {
            RCLCPP_WARN(logger_, "getIntrinsics: camera not connected");
            return std::nullopt;
        }
        try
        {
            CameraIntrinsics out;
            out.color = device_->intrinsics(StreamKind::Color);
            out.depth = device_->intrinsics(StreamKind::Depth);
            return out;
        }
        catch (const std::exception &e)
        {
            RCLCPP_WARN(logger_, "Failed to get intrinsics: %s", e.what());
            return std::nullopt;
        }
    }

    std::optional<DeviceIdentity> DeviceSession::getCameraInfo()
    {
        if (!connected_ || !identity_)
        {
            RCLCPP_WARN(logger_, "getCameraInfo: camera not connected");
            return std::nullopt;
        }
        return identity_;
    }

} // namespace rgbd_recorder::device_session
