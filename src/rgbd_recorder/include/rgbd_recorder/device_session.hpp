// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <rclcpp/logger.hpp>

#include "rgbd_recorder/camera_device.hpp"
#include "rgbd_recorder/status.hpp"

namespace rgbd_recorder::device_session
{

    // Connection lifecycle of one camera. The destructor disconnects, so a
    // session going out of scope always releases the device.
    class DeviceSession
    {
    public:
        DeviceSession(std::shared_ptr<CameraDevice> device, rclcpp::Logger logger);
        ~DeviceSession();

        DeviceSession(const DeviceSession &) = delete;
        DeviceSession &operator=(const DeviceSession &) = delete;

        // Devices visible to the host. Enumeration failures degrade to an empty list.
        std::vector<DeviceIdentity> listDevices();

        // Negotiate the fixed streams on device @p index and start capturing.
        Status connect(int index);

        // Stop streaming and clear state. Idempotent, never fails.
        void disconnect();

        bool isConnected() const { return connected_; }

        // Diagnostic queries: empty (with a warning) when not connected or on failure.
        std::optional<CameraIntrinsics> getIntrinsics();
        std::optional<DeviceIdentity> getCameraInfo();

        const StreamConfig &streamConfig() const { return config_; }
        int deviceIndex() const { return index_; }

        // Only valid while connected; used by the frame acquirer.
        CameraDevice &device() { return *device_; }

    private:
        std::shared_ptr<CameraDevice> device_;
        rclcpp::Logger logger_;

        const StreamConfig config_{};
        bool connected_ = false;
        int index_ = -1;
        std::optional<DeviceIdentity> identity_;
    };

} // namespace rgbd_recorder::device_session
