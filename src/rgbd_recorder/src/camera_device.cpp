// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#include "rgbd_recorder/camera_device.hpp"

namespace rgbd_recorder
{

    Eigen::Matrix3d StreamIntrinsics::cameraMatrix() const
    {
        Eigen::Matrix3d K = Eigen::Matrix3d::Identity();
        K(0, 0) = fx;
        K(1, 1) = fy;
        K(0, 2) = ppx;
        K(1, 2) = ppy;
        return K;
    }

} // namespace rgbd_recorder
