// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#pragma once

#include <string>

#include <opencv2/core.hpp>

namespace rgbd_recorder::preview
{

    class PreviewSink
    {
    public:
        virtual ~PreviewSink() = default;

        // Display one pair. Returns false when the user asked to stop.
        virtual bool show(const cv::Mat &color, const cv::Mat &depth) = 0;
    };

    /// Clip at the 99th percentile, normalize to 8 bit and apply COLORMAP_JET.
    cv::Mat colorizeDepth(const cv::Mat &depth);

    // highgui windows; polls the keyboard once per frame (q, Q or ESC to stop).
    class OpenCvPreview : public PreviewSink
    {
    public:
        OpenCvPreview();
        ~OpenCvPreview() override;

        bool show(const cv::Mat &color, const cv::Mat &depth) override;

    private:
        const std::string color_window_ = "RGB-D Recorder Color";
        const std::string depth_window_ = "RGB-D Recorder Depth";
    };

} // namespace rgbd_recorder::preview
