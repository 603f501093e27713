// =============================================================================
//  rgbd_recorder
//
//  Aligned RGB-D capture and session recording.
// =============================================================================

#include "rgbd_recorder/preview.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace rgbd_recorder::preview
{

    cv::Mat colorizeDepth(const cv::Mat &depth)
    {
        if (depth.empty() || depth.type() != CV_16UC1)
            return cv::Mat();

        // 99th percentile of the raw values
        std::vector<uint16_t> values;
        values.reserve(depth.total());
        for (int r = 0; r < depth.rows; ++r)
        {
            const uint16_t *row = depth.ptr<uint16_t>(r);
            values.insert(values.end(), row, row + depth.cols);
        }
        const std::size_t k = std::min(values.size() - 1, static_cast<std::size_t>(0.99 * static_cast<double>(values.size() - 1)));
        std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(k), values.end());
        const double upper = values[k];

        cv::Mat clipped;
        depth.convertTo(clipped, CV_32F);
        cv::threshold(clipped, clipped, upper, upper, cv::THRESH_TRUNC);

        cv::Mat normalized;
        cv::normalize(clipped, normalized, 0, 255, cv::NORM_MINMAX, CV_8U);

        cv::Mat colored;
        cv::applyColorMap(normalized, colored, cv::COLORMAP_JET);
        return colored;
    }

    OpenCvPreview::OpenCvPreview()
    {
        cv::namedWindow(color_window_, cv::WINDOW_AUTOSIZE);
        cv::namedWindow(depth_window_, cv::WINDOW_AUTOSIZE);
    }

    OpenCvPreview::~OpenCvPreview()
    {
        cv::destroyWindow(color_window_);
        cv::destroyWindow(depth_window_);
    }

    bool OpenCvPreview::show(const cv::Mat &color, const cv::Mat &depth)
    {
        if (!color.empty())
            cv::imshow(color_window_, color);
        if (!depth.empty())
            cv::imshow(depth_window_, colorizeDepth(depth));

        const int key = cv::waitKey(1) & 0xFF;
        return !(key == 'q' || key == 'Q' || key == 27);
    }

} // namespace rgbd_recorder::preview
