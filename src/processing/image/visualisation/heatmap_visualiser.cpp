// File: processing/image/visualisation/heatmap_visualiser.cpp

#include "processing/image/visualisation/heatmap_visualiser.hpp"

#include <opencv2/imgproc.hpp>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace processing::image {

    HeatmapVisualiser::HeatmapVisualiser(const HeatmapOptions &options) : options_(options) {
        if (options_.opacity < 0.0 || options_.opacity > 1.0) {
            throw std::invalid_argument(fmt::format("Heatmap opacity must be within [0, 1], got {}", options_.opacity));
        }
    }

    cv::Mat HeatmapVisualiser::draw(const cv::Mat &base, const cv::Mat &map) const {
        if (cv::countNonZero(map) == 0) {
            LOG_INFO("Difference map is empty, returning the base image without a heatmap.");
            return base.clone();
        }

        const cv::Mat heatmap = createHeatmap(map);

        cv::Mat result;
        cv::addWeighted(base, 1.0 - options_.opacity, heatmap, options_.opacity, 0.0, result);
        return result;
    }

    cv::Mat HeatmapVisualiser::createHeatmap(const cv::Mat &map) const {
        cv::Mat normalised;
        cv::normalize(map, normalised, 0, 255, cv::NORM_MINMAX, CV_8U);

        cv::Mat heatmap;
        cv::applyColorMap(normalised, heatmap, options_.colormap);
        return heatmap;
    }

} // namespace processing::image
