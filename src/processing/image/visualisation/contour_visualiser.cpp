// File: processing/image/visualisation/contour_visualiser.cpp

#include "processing/image/visualisation/contour_visualiser.hpp"

#include <opencv2/imgproc.hpp>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace processing::image {

    ContourVisualiser::ContourVisualiser(const ContourOptions &options) : options_(options) {
        if (options_.min_region_area < 0) {
            throw std::invalid_argument("Minimum region area must be non-negative");
        }
        if (options_.box_thickness <= 0) {
            throw std::invalid_argument("Box thickness must be positive");
        }
        if (options_.fill_opacity < 0.0 || options_.fill_opacity > 1.0) {
            throw std::invalid_argument(
                    fmt::format("Fill opacity must be within [0, 1], got {}", options_.fill_opacity));
        }
        for (int channel = 0; channel < 3; ++channel) {
            if (options_.highlight_color[channel] < 0.0 || options_.highlight_color[channel] > 255.0) {
                throw std::invalid_argument("Highlight color channels must be within [0, 255]");
            }
        }
    }

    std::vector<Contour> ContourVisualiser::findSignificantContours(const cv::Mat &map) const {
        std::vector<Contour> contours;
        try {
            cv::findContours(map, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
        } catch (const cv::Exception &e) {
            LOG_ERROR("OpenCV findContours failed: {}", e.what());
            throw RenderError(fmt::format("Contour detection failed: {}", e.what()));
        }

        std::vector<Contour> significant;
        for (auto &contour: contours) {
            if (cv::contourArea(contour) > options_.min_region_area) {
                significant.push_back(std::move(contour));
            }
        }

        LOG_DEBUG("Found {} contours, {} above minimum area {}", contours.size(), significant.size(),
                  options_.min_region_area);
        return significant;
    }

    cv::Mat ContourVisualiser::draw(const cv::Mat &base, const cv::Mat &map) const {
        const auto contours = findSignificantContours(map);
        if (contours.empty()) {
            LOG_INFO("No significant differences found, returning the base image unmodified.");
            return base.clone();
        }
        return createOverlay(base, contours);
    }

    cv::Mat ContourVisualiser::createOverlay(const cv::Mat &base, const std::vector<Contour> &contours) const {
        cv::Mat filled = base.clone();
        cv::drawContours(filled, contours, -1, options_.highlight_color, cv::FILLED);

        cv::Mat result;
        cv::addWeighted(base, 1.0 - options_.fill_opacity, filled, options_.fill_opacity, 0.0, result);

        for (const auto &contour: contours) {
            const cv::Rect box = cv::boundingRect(contour);
            LOG_TRACE("Region bounding box {}", box);
            cv::rectangle(result, box.tl(), box.br(), options_.highlight_color, options_.box_thickness);
        }

        return result;
    }

} // namespace processing::image
