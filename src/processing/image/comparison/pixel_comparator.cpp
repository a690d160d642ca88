// File: processing/image/comparison/pixel_comparator.cpp

#include "processing/image/comparison/pixel_comparator.hpp"

#include <opencv2/imgproc.hpp>

#include "common/logging/logger.hpp"

namespace processing::image {

    PixelComparator::PixelComparator(const int sensitivity) : ImageComparator(sensitivity) {}

    types::ComparisonResult PixelComparator::compare(const cv::Mat &before, const cv::Mat &after) const {
        validateShapes(before, after);

        try {
            const cv::Mat difference_map = computeDifferenceMap(before, after);
            const double score = calculateScore(binarize(difference_map));
            return {score, difference_map};
        } catch (const cv::Exception &e) {
            LOG_ERROR("OpenCV difference computation failed: {}", e.what());
            throw ComputationError(fmt::format("Difference computation failed: {}", e.what()));
        } catch (const std::invalid_argument &e) {
            LOG_ERROR("Unsupported input for pixel comparison: {}", e.what());
            throw ComputationError(fmt::format("Difference computation failed: {}", e.what()));
        }
    }

    cv::Mat PixelComparator::computeDifferenceMap(const cv::Mat &before, const cv::Mat &after) {
        cv::Mat abs_diff;
        cv::absdiff(before, after, abs_diff);
        if (abs_diff.depth() != CV_8U) {
            abs_diff.convertTo(abs_diff, CV_8U);
        }
        return codec::toGrayscale(abs_diff).clone();
    }

    cv::Mat PixelComparator::binarize(const cv::Mat &difference_map) const {
        // THRESH_BINARY keeps cells strictly above the threshold, so identical inputs never count as changed.
        cv::Mat binary_map;
        cv::threshold(difference_map, binary_map, threshold(), 255, cv::THRESH_BINARY);
        return binary_map;
    }

    double PixelComparator::calculateScore(const cv::Mat &binary_map) {
        const auto total_pixels = static_cast<double>(binary_map.total());
        const int changed_pixels = cv::countNonZero(binary_map);
        const double score = static_cast<double>(changed_pixels) / total_pixels * 100.0;

        LOG_DEBUG("Pixel comparison: {}/{} pixels changed ({:.2f}%)", changed_pixels, binary_map.total(), score);
        return score;
    }

} // namespace processing::image
