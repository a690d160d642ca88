// File: processing/image/comparison/ssim_comparator.cpp

#include "processing/image/comparison/ssim_comparator.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>
#include <opencv2/quality/qualityssim.hpp>

#include "common/logging/logger.hpp"

namespace processing::image {

    SSIMComparator::SSIMComparator(const int sensitivity) : ImageComparator(sensitivity) {}

    types::ComparisonResult SSIMComparator::compare(const cv::Mat &before, const cv::Mat &after) const {
        validateShapes(before, after);

        try {
            // SSIM works on luminance only
            const cv::Mat before_gray = codec::toGrayscale(before);
            const cv::Mat after_gray = codec::toGrayscale(after);

            const auto [similarity, similarity_map] = computeSSIM(before_gray, after_gray);
            const double score = (1.0 - similarity) * 100.0;

            cv::Mat difference_map = processDifferenceMap(similarity_map);
            const cv::Mat mask = applySensitivityThreshold(difference_map);
            LOG_DEBUG("SSIM: {:.4f}, score: {:.2f}, {} cells above the sensitivity threshold (unused).", similarity,
                      score, cv::countNonZero(mask));

            return {score, difference_map};
        } catch (const cv::Exception &e) {
            LOG_ERROR("SSIM computation failed: {}", e.what());
            throw ComputationError(fmt::format("SSIM computation failed: {}", e.what()));
        } catch (const std::invalid_argument &e) {
            LOG_ERROR("Unsupported input for SSIM comparison: {}", e.what());
            throw ComputationError(fmt::format("SSIM computation failed: {}", e.what()));
        }
    }

    std::pair<double, cv::Mat> SSIMComparator::computeSSIM(const cv::Mat &before, const cv::Mat &after) {
        LOG_TRACE("Computing SSIM for {} images.", before.size());
        cv::Mat similarity_map;
        const cv::Scalar ssim_value = cv::quality::QualitySSIM::compute(before, after, similarity_map);

        const double similarity = ssim_value[0];
        if (!std::isfinite(similarity) || similarity_map.empty() || similarity_map.size() != before.size()) {
            LOG_ERROR("SSIM produced an unusable result (value: {}, map: {}).", similarity, similarity_map.size());
            throw ComputationError("SSIM computation produced a non-finite similarity");
        }

        return {similarity, similarity_map};
    }

    cv::Mat SSIMComparator::processDifferenceMap(const cv::Mat &similarity_map) {
        cv::Mat inverted;
        similarity_map.convertTo(inverted, CV_32F, -255.0, 255.0);

        // Truncate rather than round: a cell only lights up once it is at least one full level off.
        cv::Mat processed(inverted.size(), CV_8UC1);
        for (int row = 0; row < inverted.rows; ++row) {
            const auto *source = inverted.ptr<float>(row);
            auto *target = processed.ptr<uchar>(row);
            for (int col = 0; col < inverted.cols; ++col) {
                target[col] = static_cast<uchar>(std::clamp(source[col], 0.0f, 255.0f));
            }
        }
        return processed;
    }

    cv::Mat SSIMComparator::applySensitivityThreshold(const cv::Mat &difference_map) const {
        cv::Mat binary_map;
        cv::threshold(difference_map, binary_map, threshold(), 255, cv::THRESH_BINARY);
        return binary_map;
    }

} // namespace processing::image
