// File: processing/image/comparison/ssim_comparator.hpp

#ifndef IMAGE_COMPARATOR_SSIM_HPP
#define IMAGE_COMPARATOR_SSIM_HPP

#include <utility>

#include "processing/image/comparator.hpp"

namespace processing::image {

    /*
     * Structural similarity on luminance. Score = 100 * (1 - SSIM), so it ranges over [0, 200]
     * rather than the pixel comparator's [0, 100]. The map is (1 - ssim_map) * 255 truncated to 8 bits.
     *
     * Sensitivity is validated and a thresholded mask is derived from it, but neither the score nor the
     * map depend on it.
     */
    class SSIMComparator final : public ImageComparator {
    public:
        explicit SSIMComparator(int sensitivity = 80);

        [[nodiscard]] types::ComparisonResult compare(const cv::Mat &before, const cv::Mat &after) const override;
        using ImageComparator::compare;

        [[nodiscard]] ColorMode colorMode() const noexcept override { return ColorMode::Grayscale; }
        [[nodiscard]] types::ComparisonType type() const noexcept override {
            return types::ComparisonType::Structural;
        }

        // Single-channel similarity map in [-1, 1] -> (1 - similarity) * 255, truncated and clamped to [0, 255].
        [[nodiscard]] static cv::Mat processDifferenceMap(const cv::Mat &similarity_map);

    private:
        // Global SSIM and the per-pixel similarity map (CV_32F, values in [-1, 1]).
        [[nodiscard]] static std::pair<double, cv::Mat> computeSSIM(const cv::Mat &before, const cv::Mat &after);
        [[nodiscard]] cv::Mat applySensitivityThreshold(const cv::Mat &difference_map) const;
    };

} // namespace processing::image

#endif // IMAGE_COMPARATOR_SSIM_HPP
