// File: processing/image/comparison/pixel_comparator.hpp

#ifndef IMAGE_COMPARATOR_PIXEL_HPP
#define IMAGE_COMPARATOR_PIXEL_HPP

#include "processing/image/comparator.hpp"

namespace processing::image {

    /*
     * Absolute per-pixel difference, reduced to luminance. The score is the percentage of pixels whose
     * luminance difference exceeds the sensitivity threshold; the returned map is the unthresholded
     * luminance difference so the overlay reflects the intensity of change.
     */
    class PixelComparator final : public ImageComparator {
    public:
        explicit PixelComparator(int sensitivity = 30);

        [[nodiscard]] types::ComparisonResult compare(const cv::Mat &before, const cv::Mat &after) const override;
        using ImageComparator::compare;

        [[nodiscard]] ColorMode colorMode() const noexcept override { return ColorMode::Color; }
        [[nodiscard]] types::ComparisonType type() const noexcept override { return types::ComparisonType::Pixel; }

    private:
        [[nodiscard]] static cv::Mat computeDifferenceMap(const cv::Mat &before, const cv::Mat &after);
        [[nodiscard]] cv::Mat binarize(const cv::Mat &difference_map) const;
        [[nodiscard]] static double calculateScore(const cv::Mat &binary_map);
    };

} // namespace processing::image

#endif // IMAGE_COMPARATOR_PIXEL_HPP
