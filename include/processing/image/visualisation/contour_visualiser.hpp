// File: processing/image/visualisation/contour_visualiser.hpp

#ifndef IMAGE_VISUALISER_CONTOUR_HPP
#define IMAGE_VISUALISER_CONTOUR_HPP

#include <vector>

#include "processing/image/visualiser.hpp"

namespace processing::image {

    using Contour = std::vector<cv::Point>;

    /*
     * Highlights every changed region: the region is filled with the highlight color, blended at
     * fill_opacity, then outlined by its bounding box drawn opaque on top.
     */
    class ContourVisualiser final : public ImageVisualiser {
    public:
        explicit ContourVisualiser(const ContourOptions &options = ContourOptions());

        [[nodiscard]] types::VisualisationType type() const noexcept override {
            return types::VisualisationType::Contour;
        }

        [[nodiscard]] const ContourOptions &options() const noexcept { return options_; }

        // External contours of non-zero regions whose area exceeds min_region_area.
        [[nodiscard]] std::vector<Contour> findSignificantContours(const cv::Mat &map) const;

    protected:
        [[nodiscard]] cv::Mat draw(const cv::Mat &base, const cv::Mat &map) const override;

    private:
        ContourOptions options_;

        [[nodiscard]] cv::Mat createOverlay(const cv::Mat &base, const std::vector<Contour> &contours) const;
    };

} // namespace processing::image

#endif // IMAGE_VISUALISER_CONTOUR_HPP
