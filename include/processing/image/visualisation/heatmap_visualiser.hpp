// File: processing/image/visualisation/heatmap_visualiser.hpp

#ifndef IMAGE_VISUALISER_HEATMAP_HPP
#define IMAGE_VISUALISER_HEATMAP_HPP

#include "processing/image/visualiser.hpp"

namespace processing::image {

    // Shows the magnitude of change as a color palette blended over the base image.
    class HeatmapVisualiser final : public ImageVisualiser {
    public:
        explicit HeatmapVisualiser(const HeatmapOptions &options = HeatmapOptions());

        [[nodiscard]] types::VisualisationType type() const noexcept override {
            return types::VisualisationType::Heatmap;
        }

        [[nodiscard]] const HeatmapOptions &options() const noexcept { return options_; }

    protected:
        [[nodiscard]] cv::Mat draw(const cv::Mat &base, const cv::Mat &map) const override;

    private:
        HeatmapOptions options_;

        [[nodiscard]] cv::Mat createHeatmap(const cv::Mat &map) const;
    };

} // namespace processing::image

#endif // IMAGE_VISUALISER_HEATMAP_HPP
