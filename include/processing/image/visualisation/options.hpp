// File: processing/image/visualisation/options.hpp

#ifndef IMAGE_VISUALISATION_OPTIONS_HPP
#define IMAGE_VISUALISATION_OPTIONS_HPP

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace config {
    class Configuration;
}

namespace processing::image {

    struct HeatmapOptions {
        cv::ColormapTypes colormap = cv::COLORMAP_JET;
        double opacity = 0.5; // 0 is transparent, 1 is opaque
    };

    struct ContourOptions {
        int min_region_area = 40; // regions with an area at or below this are treated as noise
        cv::Scalar highlight_color{0, 255, 0}; // BGR
        int box_thickness = 2;
        double fill_opacity = 0.3;
    };

    struct VisualiserOptions {
        HeatmapOptions heatmap;
        ContourOptions contour;

        // Reads the visualisation.* keys, keeping the defaults above for anything missing.
        // Throws UnknownStrategyError for an unknown palette and std::invalid_argument for a malformed color.
        [[nodiscard]] static VisualiserOptions fromConfiguration(const config::Configuration &configuration);
    };

    // Palette lookup by lower-case name ("jet", "turbo", ...). Throws UnknownStrategyError.
    [[nodiscard]] cv::ColormapTypes parseColormap(std::string_view name);

    [[nodiscard]] std::vector<std::string> colormapNames();

} // namespace processing::image

#endif // IMAGE_VISUALISATION_OPTIONS_HPP
