// File: processing/image/visualisation/options.cpp

#include "processing/image/visualisation/options.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

#include "config/configuration.hpp"
#include "processing/image/errors.hpp"

namespace processing::image {

    namespace {
        const std::unordered_map<std::string_view, cv::ColormapTypes> &colormaps() {
            static const std::unordered_map<std::string_view, cv::ColormapTypes> map{
                    {"autumn", cv::COLORMAP_AUTUMN}, {"bone", cv::COLORMAP_BONE},
                    {"jet", cv::COLORMAP_JET},       {"winter", cv::COLORMAP_WINTER},
                    {"rainbow", cv::COLORMAP_RAINBOW}, {"ocean", cv::COLORMAP_OCEAN},
                    {"summer", cv::COLORMAP_SUMMER}, {"spring", cv::COLORMAP_SPRING},
                    {"cool", cv::COLORMAP_COOL},     {"hsv", cv::COLORMAP_HSV},
                    {"pink", cv::COLORMAP_PINK},     {"hot", cv::COLORMAP_HOT},
                    {"parula", cv::COLORMAP_PARULA}, {"magma", cv::COLORMAP_MAGMA},
                    {"inferno", cv::COLORMAP_INFERNO}, {"plasma", cv::COLORMAP_PLASMA},
                    {"viridis", cv::COLORMAP_VIRIDIS}, {"cividis", cv::COLORMAP_CIVIDIS},
                    {"twilight", cv::COLORMAP_TWILIGHT}, {"turbo", cv::COLORMAP_TURBO}};
            return map;
        }
    } // namespace

    cv::ColormapTypes parseColormap(const std::string_view name) {
        std::string lowered(name);
        std::ranges::transform(lowered, lowered.begin(), [](const unsigned char c) { return std::tolower(c); });

        const auto &map = colormaps();
        if (const auto it = map.find(lowered); it != map.end()) {
            return it->second;
        }
        throw UnknownStrategyError(fmt::format("Unknown colormap '{}'", name));
    }

    std::vector<std::string> colormapNames() {
        std::vector<std::string> names;
        for (const auto &[name, colormap]: colormaps()) {
            names.emplace_back(name);
        }
        std::ranges::sort(names);
        return names;
    }

    VisualiserOptions VisualiserOptions::fromConfiguration(const config::Configuration &configuration) {
        VisualiserOptions options;

        if (const auto colormap = configuration.get<std::string>("visualisation.heatmap.colormap")) {
            options.heatmap.colormap = parseColormap(*colormap);
        }
        options.heatmap.opacity = configuration.get("visualisation.heatmap.opacity", options.heatmap.opacity);

        options.contour.min_region_area =
                configuration.get("visualisation.contour.min_area", options.contour.min_region_area);
        options.contour.box_thickness =
                configuration.get("visualisation.contour.thickness", options.contour.box_thickness);
        options.contour.fill_opacity =
                configuration.get("visualisation.contour.opacity", options.contour.fill_opacity);

        if (const auto color = configuration.get<std::vector<int>>("visualisation.contour.color")) {
            if (color->size() != 3) {
                throw std::invalid_argument(
                        fmt::format("visualisation.contour.color needs 3 channels, got {}", color->size()));
            }
            options.contour.highlight_color = cv::Scalar((*color)[0], (*color)[1], (*color)[2]);
        }

        return options;
    }

} // namespace processing::image
