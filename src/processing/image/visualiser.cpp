// File: processing/image/visualiser.cpp

#include "processing/image/visualiser.hpp"

#include "common/logging/logger.hpp"
#include "processing/image/visualisation/contour_visualiser.hpp"
#include "processing/image/visualisation/heatmap_visualiser.hpp"

namespace processing::image {

    cv::Mat ImageVisualiser::render(const cv::Mat &base, const types::ComparisonResult &result) const {
        const cv::Mat map = result.map();
        if (map.empty() || base.empty()) {
            LOG_ERROR("Cannot render an empty {}.", map.empty() ? "difference map" : "base image");
            throw RenderError(map.empty() ? "Difference map is empty" : "Base image is empty");
        }
        if (map.size() != base.size() || map.type() != CV_8UC1) {
            LOG_ERROR("Difference map {} does not fit base image {}.", common::formatting::describeShape(map),
                      common::formatting::describeShape(base));
            throw RenderError(fmt::format("Difference map {} does not fit base image {}",
                                          common::formatting::describeShape(map),
                                          common::formatting::describeShape(base)));
        }

        try {
            return draw(codec::toColor(base), map);
        } catch (const cv::Exception &e) {
            LOG_ERROR("OpenCV overlay creation failed: {}", e.what());
            throw RenderError(fmt::format("Overlay creation failed: {}", e.what()));
        } catch (const std::invalid_argument &e) {
            LOG_ERROR("Unsupported base image: {}", e.what());
            throw RenderError(fmt::format("Overlay creation failed: {}", e.what()));
        }
    }

    Bytes ImageVisualiser::visualise(const cv::Mat &base, const types::ComparisonResult &result) const {
        const cv::Mat rendered = render(base, result);
        try {
            return codec::encode(rendered, ImageFormat::Png);
        } catch (const EncodeError &e) {
            throw RenderError(fmt::format("Failed to encode result image to PNG: {}", e.what()));
        }
    }

    Bytes ImageVisualiser::visualise(const Bytes &base, const types::ComparisonResult &result) const {
        return visualise(codec::decode(base, ColorMode::Color), result);
    }

    std::shared_ptr<ImageVisualiser> ImageVisualiser::create(const types::VisualisationType type,
                                                             const VisualiserOptions &options) {
        switch (type) {
            case types::VisualisationType::Heatmap:
                return std::make_shared<HeatmapVisualiser>(options.heatmap);
            case types::VisualisationType::Contour:
                return std::make_shared<ContourVisualiser>(options.contour);
        }
        throw UnknownStrategyError("Invalid visualiser type requested");
    }

    std::shared_ptr<ImageVisualiser> ImageVisualiser::create(const std::string_view type,
                                                             const VisualiserOptions &options) {
        return create(types::parseVisualisationType(type), options);
    }

} // namespace processing::image
