// File: processing/image/visualiser.hpp

#ifndef IMAGE_VISUALISER_HPP
#define IMAGE_VISUALISER_HPP

#include <memory>
#include <opencv2/core.hpp>
#include <string_view>

#include "processing/image/codec.hpp"
#include "processing/image/visualisation/options.hpp"
#include "types/comparison_result.hpp"
#include "types/strategy_type.hpp"

namespace processing::image {

    class ImageVisualiser {
    public:
        virtual ~ImageVisualiser() = default;

        // Render the result's difference map over the "after" image and return it PNG-encoded.
        [[nodiscard]] Bytes visualise(const cv::Mat &base, const types::ComparisonResult &result) const;

        // Decode the "after" image in color, then render.
        [[nodiscard]] Bytes visualise(const Bytes &base, const types::ComparisonResult &result) const;

        // Same as visualise() but returns the rendered grid instead of encoded bytes.
        [[nodiscard]] cv::Mat render(const cv::Mat &base, const types::ComparisonResult &result) const;

        [[nodiscard]] virtual types::VisualisationType type() const noexcept = 0;

        [[nodiscard]] static std::shared_ptr<ImageVisualiser> create(types::VisualisationType type,
                                                                     const VisualiserOptions &options = {});

        [[nodiscard]] static std::shared_ptr<ImageVisualiser> create(std::string_view type,
                                                                     const VisualiserOptions &options = {});

    protected:
        ImageVisualiser() = default;

        // base is BGR and has the same size as map, map is a non-empty CV_8UC1 grid.
        [[nodiscard]] virtual cv::Mat draw(const cv::Mat &base, const cv::Mat &map) const = 0;
    };

} // namespace processing::image

#endif // IMAGE_VISUALISER_HPP
