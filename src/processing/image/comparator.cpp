// File: processing/image/comparator.cpp

#include "processing/image/comparator.hpp"

#include <stdexcept>

#include "common/logging/logger.hpp"
#include "processing/image/comparison/pixel_comparator.hpp"
#include "processing/image/comparison/ssim_comparator.hpp"

namespace processing::image {

    ImageComparator::ImageComparator(const int sensitivity) : sensitivity_(sensitivity) {
        if (sensitivity < 0 || sensitivity > 100) {
            throw std::invalid_argument(fmt::format("Sensitivity must be between 0 and 100, got {}", sensitivity));
        }
    }

    int ImageComparator::threshold() const noexcept {
        return static_cast<int>(255.0 * (1.0 - static_cast<double>(sensitivity_) / 100.0));
    }

    void ImageComparator::validateShapes(const cv::Mat &before, const cv::Mat &after) {
        if (before.empty() || after.empty()) {
            LOG_ERROR("Cannot compare an empty image.");
            throw ComputationError("Cannot compare an empty image");
        }
        if (before.size() != after.size() || before.channels() != after.channels()) {
            const auto before_shape = common::formatting::describeShape(before);
            const auto after_shape = common::formatting::describeShape(after);
            LOG_ERROR("Image shapes do not match: {} vs {}", before_shape, after_shape);
            throw ShapeMismatchError(before_shape, after_shape);
        }
    }

    types::ComparisonResult ImageComparator::compare(const Bytes &before, const Bytes &after) const {
        const cv::Mat before_grid = codec::decode(before, colorMode());
        const cv::Mat after_grid = codec::decode(after, colorMode());
        return compare(before_grid, after_grid);
    }

    std::shared_ptr<ImageComparator> ImageComparator::create(const types::ComparisonType type, const int sensitivity) {
        switch (type) {
            case types::ComparisonType::Pixel:
                return std::make_shared<PixelComparator>(sensitivity);
            case types::ComparisonType::Structural:
                return std::make_shared<SSIMComparator>(sensitivity);
        }
        throw UnknownStrategyError("Invalid comparer type requested");
    }

    std::shared_ptr<ImageComparator> ImageComparator::create(const std::string_view type, const int sensitivity) {
        return create(types::parseComparisonType(type), sensitivity);
    }

} // namespace processing::image
