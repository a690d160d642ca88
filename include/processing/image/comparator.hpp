// File: processing/image/comparator.hpp

#ifndef IMAGE_COMPARATOR_HPP
#define IMAGE_COMPARATOR_HPP

#include <memory>
#include <opencv2/core.hpp>
#include <string_view>

#include "processing/image/codec.hpp"
#include "types/comparison_result.hpp"
#include "types/strategy_type.hpp"

namespace processing::image {

    class ImageComparator {
    public:
        virtual ~ImageComparator() = default;

        // Compare two decoded grids of identical shape. The score grows with the amount of change (0 = identical).
        [[nodiscard]] virtual types::ComparisonResult compare(const cv::Mat &before, const cv::Mat &after) const = 0;

        // Decode both buffers with this comparator's preferred color mode, then compare.
        [[nodiscard]] types::ComparisonResult compare(const Bytes &before, const Bytes &after) const;

        [[nodiscard]] virtual ColorMode colorMode() const noexcept = 0;

        [[nodiscard]] virtual types::ComparisonType type() const noexcept = 0;

        [[nodiscard]] int sensitivity() const noexcept { return sensitivity_; }

        // Pure mapping from type to a freshly constructed comparator.
        [[nodiscard]] static std::shared_ptr<ImageComparator> create(types::ComparisonType type, int sensitivity);

        // Parses the name first; unknown names raise UnknownStrategyError.
        [[nodiscard]] static std::shared_ptr<ImageComparator> create(std::string_view type, int sensitivity);

    protected:
        // Throws std::invalid_argument outside [0, 100].
        explicit ImageComparator(int sensitivity);

        // Sensitivity mapped onto an intensity threshold: 100 -> 0 (strict), 0 -> 255 (lenient).
        [[nodiscard]] int threshold() const noexcept;

        // Throws ComputationError for empty input, ShapeMismatchError unless rows, columns and channels agree.
        static void validateShapes(const cv::Mat &before, const cv::Mat &after);

    private:
        int sensitivity_;
    };

} // namespace processing::image

#endif // IMAGE_COMPARATOR_HPP
