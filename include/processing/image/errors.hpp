// File: processing/image/errors.hpp

#ifndef IMAGE_ERRORS_HPP
#define IMAGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace processing::image {

    // Base of every failure raised while decoding, comparing or rendering a single request.
    class ImageDiffError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Input bytes are empty, truncated or not a recognised raster format.
    class DecodeError final : public ImageDiffError {
    public:
        using ImageDiffError::ImageDiffError;
    };

    class EncodeError final : public ImageDiffError {
    public:
        using ImageDiffError::ImageDiffError;
    };

    // The two inputs differ in rows, columns or channel count.
    class ShapeMismatchError final : public ImageDiffError {
    public:
        ShapeMismatchError(const std::string &before_shape, const std::string &after_shape) :
            ImageDiffError("Image shapes must match: " + before_shape + " vs " + after_shape),
            before_shape_(before_shape), after_shape_(after_shape) {}

        [[nodiscard]] const std::string &beforeShape() const noexcept { return before_shape_; }
        [[nodiscard]] const std::string &afterShape() const noexcept { return after_shape_; }

    private:
        std::string before_shape_;
        std::string after_shape_;
    };

    class ComputationError final : public ImageDiffError {
    public:
        using ImageDiffError::ImageDiffError;
    };

    class RenderError final : public ImageDiffError {
    public:
        using ImageDiffError::ImageDiffError;
    };

    // A comparison, visualisation or palette name that is not part of the closed set.
    class UnknownStrategyError final : public ImageDiffError {
    public:
        using ImageDiffError::ImageDiffError;
    };

} // namespace processing::image

#endif // IMAGE_ERRORS_HPP
