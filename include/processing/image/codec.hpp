// File: processing/image/codec.hpp

#ifndef IMAGE_CODEC_HPP
#define IMAGE_CODEC_HPP

#include <opencv2/core.hpp>
#include <string_view>
#include <vector>

#include "processing/image/errors.hpp"

namespace processing::image {

    using Bytes = std::vector<uchar>;

    enum class ColorMode { Color, Grayscale };

    enum class ImageFormat { Png, Jpeg, Bmp };

    namespace codec {

        // File extension understood by cv::imencode, including the leading dot.
        [[nodiscard]] std::string_view extension(ImageFormat format) noexcept;

        /**
         * @brief Decodes an encoded raster image into a pixel grid.
         *
         * @param bytes Encoded image (PNG, JPEG, BMP, ... anything OpenCV can read).
         * @param mode Color yields CV_8UC3 (BGR), Grayscale yields CV_8UC1.
         * @throws DecodeError if the buffer is empty, truncated or unrecognised.
         */
        [[nodiscard]] cv::Mat decode(const Bytes &bytes, ColorMode mode);

        /**
         * @brief Encodes a pixel grid.
         *
         * @throws EncodeError if the grid is empty, has an unsupported channel count or the encoder rejects it.
         */
        [[nodiscard]] Bytes encode(const cv::Mat &grid, ImageFormat format = ImageFormat::Png);

        // Luminance-weighted reduction of a 1, 3 (BGR) or 4 (BGRA) channel grid to a single channel.
        // Single channel input is returned as is (shared data).
        [[nodiscard]] cv::Mat toGrayscale(const cv::Mat &grid);

        // Promote a 1 or 4 channel grid to BGR. BGR input is returned as is (shared data).
        [[nodiscard]] cv::Mat toColor(const cv::Mat &grid);

    } // namespace codec

} // namespace processing::image

#endif // IMAGE_CODEC_HPP
