// File: processing/image/codec.cpp

#include "processing/image/codec.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "common/logging/logger.hpp"

namespace processing::image::codec {

    std::string_view extension(const ImageFormat format) noexcept {
        switch (format) {
            case ImageFormat::Jpeg:
                return ".jpg";
            case ImageFormat::Bmp:
                return ".bmp";
            case ImageFormat::Png:
            default:
                return ".png";
        }
    }

    cv::Mat decode(const Bytes &bytes, const ColorMode mode) {
        if (bytes.empty()) {
            LOG_ERROR("Refusing to decode an empty buffer.");
            throw DecodeError("Image data is empty");
        }

        const int flags = mode == ColorMode::Grayscale ? cv::IMREAD_GRAYSCALE : cv::IMREAD_COLOR;

        cv::Mat grid;
        try {
            grid = cv::imdecode(bytes, flags);
        } catch (const cv::Exception &e) {
            LOG_ERROR("OpenCV imdecode failed: {}", e.what());
            throw DecodeError(fmt::format("Image decoding failed: {}", e.what()));
        }

        if (grid.empty()) {
            LOG_ERROR("Could not decode {} bytes as an image.", bytes.size());
            throw DecodeError("Data is not a recognised image format");
        }

        LOG_TRACE("Decoded {} bytes into a {} grid.", bytes.size(), common::formatting::describeShape(grid));
        return grid;
    }

    Bytes encode(const cv::Mat &grid, const ImageFormat format) {
        if (grid.empty()) {
            LOG_ERROR("Refusing to encode an empty grid.");
            throw EncodeError("Cannot encode an empty image");
        }

        if (const int channels = grid.channels(); channels != 1 && channels != 3 && channels != 4) {
            LOG_ERROR("Unsupported channel count for encoding: {}", channels);
            throw EncodeError(fmt::format("Cannot encode an image with {} channels", channels));
        }

        Bytes encoded;
        try {
            if (!cv::imencode(std::string(extension(format)), grid, encoded) || encoded.empty()) {
                LOG_ERROR("Encoder rejected a {} grid as {}.", common::formatting::describeShape(grid),
                          extension(format));
                throw EncodeError(fmt::format("Failed to encode image as {}", extension(format)));
            }
        } catch (const cv::Exception &e) {
            LOG_ERROR("OpenCV imencode failed: {}", e.what());
            throw EncodeError(fmt::format("Image encoding failed: {}", e.what()));
        }

        return encoded;
    }

    cv::Mat toGrayscale(const cv::Mat &grid) {
        cv::Mat gray;
        switch (grid.channels()) {
            case 1:
                return grid;
            case 3:
                cv::cvtColor(grid, gray, cv::COLOR_BGR2GRAY);
                return gray;
            case 4:
                cv::cvtColor(grid, gray, cv::COLOR_BGRA2GRAY);
                return gray;
            default:
                throw std::invalid_argument(fmt::format("Cannot convert {} channels to grayscale", grid.channels()));
        }
    }

    cv::Mat toColor(const cv::Mat &grid) {
        cv::Mat color;
        switch (grid.channels()) {
            case 3:
                return grid;
            case 1:
                cv::cvtColor(grid, color, cv::COLOR_GRAY2BGR);
                return color;
            case 4:
                cv::cvtColor(grid, color, cv::COLOR_BGRA2BGR);
                return color;
            default:
                throw std::invalid_argument(fmt::format("Cannot convert {} channels to BGR", grid.channels()));
        }
    }

} // namespace processing::image::codec
