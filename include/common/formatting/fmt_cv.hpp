// File: common/formatting/fmt_cv.hpp

#ifndef FMT_OPENCV_HPP
#define FMT_OPENCV_HPP

#include <fmt/format.h>
#include <opencv2/core.hpp>
#include <string>

/*
 * Formatters for the OpenCV value types that show up in log lines and error messages.
 * cv::Size prints as "WxH", cv::Rect as "WxH+X+Y".
 * Example: LOG_DEBUG("Region bounding box {}", rect);
 */

template<>
struct fmt::formatter<cv::Size> {
    constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const cv::Size &size, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}x{}", size.width, size.height);
    }
};

template<>
struct fmt::formatter<cv::Rect> {
    constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const cv::Rect &rect, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}x{}+{}+{}", rect.width, rect.height, rect.x, rect.y);
    }
};

namespace common::formatting {

    // Shape of a pixel grid as "HxWxC", the row-major convention used in error messages.
    inline std::string describeShape(const cv::Mat &mat) {
        if (mat.empty()) {
            return "empty";
        }
        return fmt::format("{}x{}x{}", mat.rows, mat.cols, mat.channels());
    }

} // namespace common::formatting

#endif // FMT_OPENCV_HPP
