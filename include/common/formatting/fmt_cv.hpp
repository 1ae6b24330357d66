// File: common/formatting/fmt_cv.hpp

#ifndef FMT_OPENCV_HPP
#define FMT_OPENCV_HPP

#include <fmt/format.h>
#include <opencv2/core.hpp>

/*
 * Formatters for the OpenCV value types that show up in log lines and reports.
 * cv::Size renders as "<width>x<height>", e.g. fmt::format("{}", cv::Size(800, 600)) == "800x600".
 */

template<>
struct fmt::formatter<cv::Size> {
    constexpr auto parse(fmt::format_parse_context &ctx) -> decltype(ctx.begin()) {
        auto it = ctx.begin();
        if (it != ctx.end() && *it != '}') {
            throw fmt::format_error("cv::Size does not take format specifiers");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const cv::Size &size, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}x{}", size.width, size.height);
    }
};

#endif // FMT_OPENCV_HPP
