// File: processing/image/comparison/rms_comparator.hpp

#ifndef IMAGE_COMPARATOR_RMS_HPP
#define IMAGE_COMPARATOR_RMS_HPP

#include <vector>

#include <opencv2/core.hpp>

#include "processing/image/comparator.hpp"

namespace processing::image {
    // Root-mean-square of the per-channel RMS of the absolute difference image.
    class RMSComparator : public ImageComparator {
    public:
        [[nodiscard]] types::ImageComparisonResult compare(const types::NormalizedImage &image1,
                                                           const types::NormalizedImage &image2) const override;

        // Per-channel sqrt(mean(d^2)) over all pixels of `difference`.
        [[nodiscard]] static std::vector<double> channelRMS(const cv::Mat &difference);

        // sqrt(sum(v^2) / n); 0 for an empty list.
        [[nodiscard]] static double combine(const std::vector<double> &channel_rms) noexcept;
    };
}

#endif //IMAGE_COMPARATOR_RMS_HPP
