// File: processing/image/comparison/rms_comparator.cpp

#include "processing/image/comparison/rms_comparator.hpp"

#include <cmath>
#include <functional>
#include <numeric>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace processing::image {

    types::ImageComparisonResult RMSComparator::compare(const types::NormalizedImage &image1,
                                                        const types::NormalizedImage &image2) const {
        if (image1.size() != image2.size()) {
            throw std::invalid_argument("Images must have the same size");
        }

        cv::Mat difference;
        cv::absdiff(image1.getImage(), image2.getImage(), difference);

        const auto channels = channelRMS(difference);
        const double rms = combine(channels);

        std::map<std::string, double> metrics;
        for (std::size_t channel = 0; channel < channels.size(); ++channel) {
            metrics.emplace(fmt::format("rms.channel{}", channel), channels[channel]);
        }

        LOG_DEBUG("RMS {:.4f} (channels: {:.4f}, {:.4f}, {:.4f})", rms, channels[0], channels[1], channels[2]);
        return {"rms", rms, difference, std::move(metrics)};
    }

    std::vector<double> RMSComparator::channelRMS(const cv::Mat &difference) {
        if (difference.empty()) {
            throw std::invalid_argument("Difference image is empty");
        }

        cv::Mat squared;
        difference.convertTo(squared, CV_64F);
        squared = squared.mul(squared);

        const cv::Scalar sums = cv::sum(squared);
        const auto pixels = static_cast<double>(difference.total());

        std::vector<double> channels(static_cast<std::size_t>(difference.channels()));
        for (std::size_t channel = 0; channel < channels.size(); ++channel) {
            channels[channel] = std::sqrt(sums[static_cast<int>(channel)] / pixels);
        }
        return channels;
    }

    double RMSComparator::combine(const std::vector<double> &channel_rms) noexcept {
        if (channel_rms.empty()) {
            return 0.0;
        }
        const double sum_of_squares = std::transform_reduce(channel_rms.begin(), channel_rms.end(), 0.0, std::plus<>(),
                                                            [](const double value) { return value * value; });
        return std::sqrt(sum_of_squares / static_cast<double>(channel_rms.size()));
    }

}
