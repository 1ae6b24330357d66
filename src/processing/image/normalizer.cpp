// File: processing/image/normalizer.cpp

#include "processing/image/normalizer.hpp"

#include <algorithm>
#include <opencv2/imgproc.hpp>

#include "common/errors.hpp"
#include "common/io/image.hpp"
#include "common/logging/logger.hpp"

namespace processing::image {

    types::NormalizedImage ImageNormalizer::load(const std::filesystem::path &path) {
        const cv::Mat decoded = common::io::image::readImage(path, cv::IMREAD_UNCHANGED);
        try {
            return types::NormalizedImage(toThreeChannel(decoded), path);
        } catch (const cv::Exception &e) {
            LOG_ERROR("Could not convert {} to 3 channels: {}", path.string(), e.what());
            throw common::DecodeError(fmt::format("Could not convert {} to RGB: {}", path.string(), e.what()));
        }
    }

    cv::Mat ImageNormalizer::toThreeChannel(const cv::Mat &image) {
        if (image.empty()) {
            throw common::DecodeError("Cannot normalize an empty image");
        }

        cv::Mat eight_bit;
        switch (image.depth()) {
            case CV_8U:
                eight_bit = image;
                break;
            case CV_16U:
                image.convertTo(eight_bit, CV_8U, 1.0 / 257.0);
                break;
            case CV_32F:
            case CV_64F:
                image.convertTo(eight_bit, CV_8U, 255.0);
                break;
            default:
                image.convertTo(eight_bit, CV_8U);
                break;
        }

        cv::Mat converted;
        switch (eight_bit.channels()) {
            case 1:
                cv::cvtColor(eight_bit, converted, cv::COLOR_GRAY2BGR);
                break;
            case 2: {
                // gray + alpha
                cv::Mat gray;
                cv::extractChannel(eight_bit, gray, 0);
                cv::cvtColor(gray, converted, cv::COLOR_GRAY2BGR);
                break;
            }
            case 3:
                converted = eight_bit.clone();
                break;
            case 4:
                cv::cvtColor(eight_bit, converted, cv::COLOR_BGRA2BGR);
                break;
            default:
                LOG_ERROR("Unsupported channel count: {}", eight_bit.channels());
                throw common::DecodeError(fmt::format("Unsupported channel count: {}", eight_bit.channels()));
        }

        if (image.channels() != 3 || image.depth() != CV_8U) {
            LOG_DEBUG("Converted {}-channel image (depth {}) to 8-bit BGR.", image.channels(), image.depth());
        }
        return converted;
    }

    NormalizedPair ImageNormalizer::normalizePair(const types::NormalizedImage &first,
                                                  const types::NormalizedImage &second) {
        const cv::Size first_size = first.size();
        const cv::Size second_size = second.size();

        if (first_size == second_size) {
            return NormalizedPair{first, second, false, first_size, second_size};
        }

        const cv::Size canvas(std::max(first_size.width, second_size.width),
                              std::max(first_size.height, second_size.height));
        LOG_WARN("Size mismatch: {} vs {}, padding both to {}", first_size, second_size, canvas);

        return NormalizedPair{types::NormalizedImage(pad(first.getImage(), canvas), first.getSource()),
                              types::NormalizedImage(pad(second.getImage(), canvas), second.getSource()), true,
                              first_size, second_size};
    }

    cv::Mat ImageNormalizer::pad(const cv::Mat &image, const cv::Size &canvas) {
        if (image.size() == canvas) {
            return image;
        }
        cv::Mat padded;
        cv::copyMakeBorder(image, padded, 0, canvas.height - image.rows, 0, canvas.width - image.cols,
                           cv::BORDER_CONSTANT, cv::Scalar::all(0));
        return padded;
    }

} // namespace processing::image
