// File: processing/image/normalizer.hpp

#ifndef IMAGE_NORMALIZER_HPP
#define IMAGE_NORMALIZER_HPP

#include <filesystem>
#include <opencv2/core.hpp>

#include "types/image.hpp"

namespace processing::image {

    struct NormalizedPair {
        types::NormalizedImage first;
        types::NormalizedImage second;
        bool size_mismatch{false};
        cv::Size first_size; // size before padding
        cv::Size second_size;
    };

    class ImageNormalizer {
    public:
        /**
         * @brief Decodes an image file into 8-bit, 3-channel form.
         *
         * @throws common::DecodeError if the file is missing, unreadable or not an image.
         */
        [[nodiscard]] static types::NormalizedImage load(const std::filesystem::path &path);

        /**
         * @brief Converts any decoded image to 8-bit, 3-channel form.
         *
         * Grayscale is replicated into all three channels and alpha is dropped (not composited). 16-bit and
         * floating point depths are scaled to 8-bit.
         *
         * @throws common::DecodeError for channel counts other than 1 to 4.
         */
        [[nodiscard]] static cv::Mat toThreeChannel(const cv::Mat &image);

        /**
         * @brief Brings two images to a common canvas.
         *
         * Images of equal size are returned unchanged. Otherwise both are placed at (0,0) on a zero-filled
         * canvas of the maximum width and height, so a shorter page shows up as a diff in the padded border.
         */
        [[nodiscard]] static NormalizedPair normalizePair(const types::NormalizedImage &first,
                                                          const types::NormalizedImage &second);

    private:
        [[nodiscard]] static cv::Mat pad(const cv::Mat &image, const cv::Size &canvas);
    };

} // namespace processing::image

#endif // IMAGE_NORMALIZER_HPP
