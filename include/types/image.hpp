// File: types/image.hpp

#ifndef TYPE_IMAGE_HPP
#define TYPE_IMAGE_HPP

#include <filesystem>
#include <opencv2/core.hpp>
#include <stdexcept>
#include <utility>

namespace types {

    // 8-bit, 3-channel pixel grid. Construction rejects anything else, so every consumer can rely on the layout.
    class NormalizedImage {
    public:
        explicit NormalizedImage(cv::Mat pixels, std::filesystem::path source = {}) :
            pixels_(std::move(pixels)), source_(std::move(source)) {
            if (pixels_.empty()) {
                throw std::invalid_argument("NormalizedImage requires a non-empty pixel grid");
            }
            if (pixels_.type() != CV_8UC3) {
                throw std::invalid_argument("NormalizedImage requires an 8-bit 3-channel pixel grid");
            }
        }

        [[nodiscard]] const cv::Mat &getImage() const noexcept { return pixels_; }
        [[nodiscard]] const std::filesystem::path &getSource() const noexcept { return source_; }
        [[nodiscard]] int width() const noexcept { return pixels_.cols; }
        [[nodiscard]] int height() const noexcept { return pixels_.rows; }
        [[nodiscard]] cv::Size size() const noexcept { return pixels_.size(); }

    private:
        cv::Mat pixels_;
        std::filesystem::path source_;
    };

} // namespace types

#endif // TYPE_IMAGE_HPP
