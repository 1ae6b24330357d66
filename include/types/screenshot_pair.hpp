// File: types/screenshot_pair.hpp

#ifndef TYPES_SCREENSHOT_PAIR_HPP
#define TYPES_SCREENSHOT_PAIR_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace types {

    // The two captures of one screen, linked by their shared key. Either side may be missing.
    class ScreenshotPair {
    public:
        ScreenshotPair(std::string key, std::optional<std::filesystem::path> left,
                       std::optional<std::filesystem::path> right) :
            key_(std::move(key)), left_(std::move(left)), right_(std::move(right)) {}

        [[nodiscard]] const std::string &key() const noexcept { return key_; }
        [[nodiscard]] const std::optional<std::filesystem::path> &left() const noexcept { return left_; }
        [[nodiscard]] const std::optional<std::filesystem::path> &right() const noexcept { return right_; }

        [[nodiscard]] bool isComplete() const noexcept { return left_.has_value() && right_.has_value(); }

    private:
        std::string key_;
        std::optional<std::filesystem::path> left_;
        std::optional<std::filesystem::path> right_;
    };

} // namespace types

#endif // TYPES_SCREENSHOT_PAIR_HPP
