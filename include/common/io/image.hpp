// File: common/io/image.hpp

#ifndef COMMON_IMAGE_IO_HPP
#define COMMON_IMAGE_IO_HPP

#include <filesystem>
#include <opencv2/imgcodecs.hpp>

#include "common/errors.hpp"
#include "common/io/io.hpp"
#include "common/logging/logger.hpp"

namespace common::io::image {
    /**
     * @brief Reads an image from a file using OpenCV.
     *
     * @param file_path Path to the image file.
     * @param mode Flag specifying the color type of the loaded image.
     * @return cv::Mat The loaded image.
     * @throws common::DecodeError if the file is missing or could not be decoded.
     */
    inline cv::Mat readImage(const std::filesystem::path &file_path, const cv::ImreadModes mode = cv::IMREAD_UNCHANGED) {
        LOG_TRACE("Reading image from file: {}", file_path.string());
        if (std::error_code error; !std::filesystem::is_regular_file(file_path, error)) {
            LOG_ERROR("Image file does not exist: {}", file_path.string());
            throw DecodeError(fmt::format("Image file does not exist: {}", file_path.string()));
        }

        cv::Mat image;
        try {
            image = cv::imread(file_path.string(), mode);
        } catch (const cv::Exception &e) {
            LOG_ERROR("OpenCV failed to decode {}: {}", file_path.string(), e.what());
            throw DecodeError(fmt::format("Could not decode image {}: {}", file_path.string(), e.what()));
        }

        if (image.empty()) {
            LOG_ERROR("Could not read image: {}", file_path.string());
            throw DecodeError(fmt::format("Could not read image: {}", file_path.string()));
        }
        LOG_TRACE("Image read successfully: {} ({})", file_path.string(), image.size());
        return image;
    }

    /**
     * @brief Writes an image to a file using OpenCV. The encoding follows the file extension.
     *
     * @param file_path Path to the image file.
     * @param image Image to be saved.
     * @param create_directories Flag indicating whether to create directories if they do not exist.
     * @throws std::runtime_error if the image could not be written.
     */
    inline void writeImage(const std::filesystem::path &file_path, const cv::Mat &image,
                           const bool create_directories = true) {
        if (create_directories && file_path.has_parent_path()) {
            common::io::createDirectory(file_path.parent_path());
        }

        LOG_TRACE("Writing image to file: {}", file_path.string());
        bool written = false;
        try {
            written = cv::imwrite(file_path.string(), image);
        } catch (const cv::Exception &e) {
            LOG_ERROR("OpenCV failed to encode {}: {}", file_path.string(), e.what());
        }
        if (!written) {
            LOG_ERROR("Could not write image: {}", file_path.string());
            throw std::runtime_error(fmt::format("Could not write image: {}", file_path.string()));
        }
        LOG_TRACE("Image written successfully: {}", file_path.string());
    }
}

#endif // COMMON_IMAGE_IO_HPP
