// File: common/io/io.hpp

#ifndef IO_HPP
#define IO_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "common/logging/logger.hpp"

namespace common::io {

    /**
     * @brief Checks if a directory exists.
     *
     * @param dir_path Path to the directory.
     * @return true if the path exists and is a directory, false otherwise.
     */
    inline bool directoryExists(const std::filesystem::path &dir_path) {
        std::error_code error;
        if (std::filesystem::is_directory(dir_path, error)) {
            LOG_DEBUG("Directory exists: {}", dir_path.string());
            return true;
        }

        LOG_DEBUG("Directory does not exist: {}", dir_path.string());
        return false;
    }


    /**
     * @brief Creates a directory and all necessary parent directories. Existing directories are left alone.
     *
     * @param dir_path Path to the directory.
     * @throws std::runtime_error if the directory could not be created.
     */
    inline void createDirectory(const std::filesystem::path &dir_path) {
        LOG_DEBUG("Creating directory: {}", dir_path.string());
        try {
            std::filesystem::create_directories(dir_path);
        } catch (const std::filesystem::filesystem_error &e) {
            LOG_ERROR("Filesystem error: {}", e.what());
            throw std::runtime_error(fmt::format("Could not create directory: {}", dir_path.string()));
        }
        if (!std::filesystem::is_directory(dir_path)) {
            LOG_ERROR("Could not create directory: {}", dir_path.string());
            throw std::runtime_error(fmt::format("Could not create directory: {}", dir_path.string()));
        }
    }

    /**
     * @brief Lists immediate subdirectories of a directory, sorted by name.
     *
     * @param dir_path Path to the directory.
     * @return std::vector<std::filesystem::path> Full paths of the subdirectories.
     * @throws std::runtime_error if the directory could not be read.
     */
    inline std::vector<std::filesystem::path> listSubdirectories(const std::filesystem::path &dir_path) {
        if (!directoryExists(dir_path)) {
            LOG_ERROR("Directory does not exist or is not a directory: {}", dir_path.string());
            throw std::runtime_error(fmt::format("Directory does not exist or is not a directory: {}",
                                                 dir_path.string()));
        }

        std::vector<std::filesystem::path> directories;
        for (const auto &entry: std::filesystem::directory_iterator(dir_path)) {
            if (entry.is_directory()) {
                directories.push_back(entry.path());
            }
        }
        std::ranges::sort(directories);

        LOG_DEBUG("Found {} subdirectories in {}", directories.size(), dir_path.string());
        return directories;
    }

    /**
     * @brief Lists full paths of regular files whose extension is one of the given extensions.
     *
     * Extensions include the dot (".png") and are compared case-insensitively.
     *
     * @param dir_path Path to the directory.
     * @param extensions Accepted extensions.
     * @return std::vector<std::filesystem::path> Matching files, sorted by path.
     * @throws std::runtime_error if the directory could not be read.
     */
    inline std::vector<std::filesystem::path> filesByExtension(const std::filesystem::path &dir_path,
                                                               const std::vector<std::string> &extensions) {
        if (!directoryExists(dir_path)) {
            LOG_ERROR("Directory does not exist or is not a directory: {}", dir_path.string());
            throw std::runtime_error(fmt::format("Directory does not exist or is not a directory: {}",
                                                 dir_path.string()));
        }

        const auto lower = [](std::string value) {
            std::ranges::transform(value, value.begin(), [](unsigned char c) { return std::tolower(c); });
            return value;
        };

        std::vector<std::string> accepted;
        accepted.reserve(extensions.size());
        std::ranges::transform(extensions, std::back_inserter(accepted), lower);

        std::vector<std::filesystem::path> matching_files;
        for (const auto &entry: std::filesystem::directory_iterator(dir_path)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            if (std::ranges::find(accepted, lower(entry.path().extension().string())) != accepted.end()) {
                matching_files.push_back(entry.path());
            }
        }

        std::ranges::sort(matching_files);

        LOG_DEBUG("Found {} image files in directory: {}", matching_files.size(), dir_path.string());
        return matching_files;
    }

    /**
     * @brief Writes a string to a file, replacing any previous content.
     *
     * @throws std::runtime_error if the file could not be opened or written.
     */
    inline void writeTextFile(const std::filesystem::path &file_path, const std::string &content) {
        std::ofstream file(file_path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("Failed to open file: {}", file_path.string());
            throw std::runtime_error(fmt::format("Failed to open file: {}", file_path.string()));
        }

        file << content;
        if (!file) {
            LOG_ERROR("Failed to write file: {}", file_path.string());
            throw std::runtime_error(fmt::format("Failed to write file: {}", file_path.string()));
        }
        LOG_DEBUG("Wrote {} bytes to {}", content.size(), file_path.string());
    }
} // namespace common::io

#endif // IO_HPP
