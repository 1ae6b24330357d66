// File: capture/pair_matcher.cpp

#include "capture/pair_matcher.hpp"

#include <optional>

#include "common/logging/logger.hpp"

namespace capture {

    std::vector<types::ScreenshotPair> PairSet::complete() const {
        std::vector<types::ScreenshotPair> pairs;
        for (const auto &[key, pair]: pairs_) {
            if (pair.isComplete()) {
                pairs.push_back(pair);
            }
        }
        return pairs;
    }

    std::vector<types::UnmatchedKey> PairSet::unmatched() const {
        std::vector<types::UnmatchedKey> keys;
        for (const auto &[key, pair]: pairs_) {
            if (pair.isComplete()) {
                continue;
            }
            if (pair.left()) {
                keys.push_back({key, left_name_, *pair.left()});
            } else if (pair.right()) {
                keys.push_back({key, right_name_, *pair.right()});
            }
        }
        return keys;
    }

    PairSet PairMatcher::match(const CaptureSide &left, const CaptureSide &right) {
        std::map<std::string, std::optional<std::filesystem::path>> left_paths, right_paths;
        for (const auto &file: left.files) {
            left_paths.try_emplace(file.key, file.path);
            right_paths.try_emplace(file.key, std::nullopt);
        }
        for (const auto &file: right.files) {
            if (auto [it, inserted] = right_paths.try_emplace(file.key, file.path); !inserted && !it->second) {
                it->second = file.path;
            }
            left_paths.try_emplace(file.key, std::nullopt);
        }

        std::map<std::string, types::ScreenshotPair> pairs;
        std::size_t complete = 0;
        for (const auto &[key, left_path]: left_paths) {
            types::ScreenshotPair pair(key, left_path, right_paths.at(key));
            if (pair.isComplete()) {
                ++complete;
            } else {
                LOG_WARN("Screenshot '{}' only exists on the '{}' side, it will not be compared", key,
                         left_path ? left.name : right.name);
            }
            pairs.emplace(key, std::move(pair));
        }

        LOG_INFO("Matched {} of {} screenshot keys across '{}' and '{}'.", complete, pairs.size(), left.name,
                 right.name);
        return PairSet(left.name, right.name, std::move(pairs));
    }

} // namespace capture
