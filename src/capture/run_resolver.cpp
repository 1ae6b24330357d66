// File: capture/run_resolver.cpp

#include "capture/run_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fmt/chrono.h>
#include <functional>
#include <set>
#include <unordered_map>

#include "common/errors.hpp"
#include "common/io/io.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"

namespace capture {

    namespace {
        void requireDirectory(const std::filesystem::path &directory, const std::string_view what) {
            if (!common::io::directoryExists(directory)) {
                LOG_ERROR("{} not found: {}", what, directory.string());
                throw common::ConfigurationError(fmt::format("{} not found: {}", what, directory.string()));
            }
        }

        // Keeps the first file seen for every key; `files` must already be sorted.
        void appendUnique(CaptureSide &side, std::set<std::string> &seen, std::string key,
                          const std::filesystem::path &path) {
            if (!seen.insert(key).second) {
                LOG_WARN("Duplicate screenshot key '{}' on side '{}', ignoring {}", key, side.name, path.string());
                return;
            }
            side.files.push_back({std::move(key), path});
        }
    } // namespace

    std::string timestamp() { return fmt::format("{:%Y%m%d-%H%M%S}", fmt::localtime(std::time(nullptr))); }

    CaptureSide listSide(const std::string &name, const std::filesystem::path &directory,
                         const std::vector<std::string> &extensions) {
        CaptureSide side{name, directory, {}};
        std::set<std::string> seen;
        for (const auto &path: common::io::filesByExtension(directory, extensions)) {
            appendUnique(side, seen, path.stem().string(), path);
        }
        LOG_DEBUG("Side '{}' has {} screenshots in {}", name, side.files.size(), directory.string());
        return side;
    }

    std::unique_ptr<RunResolver> RunResolver::create() {
        const auto extensions = config::require<std::vector<std::string>>("capture.extensions", {".png"});
        const auto root = std::filesystem::path(config::get("capture.root", "screenshots"));
        const auto left_name = config::get("capture.left.name", "explore");
        const auto right_name = config::get("capture.right.name", "script");

        static const std::unordered_map<std::string_view, std::function<std::unique_ptr<RunResolver>(
                const std::filesystem::path &, const std::string &, const std::string &,
                const std::vector<std::string> &)>>
                map{{"runs",
                     [](auto &r, auto &l, auto &s, auto &e) { return std::make_unique<LatestRunResolver>(r, l, s, e); }},
                    {"prefixed",
                     [](auto &r, auto &l, auto &s, auto &e) {
                         return std::make_unique<PrefixedRunResolver>(r, l, s, e);
                     }},
                    {"directories", [](auto &, auto &l, auto &s, auto &e) {
                         return std::make_unique<DirectoryPairResolver>(
                                 config::require<std::string>("capture.left.directory"),
                                 config::require<std::string>("capture.right.directory"), e, l, s);
                     }}};

        auto layout = config::get("capture.layout", "runs");
        std::ranges::transform(layout, layout.begin(), [](const unsigned char c) { return std::tolower(c); });

        const auto it = map.find(layout);
        if (it == map.end()) {
            LOG_ERROR("Invalid capture layout '{}'", layout);
            throw common::ConfigurationError(
                    fmt::format("Unknown capture layout '{}' (expected runs, prefixed or directories)", layout));
        }

        LOG_INFO("Using '{}' capture layout.", layout);
        return it->second(root, left_name, right_name, extensions);
    }

    LatestRunResolver::LatestRunResolver(std::filesystem::path root, std::string left_name, std::string right_name,
                                         std::vector<std::string> extensions) :
        root_(std::move(root)), left_name_(std::move(left_name)), right_name_(std::move(right_name)),
        extensions_(std::move(extensions)) {}

    std::vector<std::filesystem::path> LatestRunResolver::candidates() const {
        requireDirectory(root_, "Capture root");

        std::vector<std::filesystem::path> runs;
        for (const auto &directory: common::io::listSubdirectories(root_)) {
            if (common::io::directoryExists(directory / left_name_) &&
                common::io::directoryExists(directory / right_name_)) {
                runs.push_back(directory);
            } else {
                LOG_DEBUG("Skipping {}: missing '{}' or '{}' capture directory", directory.string(), left_name_,
                          right_name_);
            }
        }
        return runs;
    }

    RunLayout LatestRunResolver::resolve() const {
        const auto runs = candidates();
        if (runs.empty()) {
            LOG_ERROR("No capture runs with '{}' and '{}' directories under {}", left_name_, right_name_,
                      root_.string());
            throw common::ConfigurationError(fmt::format("No capture runs with '{}/' and '{}/' found under {}",
                                                         left_name_, right_name_, root_.string()));
        }

        const auto &latest = runs.back();
        LOG_INFO("Resolved latest run {} out of {} candidate(s).", latest.filename().string(), runs.size());

        return RunLayout{latest.filename().string(), latest, listSide(left_name_, latest / left_name_, extensions_),
                         listSide(right_name_, latest / right_name_, extensions_)};
    }

    PrefixedRunResolver::PrefixedRunResolver(std::filesystem::path root, std::string left_prefix,
                                             std::string right_prefix, std::vector<std::string> extensions) :
        root_(std::move(root)), left_prefix_(std::move(left_prefix)), right_prefix_(std::move(right_prefix)),
        extensions_(std::move(extensions)) {}

    RunLayout PrefixedRunResolver::resolve() const {
        requireDirectory(root_, "Capture root");

        RunLayout layout{timestamp(), root_, CaptureSide{left_prefix_, root_, {}}, CaptureSide{right_prefix_, root_, {}}};
        std::set<std::string> left_seen, right_seen;

        const auto left_marker = left_prefix_ + "-";
        const auto right_marker = right_prefix_ + "-";

        for (const auto &path: common::io::filesByExtension(root_, extensions_)) {
            const auto stem = path.stem().string();
            if (stem.size() > left_marker.size() && stem.starts_with(left_marker)) {
                appendUnique(layout.left, left_seen, stem.substr(left_marker.size()), path);
            } else if (stem.size() > right_marker.size() && stem.starts_with(right_marker)) {
                appendUnique(layout.right, right_seen, stem.substr(right_marker.size()), path);
            } else {
                LOG_TRACE("Ignoring {}: no '{}' or '{}' prefix", path.filename().string(), left_marker, right_marker);
            }
        }

        LOG_INFO("Found {} '{}' and {} '{}' screenshots in {}", layout.left.files.size(), left_prefix_,
                 layout.right.files.size(), right_prefix_, root_.string());
        return layout;
    }

    DirectoryPairResolver::DirectoryPairResolver(std::filesystem::path left, std::filesystem::path right,
                                                 std::vector<std::string> extensions, std::string left_name,
                                                 std::string right_name) :
        left_(std::move(left)), right_(std::move(right)), extensions_(std::move(extensions)),
        left_name_(std::move(left_name)), right_name_(std::move(right_name)) {}

    RunLayout DirectoryPairResolver::resolve() const {
        requireDirectory(left_, fmt::format("Capture directory '{}'", left_name_));
        requireDirectory(right_, fmt::format("Capture directory '{}'", right_name_));

        // "shots/explore/" and "shots/explore" both live in "shots"
        auto left = left_.lexically_normal();
        if (!left.has_filename()) {
            left = left.parent_path();
        }
        auto base = left.parent_path();
        if (base.empty()) {
            base = std::filesystem::current_path();
        }
        return RunLayout{timestamp(), base, listSide(left_name_, left_, extensions_),
                         listSide(right_name_, right_, extensions_)};
    }

} // namespace capture
