// File: capture/pair_matcher.hpp

#ifndef CAPTURE_PAIR_MATCHER_HPP
#define CAPTURE_PAIR_MATCHER_HPP

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "capture/run_resolver.hpp"
#include "types/run_report.hpp"
#include "types/screenshot_pair.hpp"

namespace capture {

    // All keys of a run in lexicographic order, complete or not.
    class PairSet {
    public:
        PairSet(std::string left_name, std::string right_name, std::map<std::string, types::ScreenshotPair> pairs) :
            left_name_(std::move(left_name)), right_name_(std::move(right_name)), pairs_(std::move(pairs)) {}

        [[nodiscard]] std::vector<types::ScreenshotPair> complete() const;
        [[nodiscard]] std::vector<types::UnmatchedKey> unmatched() const;

        [[nodiscard]] std::size_t size() const noexcept { return pairs_.size(); }

    private:
        std::string left_name_, right_name_;
        std::map<std::string, types::ScreenshotPair> pairs_;
    };

    class PairMatcher {
    public:
        // Exact-string match on keys across the two sides.
        [[nodiscard]] static PairSet match(const CaptureSide &left, const CaptureSide &right);

        [[nodiscard]] static PairSet match(const RunLayout &layout) { return match(layout.left, layout.right); }
    };

} // namespace capture

#endif // CAPTURE_PAIR_MATCHER_HPP
