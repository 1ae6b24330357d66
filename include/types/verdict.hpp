// File: types/verdict.hpp

#ifndef TYPES_VERDICT_HPP
#define TYPES_VERDICT_HPP

#include <fmt/format.h>
#include <string_view>

namespace types {

    enum class Verdict {
        Match,     // rendering noise, not a real difference
        MinorDiff, // possible change, needs a human look
        MajorDiff  // different content
    };

    // Classifier cut-offs. RMS below `match` is noise, below `review` a minor diff, anything else a major diff.
    struct Thresholds {
        double match{22.0};
        double review{30.0};
    };

    [[nodiscard]] constexpr std::string_view toString(const Verdict verdict) noexcept {
        switch (verdict) {
            case Verdict::Match:
                return "MATCH";
            case Verdict::MinorDiff:
                return "MINOR_DIFF";
            case Verdict::MajorDiff:
                return "MAJOR_DIFF";
        }
        return "UNKNOWN";
    }

    [[nodiscard]] constexpr std::string_view describe(const Verdict verdict) noexcept {
        switch (verdict) {
            case Verdict::Match:
                return "rendering noise";
            case Verdict::MinorDiff:
                return "possible change";
            case Verdict::MajorDiff:
                return "different content";
        }
        return "unknown";
    }

} // namespace types

template<>
struct fmt::formatter<types::Verdict> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const types::Verdict verdict, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(types::toString(verdict), ctx);
    }
};

#endif // TYPES_VERDICT_HPP
