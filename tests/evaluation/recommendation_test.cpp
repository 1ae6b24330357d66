// tests/evaluation/recommendation_test.cpp

#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "evaluation/recommendation.hpp"

using evaluation::RecommendationSynthesizer;
using types::Outcome;
using types::Verdict;

namespace {
    types::ComparedPair compared(const std::string &key, const double rms, const Verdict verdict) {
        types::ScreenshotPair pair(key, "explore/" + key + ".png", "script/" + key + ".png");
        types::DiffResult result{key, rms, false, {10, 10}, {10, 10}, "diffs/diff-" + key + ".png"};
        return {std::move(pair), std::move(result), verdict};
    }
}

TEST(RecommendationTest, EmptyInputIsAnError) {
    EXPECT_THROW((void) RecommendationSynthesizer::synthesize({}), common::ConfigurationError);
}

TEST(RecommendationTest, AllMatchesAreAllClear) {
    const auto recommendation = RecommendationSynthesizer::synthesize(
            {compared("01-login", 3.5, Verdict::Match), compared("02-home", 21.0, Verdict::Match)});

    EXPECT_EQ(recommendation.outcome, Outcome::AllClear);
    EXPECT_EQ(recommendation.total, 2u);
    EXPECT_EQ(recommendation.matches, 2u);
    EXPECT_FALSE(recommendation.divergence_point.has_value());
    EXPECT_TRUE(recommendation.flagged.empty());
    EXPECT_TRUE(recommendation.guidance.empty());
    EXPECT_EQ(recommendation.headline, "All clear: all 2 screenshots match within rendering noise.");
}

TEST(RecommendationTest, MinorDiffsNeedReview) {
    const auto recommendation = RecommendationSynthesizer::synthesize(
            {compared("01-login", 3.5, Verdict::Match), compared("02-home", 25.0, Verdict::MinorDiff),
             compared("03-cart", 28.0, Verdict::MinorDiff)});

    EXPECT_EQ(recommendation.outcome, Outcome::ReviewNeeded);
    EXPECT_EQ(recommendation.minor_diffs, 2u);
    EXPECT_FALSE(recommendation.divergence_point.has_value());
    ASSERT_EQ(recommendation.flagged.size(), 2u);
    EXPECT_EQ(recommendation.flagged[0].key, "02-home");
    EXPECT_EQ(recommendation.flagged[1].key, "03-cart");
    EXPECT_EQ(recommendation.flagged[1].rms, 28.0);
    ASSERT_EQ(recommendation.guidance.size(), 1u);
    EXPECT_NE(recommendation.guidance.front().find("cosmetic"), std::string::npos);
}

TEST(RecommendationTest, MajorDiffWinsOverMinor) {
    const auto recommendation = RecommendationSynthesizer::synthesize(
            {compared("01-login", 3.5, Verdict::Match), compared("02-home", 25.0, Verdict::MinorDiff),
             compared("03-cart", 80.0, Verdict::MajorDiff), compared("04-pay", 120.0, Verdict::MajorDiff)});

    EXPECT_EQ(recommendation.outcome, Outcome::ScriptsNeedUpdate);
    EXPECT_EQ(recommendation.total, 4u);
    EXPECT_EQ(recommendation.matches, 1u);
    EXPECT_EQ(recommendation.minor_diffs, 1u);
    EXPECT_EQ(recommendation.major_diffs, 2u);
    ASSERT_TRUE(recommendation.divergence_point.has_value());
    EXPECT_EQ(*recommendation.divergence_point, "03-cart");

    // only the major diffs are flagged
    ASSERT_EQ(recommendation.flagged.size(), 2u);
    EXPECT_EQ(recommendation.flagged[0].key, "03-cart");
    EXPECT_EQ(recommendation.flagged[1].key, "04-pay");

    EXPECT_EQ(recommendation.headline, "Scripts need update: 2 screenshots of 4 show different content.");
    ASSERT_EQ(recommendation.guidance.size(), 2u);
    EXPECT_NE(recommendation.guidance[0].find("`03-cart`"), std::string::npos);
}

TEST(RecommendationTest, DivergencePointFollowsInputOrder) {
    const auto recommendation = RecommendationSynthesizer::synthesize(
            {compared("01-login", 200.0, Verdict::MajorDiff), compared("02-home", 3.0, Verdict::Match)});

    ASSERT_TRUE(recommendation.divergence_point.has_value());
    EXPECT_EQ(*recommendation.divergence_point, "01-login");
    EXPECT_EQ(recommendation.guidance.size(), 1u);
    EXPECT_EQ(recommendation.headline, "Scripts need update: 1 screenshot of 2 show different content.");
}
