// tests/evaluation/classifier_test.cpp

#include <gtest/gtest.h>
#include <limits>

#include "common/errors.hpp"
#include "config/configuration.hpp"
#include "evaluation/classifier.hpp"

using evaluation::Classifier;
using types::Verdict;

TEST(ClassifierTest, DefaultThresholds) {
    const Classifier classifier;
    EXPECT_EQ(classifier.thresholds().match, 22.0);
    EXPECT_EQ(classifier.thresholds().review, 30.0);
}

TEST(ClassifierTest, BoundariesAreHalfOpen) {
    const Classifier classifier;
    EXPECT_EQ(classifier.classify(0.0), Verdict::Match);
    EXPECT_EQ(classifier.classify(21.99), Verdict::Match);
    EXPECT_EQ(classifier.classify(22.0), Verdict::MinorDiff);
    EXPECT_EQ(classifier.classify(29.99), Verdict::MinorDiff);
    EXPECT_EQ(classifier.classify(30.0), Verdict::MajorDiff);
    EXPECT_EQ(classifier.classify(255.0), Verdict::MajorDiff);
}

TEST(ClassifierTest, NanIsTreatedAsMajor) {
    const Classifier classifier;
    EXPECT_EQ(classifier.classify(std::numeric_limits<double>::quiet_NaN()), Verdict::MajorDiff);
}

TEST(ClassifierTest, CustomThresholds) {
    const Classifier classifier({5.0, 10.0});
    EXPECT_EQ(classifier.classify(4.9), Verdict::Match);
    EXPECT_EQ(classifier.classify(5.0), Verdict::MinorDiff);
    EXPECT_EQ(classifier.classify(10.0), Verdict::MajorDiff);
}

TEST(ClassifierTest, RejectsInvalidThresholds) {
    EXPECT_THROW(Classifier({30.0, 22.0}), std::invalid_argument);
    EXPECT_THROW(Classifier({22.0, 22.0}), std::invalid_argument);
    EXPECT_THROW(Classifier({-1.0, 22.0}), std::invalid_argument);
    EXPECT_THROW(Classifier({0.0, std::numeric_limits<double>::infinity()}), std::invalid_argument);
}

class ClassifierConfigurationTest : public ::testing::Test {
protected:
    void TearDown() override {
        config::set("classifier.match_threshold", Classifier::default_match_threshold);
        config::set("classifier.review_threshold", Classifier::default_review_threshold);
    }
};

TEST_F(ClassifierConfigurationTest, ReadsThresholds) {
    config::set("classifier.match_threshold", 10.0);
    config::set("classifier.review_threshold", 12.5);
    const auto classifier = Classifier::fromConfiguration();
    EXPECT_EQ(classifier.thresholds().match, 10.0);
    EXPECT_EQ(classifier.thresholds().review, 12.5);
}

TEST_F(ClassifierConfigurationTest, UnparseableThresholdIsAConfigurationError) {
    config::set("classifier.match_threshold", std::string("abc"));
    EXPECT_THROW((void) Classifier::fromConfiguration(), common::ConfigurationError);
}

TEST(VerdictTest, Labels) {
    EXPECT_EQ(types::toString(Verdict::Match), "MATCH");
    EXPECT_EQ(types::toString(Verdict::MinorDiff), "MINOR_DIFF");
    EXPECT_EQ(types::toString(Verdict::MajorDiff), "MAJOR_DIFF");
    EXPECT_EQ(fmt::format("{}", Verdict::MinorDiff), "MINOR_DIFF");
    EXPECT_EQ(types::describe(Verdict::MajorDiff), "different content");
}
