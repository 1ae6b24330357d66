// tests/processing/image/comparison/rms_comparator_test.cpp

#include <gtest/gtest.h>
#include <cmath>
#include <opencv2/core.hpp>

#include "common/errors.hpp"
#include "processing/image/comparison/rms_comparator.hpp"

using processing::image::RMSComparator;
using types::NormalizedImage;

class RMSComparatorTest : public ::testing::Test {
protected:
    RMSComparator comparator;

    static NormalizedImage solid(const int width, const int height, const cv::Scalar &color) {
        return NormalizedImage(cv::Mat(height, width, CV_8UC3, color));
    }

    static NormalizedImage gradient(const int width, const int height, const int offset) {
        cv::Mat pixels(height, width, CV_8UC3);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                pixels.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>((x * 31 + offset) % 256),
                                                       static_cast<uchar>((y * 17 + offset) % 256),
                                                       static_cast<uchar>((x * y + offset) % 256));
            }
        }
        return NormalizedImage(pixels);
    }
};

TEST_F(RMSComparatorTest, IdenticalImagesScoreZero) {
    const auto image = gradient(16, 9, 5);
    const auto result = comparator.compare(image, image);

    EXPECT_EQ(result.score, 0.0);
    EXPECT_EQ(result.method, "rms");
    EXPECT_EQ(cv::countNonZero(result.difference.reshape(1)), 0);
    EXPECT_EQ(result.difference.size(), image.size());
    EXPECT_EQ(result.difference.type(), CV_8UC3);
}

TEST_F(RMSComparatorTest, BlackVersusWhiteIsMaximal) {
    const auto black = solid(2, 2, cv::Scalar(0, 0, 0));
    const auto white = solid(2, 2, cv::Scalar(255, 255, 255));

    const auto result = comparator.compare(black, white);
    EXPECT_DOUBLE_EQ(result.score, 255.0);
    EXPECT_DOUBLE_EQ(result.additional_metrics.at("rms.channel0"), 255.0);
    EXPECT_DOUBLE_EQ(result.additional_metrics.at("rms.channel1"), 255.0);
    EXPECT_DOUBLE_EQ(result.additional_metrics.at("rms.channel2"), 255.0);
    EXPECT_EQ(result.difference.at<cv::Vec3b>(1, 1), cv::Vec3b(255, 255, 255));
}

TEST_F(RMSComparatorTest, IsSymmetric) {
    const auto a = gradient(13, 7, 0);
    const auto b = gradient(13, 7, 90);

    EXPECT_EQ(comparator.compare(a, b).score, comparator.compare(b, a).score);
    EXPECT_GT(comparator.compare(a, b).score, 0.0);
}

TEST_F(RMSComparatorTest, CombinesChannelsAsRmsOfRms) {
    // One channel differs by 30 everywhere, the others by nothing:
    // per-channel RMS = {30, 0, 0}, combined = sqrt(900 / 3)
    const auto a = solid(4, 4, cv::Scalar(0, 0, 0));
    const auto b = solid(4, 4, cv::Scalar(30, 0, 0));

    EXPECT_DOUBLE_EQ(comparator.compare(a, b).score, std::sqrt(300.0));
}

TEST_F(RMSComparatorTest, PerChannelRmsIsNotAFlatAverage) {
    // Channel 0 differs by 40 on half the pixels, channel 1 by 10 on all of them.
    cv::Mat left(2, 2, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::Mat right(2, 2, CV_8UC3, cv::Scalar(0, 10, 0));
    right.at<cv::Vec3b>(0, 0)[0] = 40;
    right.at<cv::Vec3b>(0, 1)[0] = 40;

    const auto channels = RMSComparator::channelRMS(cv::Mat(cv::abs(right - left)));
    ASSERT_EQ(channels.size(), 3u);
    EXPECT_DOUBLE_EQ(channels[0], std::sqrt(40.0 * 40.0 * 2 / 4));
    EXPECT_DOUBLE_EQ(channels[1], 10.0);
    EXPECT_DOUBLE_EQ(channels[2], 0.0);

    const double expected = std::sqrt((channels[0] * channels[0] + channels[1] * channels[1]) / 3.0);
    EXPECT_DOUBLE_EQ(comparator.compare(NormalizedImage(left), NormalizedImage(right)).score, expected);
}

TEST_F(RMSComparatorTest, CombineHandlesEdgeCases) {
    EXPECT_EQ(RMSComparator::combine({}), 0.0);
    EXPECT_DOUBLE_EQ(RMSComparator::combine({3.0, 4.0}), std::sqrt(12.5));
}

TEST_F(RMSComparatorTest, RejectsDifferentSizes) {
    EXPECT_THROW((void) comparator.compare(solid(2, 2, cv::Scalar::all(0)), solid(3, 2, cv::Scalar::all(0))),
                 std::invalid_argument);
}

TEST(ImageComparatorFactoryTest, SelectsComparatorByMethodName) {
    const auto comparator = processing::image::ImageComparator::create("RMS");
    EXPECT_NE(std::dynamic_pointer_cast<RMSComparator>(comparator), nullptr);
}

TEST(ImageComparatorFactoryTest, UnknownMethodIsAConfigurationError) {
    EXPECT_THROW((void) processing::image::ImageComparator::create("ssim"), common::ConfigurationError);
}
