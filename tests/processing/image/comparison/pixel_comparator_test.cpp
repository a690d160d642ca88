// File: tests/processing/image/comparison/pixel_comparator_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "processing/image/comparison/pixel_comparator.hpp"
#include "test_images.hpp"

using namespace processing::image;

class PixelComparatorTest : public ::testing::Test {
protected:
    const cv::Mat black_ = test_images::solid(100, 100);
    // Four vertical bands whose difference to black grows left to right.
    const cv::Mat banded_ = [] {
        cv::Mat image = test_images::solid(40, 40);
        image(cv::Rect(0, 0, 10, 40)).setTo(cv::Scalar::all(30));
        image(cv::Rect(10, 0, 10, 40)).setTo(cv::Scalar::all(90));
        image(cv::Rect(20, 0, 10, 40)).setTo(cv::Scalar::all(160));
        image(cv::Rect(30, 0, 10, 40)).setTo(cv::Scalar::all(250));
        return image;
    }();
};

TEST_F(PixelComparatorTest, IdenticalImagesScoreZeroAtAnySensitivity) {
    for (const int sensitivity: {0, 1, 50, 99, 100}) {
        const auto result = PixelComparator(sensitivity).compare(banded_, banded_);
        EXPECT_DOUBLE_EQ(result.score(), 0.0) << "sensitivity " << sensitivity;
        EXPECT_EQ(cv::countNonZero(result.map()), 0) << "sensitivity " << sensitivity;
    }
}

TEST_F(PixelComparatorTest, AllBlackImagesScoreZero) {
    const auto result = PixelComparator(50).compare(black_, black_.clone());

    EXPECT_DOUBLE_EQ(result.score(), 0.0);
    EXPECT_EQ(result.map().size(), cv::Size(100, 100));
    EXPECT_EQ(cv::countNonZero(result.map()), 0);
}

TEST_F(PixelComparatorTest, SingleWhitePixelAtFullSensitivity) {
    const cv::Mat before = test_images::solid(4, 4);
    cv::Mat after = before.clone();
    after.at<cv::Vec3b>(2, 1) = cv::Vec3b(255, 255, 255);

    const auto result = PixelComparator(100).compare(before, after);

    EXPECT_DOUBLE_EQ(result.score(), 6.25);
    EXPECT_EQ(result.map().at<uchar>(2, 1), 255);
    EXPECT_EQ(cv::countNonZero(result.map()), 1);
}

TEST_F(PixelComparatorTest, ScoreIsMonotonicInSensitivity) {
    double previous = -1.0;
    for (int sensitivity = 0; sensitivity <= 100; sensitivity += 5) {
        const double score = PixelComparator(sensitivity).compare(black_(cv::Rect(0, 0, 40, 40)), banded_).score();
        EXPECT_GE(score, previous) << "sensitivity " << sensitivity;
        previous = score;
    }
    EXPECT_DOUBLE_EQ(previous, 100.0);
}

TEST_F(PixelComparatorTest, ThresholdSplitsBands) {
    const cv::Mat before = black_(cv::Rect(0, 0, 40, 40));

    // sensitivity 50 -> threshold 127: only the 160 and 250 bands count
    EXPECT_DOUBLE_EQ(PixelComparator(50).compare(before, banded_).score(), 50.0);
    // sensitivity 0 -> threshold 255: nothing counts
    EXPECT_DOUBLE_EQ(PixelComparator(0).compare(before, banded_).score(), 0.0);
}

TEST_F(PixelComparatorTest, MapIsUnthresholdedLuminanceDifference) {
    const cv::Mat before = black_(cv::Rect(0, 0, 40, 40));
    const auto result = PixelComparator(10).compare(before, banded_);

    EXPECT_EQ(result.map().type(), CV_8UC1);
    EXPECT_EQ(result.map().at<uchar>(0, 0), 30);
    EXPECT_EQ(result.map().at<uchar>(5, 15), 90);
    EXPECT_EQ(result.map().at<uchar>(39, 39), 250);
}

TEST_F(PixelComparatorTest, ColorChangesAreLuminanceWeighted) {
    const cv::Mat before = test_images::solid(2, 2);
    const cv::Mat after = test_images::solid(2, 2, cv::Scalar(255, 0, 0)); // pure blue

    const auto result = PixelComparator(50).compare(before, after);
    // BT.601 weight of blue is 0.114
    EXPECT_NEAR(result.map().at<uchar>(0, 0), 29, 1);
}

TEST_F(PixelComparatorTest, ShapeMismatchIsRejected) {
    const cv::Mat small = test_images::solid(10, 10);
    const cv::Mat large = test_images::solid(20, 20);

    try {
        (void) PixelComparator(50).compare(small, large);
        FAIL() << "Expected ShapeMismatchError";
    } catch (const ShapeMismatchError &e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("10x10x3"));
        EXPECT_THAT(e.what(), ::testing::HasSubstr("20x20x3"));
    }
}

TEST_F(PixelComparatorTest, ChannelMismatchIsRejected) {
    const cv::Mat color = test_images::solid(10, 10);
    const cv::Mat gray(10, 10, CV_8UC1, cv::Scalar(0));

    EXPECT_THROW((void) PixelComparator(50).compare(color, gray), ShapeMismatchError);
}

TEST_F(PixelComparatorTest, EmptyInputIsAComputationError) {
    EXPECT_THROW((void) PixelComparator(50).compare(cv::Mat(), black_), ComputationError);
}

TEST_F(PixelComparatorTest, SensitivityOutsideRangeIsRejected) {
    EXPECT_THROW(PixelComparator(-1), std::invalid_argument);
    EXPECT_THROW(PixelComparator(101), std::invalid_argument);
}

TEST_F(PixelComparatorTest, ComparesEncodedImages) {
    const cv::Mat before = test_images::solid(4, 4);
    cv::Mat after = before.clone();
    after.at<cv::Vec3b>(0, 0) = cv::Vec3b(255, 255, 255);

    const auto result = PixelComparator(100).compare(test_images::png(before), test_images::png(after));
    EXPECT_DOUBLE_EQ(result.score(), 6.25);
}

TEST_F(PixelComparatorTest, UndecodableBytesAreADecodeError) {
    const Bytes garbage{1, 2, 3, 4};
    EXPECT_THROW((void) PixelComparator(50).compare(garbage, test_images::png(black_)), DecodeError);
}
