// File: tests/processing/image/visualiser_test.cpp

#include <gtest/gtest.h>

#include "processing/image/visualisation/contour_visualiser.hpp"
#include "processing/image/visualisation/heatmap_visualiser.hpp"
#include "test_images.hpp"

using namespace processing::image;

class ImageVisualiserTest : public ::testing::Test {
protected:
    const cv::Mat base_ = test_images::gradient(32, 32);

    static types::ComparisonResult resultWithSquare(const cv::Size &size) {
        cv::Mat map(size, CV_8UC1, cv::Scalar(0));
        map(cv::Rect(8, 8, 10, 10)).setTo(cv::Scalar(200));
        return {12.5, map};
    }
};

TEST_F(ImageVisualiserTest, CreatesByTypeAndName) {
    EXPECT_NE(std::dynamic_pointer_cast<HeatmapVisualiser>(ImageVisualiser::create(types::VisualisationType::Heatmap)),
              nullptr);
    EXPECT_NE(std::dynamic_pointer_cast<ContourVisualiser>(ImageVisualiser::create("contour")), nullptr);
    EXPECT_EQ(ImageVisualiser::create("HEATMAP")->type(), types::VisualisationType::Heatmap);
}

TEST_F(ImageVisualiserTest, CreatePassesOptionsThrough) {
    VisualiserOptions options;
    options.heatmap.opacity = 0.8;
    options.contour.min_region_area = 7;

    const auto heatmap = std::dynamic_pointer_cast<HeatmapVisualiser>(ImageVisualiser::create("heatmap", options));
    const auto contour = std::dynamic_pointer_cast<ContourVisualiser>(ImageVisualiser::create("contour", options));
    ASSERT_NE(heatmap, nullptr);
    ASSERT_NE(contour, nullptr);
    EXPECT_DOUBLE_EQ(heatmap->options().opacity, 0.8);
    EXPECT_EQ(contour->options().min_region_area, 7);
}

TEST_F(ImageVisualiserTest, UnknownNameIsRejected) {
    EXPECT_THROW((void) ImageVisualiser::create("outline"), UnknownStrategyError);
}

TEST_F(ImageVisualiserTest, MapSizeMismatchIsARenderError) {
    const auto result = resultWithSquare(cv::Size(20, 20));
    for (const auto name: {"heatmap", "contour"}) {
        EXPECT_THROW((void) ImageVisualiser::create(name)->render(base_, result), RenderError) << name;
    }
}

TEST_F(ImageVisualiserTest, EmptyMapIsARenderError) {
    const types::ComparisonResult result(0.0, cv::Mat());
    EXPECT_THROW((void) ImageVisualiser::create("heatmap")->visualise(base_, result), RenderError);
}

TEST_F(ImageVisualiserTest, MultiChannelMapIsARenderError) {
    const types::ComparisonResult result(0.0, test_images::solid(32, 32));
    EXPECT_THROW((void) ImageVisualiser::create("contour")->render(base_, result), RenderError);
}

TEST_F(ImageVisualiserTest, GrayscaleBaseIsRenderedInColor) {
    const auto result = resultWithSquare(base_.size());
    const cv::Mat rendered = ImageVisualiser::create("heatmap")->render(codec::toGrayscale(base_), result);

    EXPECT_EQ(rendered.type(), CV_8UC3);
    EXPECT_EQ(rendered.size(), base_.size());
}

TEST_F(ImageVisualiserTest, VisualiseProducesDecodablePng) {
    const auto result = resultWithSquare(base_.size());
    for (const auto name: {"heatmap", "contour"}) {
        const Bytes encoded = ImageVisualiser::create(name)->visualise(test_images::png(base_), result);

        ASSERT_GE(encoded.size(), 8u) << name;
        EXPECT_EQ(encoded[0], 0x89) << name;
        EXPECT_EQ(encoded[1], 'P') << name;

        const cv::Mat decoded = codec::decode(encoded, ColorMode::Color);
        EXPECT_EQ(decoded.size(), base_.size()) << name;
    }
}

TEST_F(ImageVisualiserTest, UndecodableBaseIsADecodeError) {
    const auto result = resultWithSquare(base_.size());
    const Bytes garbage{0, 1, 2};
    EXPECT_THROW((void) ImageVisualiser::create("heatmap")->visualise(garbage, result), DecodeError);
}
