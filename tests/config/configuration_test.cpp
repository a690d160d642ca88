// File: tests/config/configuration_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>

#include "config/configuration.hpp"
#include "processing/image/errors.hpp"
#include "processing/image/visualisation/options.hpp"

namespace {
    class ConfigurationTest : public ::testing::Test {
    protected:
        std::filesystem::path path_;

        void SetUp() override {
            path_ = std::filesystem::temp_directory_path() /
                    ("imgdiff_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                     ".yaml");
        }

        void TearDown() override { std::filesystem::remove(path_); }

        void write(const std::string &content) const {
            std::ofstream file(path_);
            file << content;
        }
    };
} // namespace

TEST_F(ConfigurationTest, FlattensNestedKeys) {
    write("comparison:\n  type: structural\n  sensitivity: 70\nvisualisation:\n  heatmap:\n    opacity: 0.25\n");
    const config::Configuration configuration(path_.string());

    EXPECT_EQ(configuration.get<std::string>("comparison.type"), "structural");
    EXPECT_EQ(configuration.get("comparison.sensitivity", 0), 70);
    EXPECT_DOUBLE_EQ(configuration.get("visualisation.heatmap.opacity", 1.0), 0.25);
    EXPECT_TRUE(configuration.contains("comparison.type"));
    EXPECT_FALSE(configuration.contains("comparison"));
}

TEST_F(ConfigurationTest, FallsBackToDefaults) {
    write("comparison:\n  type: pixel\n");
    const config::Configuration configuration(path_.string());

    EXPECT_EQ(configuration.get("comparison.sensitivity", 42), 42);
    EXPECT_EQ(configuration.get("visualisation.type", "heatmap"), "heatmap");
    EXPECT_FALSE(configuration.get<int>("missing.key").has_value());
}

TEST_F(ConfigurationTest, WrongTypeYieldsNothing) {
    write("comparison:\n  sensitivity: high\n");
    const config::Configuration configuration(path_.string());

    EXPECT_FALSE(configuration.get<int>("comparison.sensitivity").has_value());
    EXPECT_EQ(configuration.get("comparison.sensitivity", 50), 50);
}

TEST_F(ConfigurationTest, MissingFileThrows) {
    EXPECT_THROW(config::Configuration("/nonexistent/imgdiff/configuration.yaml"), std::runtime_error);
}

TEST_F(ConfigurationTest, MalformedFileThrows) {
    write("comparison: [unterminated\n");
    EXPECT_THROW(config::Configuration(path_.string()), std::runtime_error);
}

TEST_F(ConfigurationTest, SetNotifiesCallbacks) {
    config::Configuration configuration(YAML::Load("comparison:\n  sensitivity: 10\n"));

    std::vector<std::string> changed;
    configuration.registerChangeCallback(
            [&changed](const std::string &key, const YAML::Node &) { changed.push_back(key); });

    EXPECT_TRUE(configuration.set("comparison.sensitivity", 90));
    EXPECT_EQ(configuration.get("comparison.sensitivity", 0), 90);
    EXPECT_THAT(changed, ::testing::ElementsAre("comparison.sensitivity"));
}

TEST_F(ConfigurationTest, ReloadPicksUpFileChanges) {
    write("comparison:\n  sensitivity: 10\n");
    config::Configuration configuration(path_.string());
    ASSERT_EQ(configuration.get("comparison.sensitivity", 0), 10);

    write("comparison:\n  sensitivity: 60\n");
    configuration.reload();
    EXPECT_EQ(configuration.get("comparison.sensitivity", 0), 60);
}

TEST_F(ConfigurationTest, BuildsVisualiserOptions) {
    write("visualisation:\n"
          "  heatmap:\n    colormap: Turbo\n    opacity: 0.7\n"
          "  contour:\n    min_area: 5\n    color: [255, 0, 0]\n    thickness: 3\n    opacity: 0.4\n");
    const config::Configuration configuration(path_.string());

    const auto options = processing::image::VisualiserOptions::fromConfiguration(configuration);
    EXPECT_EQ(options.heatmap.colormap, cv::COLORMAP_TURBO);
    EXPECT_DOUBLE_EQ(options.heatmap.opacity, 0.7);
    EXPECT_EQ(options.contour.min_region_area, 5);
    EXPECT_EQ(options.contour.highlight_color, cv::Scalar(255, 0, 0));
    EXPECT_EQ(options.contour.box_thickness, 3);
    EXPECT_DOUBLE_EQ(options.contour.fill_opacity, 0.4);
}

TEST_F(ConfigurationTest, EmptyConfigurationKeepsOptionDefaults) {
    const config::Configuration configuration(YAML::Node(YAML::NodeType::Map));
    const auto options = processing::image::VisualiserOptions::fromConfiguration(configuration);

    EXPECT_EQ(options.heatmap.colormap, cv::COLORMAP_JET);
    EXPECT_DOUBLE_EQ(options.heatmap.opacity, 0.5);
    EXPECT_EQ(options.contour.min_region_area, 40);
    EXPECT_EQ(options.contour.box_thickness, 2);
}

TEST_F(ConfigurationTest, RejectsUnknownColormap) {
    write("visualisation:\n  heatmap:\n    colormap: sepia\n");
    const config::Configuration configuration(path_.string());

    EXPECT_THROW((void) processing::image::VisualiserOptions::fromConfiguration(configuration),
                 processing::image::UnknownStrategyError);
}

TEST(ProcessConfigurationTest, FreeLookupsFallBackToDefaults) {
    EXPECT_EQ(config::get("imgdiff.unset.sensitivity", 7), 7);
    EXPECT_EQ(config::get("imgdiff.unset.type", "pixel"), "pixel");
}
