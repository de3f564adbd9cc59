#include "cbxconv/image_analyzer.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace cbxconv;

namespace {

ImageData solid(int width, int height, uint8_t r, uint8_t g, uint8_t b) {
    ImageData image;
    image.width = width;
    image.height = height;
    image.channels = 3;
    image.pixels.resize(static_cast<size_t>(width) * height * 3);
    for (size_t i = 0; i < image.pixels.size(); i += 3) {
        image.pixels[i] = r;
        image.pixels[i + 1] = g;
        image.pixels[i + 2] = b;
    }
    return image;
}

void paint(ImageData& image, size_t pixel, uint8_t r, uint8_t g, uint8_t b) {
    uint8_t* px = &image.pixels[pixel * image.channels];
    px[0] = r;
    px[1] = g;
    px[2] = b;
}

} // namespace

TEST(ImageAnalyzerTest, PureGreyIsNotConverted) {
    auto image = solid(100, 100, 128, 128, 128);
    auto stats = ImageAnalyzer::analyze_colorfulness(image);
    EXPECT_EQ(stats.max_diff, 0);
    EXPECT_DOUBLE_EQ(stats.colored_ratio, 0.0);
    EXPECT_FALSE(ImageAnalyzer::should_convert_to_greyscale(image));
}

TEST(ImageAnalyzerTest, FewColoredPixelsAreConverted) {
    // 50 von 10000 pixeln farbig = 0.5% < 1%
    auto image = solid(100, 100, 200, 200, 200);
    for (size_t i = 0; i < 50; ++i) {
        paint(image, i * 7, 255, 0, 0);
    }
    auto stats = ImageAnalyzer::analyze_colorfulness(image, 16);
    EXPECT_EQ(stats.max_diff, 255);
    EXPECT_NEAR(stats.colored_ratio, 0.005, 1e-9);
    EXPECT_TRUE(ImageAnalyzer::should_convert_to_greyscale(image, 16, 0.01));
}

TEST(ImageAnalyzerTest, ColorfulPageStaysColor) {
    auto image = solid(50, 50, 10, 120, 250);
    EXPECT_FALSE(ImageAnalyzer::should_convert_to_greyscale(image, 16, 0.01));
}

TEST(ImageAnalyzerTest, SmallDifferencesBelowPixelThresholdDoNotCount) {
    auto image = solid(10, 10, 100, 100, 100);
    paint(image, 0, 110, 100, 100);  // diff 10 <= 16
    auto stats = ImageAnalyzer::analyze_colorfulness(image, 16);
    EXPECT_EQ(stats.max_diff, 10);
    EXPECT_DOUBLE_EQ(stats.colored_ratio, 0.0);
}

TEST(ImageAnalyzerTest, ToGreyscaleDropsAlpha) {
    auto image = test::make_image(8, 4, 4);
    auto grey = ImageAnalyzer::to_greyscale(image);
    EXPECT_EQ(grey.channels, 1);
    EXPECT_EQ(grey.width, 8);
    EXPECT_EQ(grey.height, 4);
    EXPECT_EQ(grey.pixels.size(), 32u);
}

TEST(ImageAnalyzerTest, ToGreyscaleUsesLuma) {
    auto image = solid(1, 1, 255, 0, 0);
    auto grey = ImageAnalyzer::to_greyscale(image);
    // 255 * 0.299 = 76.2
    EXPECT_EQ(grey.pixels[0], 76);
}

TEST(ImageAnalyzerTest, ToTruecolorExpandsGrey) {
    ImageData grey;
    grey.width = 2;
    grey.height = 1;
    grey.channels = 1;
    grey.pixels = {10, 200};
    auto rgb = ImageAnalyzer::to_truecolor(grey);
    EXPECT_EQ(rgb.channels, 3);
    EXPECT_EQ(rgb.pixels, (std::vector<uint8_t>{10, 10, 10, 200, 200, 200}));
}

TEST(ImageAnalyzerTest, AutoContrastStretchesRange) {
    ImageData image;
    image.width = 3;
    image.height = 1;
    image.channels = 1;
    image.pixels = {50, 100, 150};
    ImageAnalyzer::auto_contrast(image);
    EXPECT_EQ(image.pixels[0], 0);
    EXPECT_EQ(image.pixels[1], 128);
    EXPECT_EQ(image.pixels[2], 255);
}

TEST(ImageAnalyzerTest, AutoContrastLeavesFlatImageAlone) {
    auto image = solid(4, 4, 90, 90, 90);
    auto before = image.pixels;
    ImageAnalyzer::auto_contrast(image);
    EXPECT_EQ(image.pixels, before);
}

TEST(ImageAnalyzerTest, MedianRemovesSaltNoise) {
    ImageData image;
    image.width = 3;
    image.height = 3;
    image.channels = 1;
    image.pixels = std::vector<uint8_t>(9, 20);
    image.pixels[4] = 255;
    ImageAnalyzer::median3x3(image);
    EXPECT_EQ(image.pixels[4], 20);
}

TEST(ImageAnalyzerTest, PreprocessingKeepsDimensions) {
    auto image = test::make_image(16, 12, 3);
    ImageAnalyzer::apply_preprocessing(image, Preprocessing::DENOISE);
    EXPECT_EQ(image.width, 16);
    EXPECT_EQ(image.height, 12);
    EXPECT_EQ(image.pixels.size(), 16u * 12u * 3u);

    auto before = image.pixels;
    ImageAnalyzer::apply_preprocessing(image, Preprocessing::NONE);
    EXPECT_EQ(image.pixels, before);
}
