#include <gtest/gtest.h>
#include "PixelSampler.h"

namespace {

void setPixel(ImageBuffer& image, int x, int y, uint8_t r, uint8_t g, uint8_t b) {
    size_t offset = image.pixelOffset(x, y);
    image.data[offset + 0] = r;
    image.data[offset + 1] = g;
    image.data[offset + 2] = b;
    image.data[offset + 3] = 255;
}

// Every pixel gets a distinct color
ImageBuffer makeGradient(int width, int height) {
    ImageBuffer image = createImageBuffer(width, height);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            setPixel(image, x, y, static_cast<uint8_t>(10 * x), static_cast<uint8_t>(20 * y), static_cast<uint8_t>(x + y));
        }
    }
    return image;
}

void expectRgb(ImageBuffer const& image, size_t offset, ImageBuffer const& source, int x, int y) {
    size_t from = source.pixelOffset(x, y);
    EXPECT_EQ(image.data[offset + 0], source.data[from + 0]);
    EXPECT_EQ(image.data[offset + 1], source.data[from + 1]);
    EXPECT_EQ(image.data[offset + 2], source.data[from + 2]);
}

}

TEST(PixelSampler, ParseInterpolation) {
    EXPECT_EQ(parseInterpolation("linear"), Interpolation::Bilinear);
    EXPECT_EQ(parseInterpolation("cubic"), Interpolation::Cubic);
    EXPECT_EQ(parseInterpolation("lanczos"), Interpolation::Lanczos);
    EXPECT_EQ(parseInterpolation("nearest"), Interpolation::Nearest);
    EXPECT_EQ(parseInterpolation("bilinear"), Interpolation::Nearest);
    EXPECT_EQ(parseInterpolation(""), Interpolation::Nearest);
}

TEST(PixelSampler, InterpolationNamesRoundTrip) {
    for (Interpolation mode : {Interpolation::Nearest, Interpolation::Bilinear, Interpolation::Cubic, Interpolation::Lanczos}) {
        EXPECT_EQ(parseInterpolation(interpolationName(mode)), mode);
    }
    EXPECT_STREQ(interpolationName(Interpolation::Bilinear), "linear");
    EXPECT_STREQ(interpolationName(Interpolation::Nearest), "nearest");
}

TEST(PixelSampler, NearestAtIntegerCoordinateCopiesSourcePixel) {
    ImageBuffer source = makeGradient(8, 4);
    ImageBuffer dest = createImageBuffer(1, 1);
    for (int y = 0; y < source.height; y++) {
        for (int x = 0; x < source.width; x++) {
            copyPixelNearest(source, dest, x, y, 0);
            expectRgb(dest, 0, source, x, y);
        }
    }
}

TEST(PixelSampler, NearestDoesNotWriteAlpha) {
    ImageBuffer source = makeGradient(4, 2);
    ImageBuffer dest = createImageBuffer(2, 1);
    copyPixelNearest(source, dest, 1, 1, 4);
    EXPECT_EQ(dest.data[7], 0);
    // neighbouring pixel untouched
    EXPECT_EQ(dest.data[0], 0);
    EXPECT_EQ(dest.data[1], 0);
    EXPECT_EQ(dest.data[2], 0);
}

TEST(PixelSampler, NearestRoundsAndClamps) {
    ImageBuffer source = makeGradient(8, 4);
    ImageBuffer dest = createImageBuffer(1, 1);

    copyPixelNearest(source, dest, 2.4, 1.6, 0);
    expectRgb(dest, 0, source, 2, 2);

    copyPixelNearest(source, dest, -3.0, -0.5, 0);
    expectRgb(dest, 0, source, 0, 0);

    copyPixelNearest(source, dest, 100.0, 7.5, 0);
    expectRgb(dest, 0, source, 7, 3);
}

TEST(PixelSampler, NearestHalfwayRoundsToEven) {
    ImageBuffer source = makeGradient(8, 4);
    ImageBuffer dest = createImageBuffer(1, 1);

    copyPixelNearest(source, dest, 0.5, 0, 0);
    expectRgb(dest, 0, source, 0, 0);
    copyPixelNearest(source, dest, 1.5, 0, 0);
    expectRgb(dest, 0, source, 2, 0);
    copyPixelNearest(source, dest, 2.5, 0, 0);
    expectRgb(dest, 0, source, 2, 0);
}

TEST(PixelSampler, BilinearAtIntegerCoordinateCopiesSourcePixel) {
    ImageBuffer source = makeGradient(8, 4);
    ImageBuffer dest = createImageBuffer(1, 1);
    for (int y = 0; y < source.height; y++) {
        for (int x = 0; x < source.width; x++) {
            copyPixelBilinear(source, dest, x, y, 0);
            expectRgb(dest, 0, source, x, y);
        }
    }
}

TEST(PixelSampler, BilinearAtLeftBorderIsUnweightedOnX) {
    ImageBuffer source = makeGradient(8, 4);
    ImageBuffer dest = createImageBuffer(1, 1);

    copyPixelBilinear(source, dest, -0.5, 2.0, 0);
    expectRgb(dest, 0, source, 0, 2);

    copyPixelBilinear(source, dest, -0.5, -0.5, 0);
    expectRgb(dest, 0, source, 0, 0);
}

TEST(PixelSampler, BilinearAtRightAndBottomBorder) {
    ImageBuffer source = makeGradient(8, 4);
    ImageBuffer dest = createImageBuffer(1, 1);

    copyPixelBilinear(source, dest, 7.5, 3.5, 0);
    expectRgb(dest, 0, source, 7, 3);
}

TEST(PixelSampler, BilinearRoundsUp) {
    ImageBuffer source = createImageBuffer(2, 2);
    setPixel(source, 0, 0, 10, 0, 200);
    setPixel(source, 1, 0, 11, 4, 100);
    setPixel(source, 0, 1, 10, 0, 200);
    setPixel(source, 1, 1, 11, 4, 100);
    ImageBuffer dest = createImageBuffer(1, 1);

    // 10 * 0.75 + 11 * 0.25 = 10.25, round to nearest would give 10
    copyPixelBilinear(source, dest, 0.25, 0.0, 0);
    EXPECT_EQ(dest.data[0], 11);
    EXPECT_EQ(dest.data[1], 1);
    EXPECT_EQ(dest.data[2], 175);

    copyPixelBilinear(source, dest, 0.5, 0.5, 0);
    EXPECT_EQ(dest.data[0], 11);
    EXPECT_EQ(dest.data[1], 2);
    EXPECT_EQ(dest.data[2], 150);
}

TEST(PixelSampler, BilinearBlendsBothAxes) {
    ImageBuffer source = createImageBuffer(2, 2);
    setPixel(source, 0, 0, 0, 0, 0);
    setPixel(source, 1, 0, 100, 0, 0);
    setPixel(source, 0, 1, 0, 200, 0);
    setPixel(source, 1, 1, 100, 200, 40);
    ImageBuffer dest = createImageBuffer(1, 1);

    copyPixelBilinear(source, dest, 0.5, 0.5, 0);
    EXPECT_EQ(dest.data[0], 50);
    EXPECT_EQ(dest.data[1], 100);
    EXPECT_EQ(dest.data[2], 10);
}

TEST(PixelSampler, BilinearStaysInRangeForWhite) {
    ImageBuffer source = createImageBuffer(3, 3);
    for (int y = 0; y < 3; y++) {
        for (int x = 0; x < 3; x++) {
            setPixel(source, x, y, 255, 255, 255);
        }
    }
    ImageBuffer dest = createImageBuffer(1, 1);
    for (double f : {0.1, 0.3, 0.7, 1.9}) {
        copyPixelBilinear(source, dest, f, 1.0 - f / 3, 0);
        EXPECT_EQ(dest.data[0], 255) << f;
        EXPECT_EQ(dest.data[1], 255) << f;
        EXPECT_EQ(dest.data[2], 255) << f;
    }
}

TEST(PixelSampler, ReservedAndUnknownModesSampleNearest) {
    ImageBuffer source = makeGradient(8, 4);
    ImageBuffer expected = createImageBuffer(1, 1);
    ImageBuffer actual = createImageBuffer(1, 1);
    copyPixelNearest(source, expected, 3.3, 1.7, 0);

    for (Interpolation mode : {Interpolation::Nearest, Interpolation::Cubic, Interpolation::Lanczos,
                               static_cast<Interpolation>(42)}) {
        actual.data.assign(4, 0);
        copyPixel(source, actual, 3.3, 1.7, 0, mode);
        EXPECT_EQ(actual.data, expected.data);
    }
}

TEST(PixelSampler, CopyPixelDispatchesBilinear) {
    ImageBuffer source = makeGradient(8, 4);
    ImageBuffer expected = createImageBuffer(1, 1);
    ImageBuffer actual = createImageBuffer(1, 1);
    copyPixelBilinear(source, expected, 3.3, 1.7, 0);
    copyPixel(source, actual, 3.3, 1.7, 0, Interpolation::Bilinear);
    EXPECT_EQ(actual.data, expected.data);
}
