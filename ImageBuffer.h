#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include "CubemapErrors.h"

// 8-bit RGBA, row-major, stride = width * 4
struct ImageBuffer {
    std::vector<uint8_t> data;
    int width = 0;
    int height = 0;

    size_t pixelOffset(int x, int y) const {
        return 4 * (static_cast<size_t>(y) * width + x);
    }
};

void validateImageBuffer(ImageBuffer const& image) {
    if (image.width <= 0 || image.height <= 0) {
        throw InvalidDimensions(
            "image has invalid size " + std::to_string(image.width) + "x" + std::to_string(image.height));
    }
    size_t expected = static_cast<size_t>(image.width) * image.height * 4;
    if (image.data.size() != expected) {
        throw InvalidDimensions(
            "image store holds " + std::to_string(image.data.size()) + " bytes, expected " + std::to_string(expected));
    }
}

ImageBuffer createImageBuffer(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw InvalidDimensions(
            "cannot allocate image of size " + std::to_string(width) + "x" + std::to_string(height));
    }
    ImageBuffer result;
    result.width = width;
    result.height = height;
    result.data.assign(static_cast<size_t>(width) * height * 4, 0);
    return result;
}

// Copies an externally decoded RGBA8 pixel block into a new buffer
ImageBuffer imageBufferFromPixels(int width, int height, const uint8_t* pixels, size_t pixelsSize) {
    ImageBuffer result = createImageBuffer(width, height);
    if (pixels == nullptr || pixelsSize != result.data.size()) {
        throw InvalidDimensions(
            "pixel block of " + std::to_string(pixelsSize) + " bytes does not match "
            + std::to_string(width) + "x" + std::to_string(height) + " RGBA");
    }
    std::memcpy(result.data.data(), pixels, pixelsSize);
    return result;
}
