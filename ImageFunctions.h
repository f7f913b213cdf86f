#pragma once

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <stb_image.h>
#include <stb_image_write.h>
#include "ImageBuffer.h"
#include "ImageFileFormat.h"

// Decodes any format stb_image understands, always expanded to RGBA8
ImageBuffer loadImage(std::string const& filename) {
    int texWidth, texHeight, texChannels;
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> pixels(
        stbi_load(filename.c_str(), &texWidth, &texHeight, &texChannels, STBI_rgb_alpha),
        stbi_image_free
    );

    if (!pixels) {
        std::cerr << "Failed to load image [" << filename << "]: " << stbi_failure_reason() << std::endl;
        throw std::runtime_error(std::string("failed to load image! ") + filename);
    }

    size_t dataSize = static_cast<size_t>(texWidth) * texHeight * 4;
    return imageBufferFromPixels(texWidth, texHeight, pixels.get(), dataSize);
}

void saveImage(ImageBuffer const& image, std::filesystem::path const& filename, ImageFileFormat format, int jpgQuality = 90) {
    validateImageBuffer(image);
    const std::string name = filename.string();
    const int stride = image.width * 4;
    int ok = 0;

    switch (format) {
        case ImageFileFormat::Png:
            ok = stbi_write_png(name.c_str(), image.width, image.height, 4, image.data.data(), stride);
            break;
        case ImageFileFormat::Jpg:
            ok = stbi_write_jpg(name.c_str(), image.width, image.height, 4, image.data.data(), std::clamp(jpgQuality, 1, 100));
            break;
        case ImageFileFormat::Bmp:
            ok = stbi_write_bmp(name.c_str(), image.width, image.height, 4, image.data.data());
            break;
        case ImageFileFormat::Tga:
            ok = stbi_write_tga(name.c_str(), image.width, image.height, 4, image.data.data());
            break;
        case ImageFileFormat::Ktx2:
            throw std::runtime_error("single faces cannot be written as ktx2: " + name);
    }

    if (!ok) {
        throw std::runtime_error("failed to write image! " + name);
    }
}
