#pragma once

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

enum class ImageFileFormat {
    Png,
    Jpg,
    Bmp,
    Tga,
    Ktx2
};

ImageFileFormat parseImageFileFormat(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
    if (!name.empty() && name[0] == '.') name.erase(0, 1);

    if (name == "png") return ImageFileFormat::Png;
    if (name == "jpg" || name == "jpeg") return ImageFileFormat::Jpg;
    if (name == "bmp") return ImageFileFormat::Bmp;
    if (name == "tga") return ImageFileFormat::Tga;
    if (name == "ktx2") return ImageFileFormat::Ktx2;
    throw std::runtime_error("unsupported output format: " + name);
}

const char* imageFileExtension(ImageFileFormat format) {
    switch (format) {
        case ImageFileFormat::Png: return "png";
        case ImageFileFormat::Jpg: return "jpg";
        case ImageFileFormat::Bmp: return "bmp";
        case ImageFileFormat::Tga: return "tga";
        case ImageFileFormat::Ktx2: return "ktx2";
    }
    return "png";
}
