#pragma once

#include <algorithm>
#include <cmath>
#include <string>
#include "ImageBuffer.h"

enum class Interpolation {
    Nearest,
    Bilinear,
    // Reserved names, they have no filter of their own and sample as Nearest
    Cubic,
    Lanczos
};

Interpolation parseInterpolation(std::string const& name) {
    if (name == "linear") return Interpolation::Bilinear;
    if (name == "cubic") return Interpolation::Cubic;
    if (name == "lanczos") return Interpolation::Lanczos;
    return Interpolation::Nearest;
}

const char* interpolationName(Interpolation interpolation) {
    switch (interpolation) {
        case Interpolation::Bilinear: return "linear";
        case Interpolation::Cubic: return "cubic";
        case Interpolation::Lanczos: return "lanczos";
        case Interpolation::Nearest: break;
    }
    return "nearest";
}

int clampCoordinate(int value, int size) {
    return std::min(size - 1, std::max(value, 0));
}

void copyPixelNearest(ImageBuffer const& read, ImageBuffer& write, double xFrom, double yFrom, size_t to) {
    // nearbyint rounds halfway cases to even
    int x = clampCoordinate(static_cast<int>(std::nearbyint(xFrom)), read.width);
    int y = clampCoordinate(static_cast<int>(std::nearbyint(yFrom)), read.height);
    const uint8_t* nearest = read.data.data() + read.pixelOffset(x, y);

    for (int channel = 0; channel < 3; channel++) {
        write.data[to + channel] = nearest[channel];
    }
}

// The blended value is rounded up, not to nearest. Weights are taken after clamping,
// so at the image border both taps land on the same texel.
void copyPixelBilinear(ImageBuffer const& read, ImageBuffer& write, double xFrom, double yFrom, size_t to) {
    int xl = clampCoordinate(static_cast<int>(std::floor(xFrom)), read.width);
    int xr = clampCoordinate(static_cast<int>(std::ceil(xFrom)), read.width);
    double xf = xFrom - xl;

    int yl = clampCoordinate(static_cast<int>(std::floor(yFrom)), read.height);
    int yr = clampCoordinate(static_cast<int>(std::ceil(yFrom)), read.height);
    double yf = yFrom - yl;

    const uint8_t* p00 = read.data.data() + read.pixelOffset(xl, yl);
    const uint8_t* p10 = read.data.data() + read.pixelOffset(xr, yl);
    const uint8_t* p01 = read.data.data() + read.pixelOffset(xl, yr);
    const uint8_t* p11 = read.data.data() + read.pixelOffset(xr, yr);

    for (int channel = 0; channel < 3; channel++) {
        double p0 = p00[channel] * (1 - xf) + p10[channel] * xf;
        double p1 = p01[channel] * (1 - xf) + p11[channel] * xf;
        double value = std::ceil(p0 * (1 - yf) + p1 * yf);
        write.data[to + channel] = static_cast<uint8_t>(std::clamp(value, 0.0, 255.0));
    }
}

void copyPixel(ImageBuffer const& read, ImageBuffer& write, double xFrom, double yFrom, size_t to, Interpolation interpolation) {
    switch (interpolation) {
        case Interpolation::Bilinear:
            copyPixelBilinear(read, write, xFrom, yFrom, to);
            return;
        case Interpolation::Nearest:
        case Interpolation::Cubic:
        case Interpolation::Lanczos:
            break;
    }
    copyPixelNearest(read, write, xFrom, yFrom, to);
}
