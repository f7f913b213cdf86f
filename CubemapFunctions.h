#pragma once

#include <algorithm>
#include <array>
#include <climits>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <glm/glm.hpp>
#include "CubeFace.h"
#include "ImageBuffer.h"
#include "PixelSampler.h"
#include "SphericalProjection.h"

constexpr int UNBOUNDED_WIDTH = INT_MAX;

struct Cubemap {
    // indexed by CubemapFace
    std::array<ImageBuffer, CUBEMAP_FACE_COUNT> faces;
    int faceSize = 0;

    ImageBuffer const& face(CubemapFace f) const { return faces[f]; }
};

// A cube face spans a quarter of the panorama's horizontal sweep
int cubemapFaceSize(ImageBuffer const& source, int maxWidth) {
    if (maxWidth < 1) {
        throw std::invalid_argument("maximum face width must be positive, got " + std::to_string(maxWidth));
    }
    int faceSize = std::min(maxWidth, source.width / 4);
    if (faceSize < 1) {
        throw InvalidDimensions(
            "panorama of width " + std::to_string(source.width) + " is too narrow for a cube face");
    }
    return faceSize;
}

ImageBuffer renderFaceUnchecked(
    ImageBuffer const& source,
    CubemapFace face,
    double rotation,
    Interpolation interpolation,
    int faceSize
) {
    ImageBuffer result = createImageBuffer(faceSize, faceSize);

    for (int y = 0; y < faceSize; y++) {
        for (int x = 0; x < faceSize; x++) {
            size_t to = result.pixelOffset(x, y);
            result.data[to + 3] = 255;

            glm::dvec3 cube = cubeFacePoint(face, faceLocalCoordinate(x, faceSize), faceLocalCoordinate(y, faceSize));
            SphericalCoordinates spherical = cubeToSpherical(cube, rotation);
            glm::dvec2 from = sphericalToEquirectangularPixel(spherical, source.width, source.height);

            copyPixel(source, result, from.x, from.y, to, interpolation);
        }
    }

    return result;
}

// Renders one face of the cube around an equirectangular panorama.
// rotation is in radians and turns the cube around the vertical axis.
ImageBuffer renderFace(
    ImageBuffer const& source,
    CubemapFace face,
    double rotation,
    Interpolation interpolation,
    int maxWidth = UNBOUNDED_WIDTH
) {
    validateImageBuffer(source);
    // rejects casted values outside the enum before any allocation
    cubemapFaceName(face);
    return renderFaceUnchecked(source, face, rotation, interpolation, cubemapFaceSize(source, maxWidth));
}

ImageBuffer renderFace(
    ImageBuffer const& source,
    std::string const& faceName,
    double rotation,
    std::string const& interpolation,
    int maxWidth = UNBOUNDED_WIDTH
) {
    CubemapFace face = parseCubemapFace(faceName);
    return renderFace(source, face, rotation, parseInterpolation(interpolation), maxWidth);
}

// Faces share nothing but the read-only source, each one is rendered on its own task.
// Results are returned in the order of the requested faces.
std::vector<ImageBuffer> renderFaces(
    ImageBuffer const& source,
    std::vector<CubemapFace> const& faces,
    double rotation,
    Interpolation interpolation,
    int maxWidth = UNBOUNDED_WIDTH
) {
    validateImageBuffer(source);
    for (CubemapFace face : faces) {
        cubemapFaceName(face);
    }
    int faceSize = cubemapFaceSize(source, maxWidth);

    std::vector<std::future<ImageBuffer>> tasks;
    tasks.reserve(faces.size());
    for (CubemapFace face : faces) {
        tasks.push_back(std::async(std::launch::async, [&source, face, rotation, interpolation, faceSize]() {
            return renderFaceUnchecked(source, face, rotation, interpolation, faceSize);
        }));
    }

    std::vector<ImageBuffer> result;
    result.reserve(faces.size());
    for (auto& task : tasks) {
        result.push_back(task.get());
    }
    return result;
}

Cubemap renderCubemap(
    ImageBuffer const& source,
    double rotation,
    Interpolation interpolation,
    int maxWidth = UNBOUNDED_WIDTH
) {
    std::vector<CubemapFace> faces(allCubemapFaces.begin(), allCubemapFaces.end());
    std::vector<ImageBuffer> rendered = renderFaces(source, faces, rotation, interpolation, maxWidth);

    Cubemap result;
    result.faceSize = rendered[0].width;
    for (size_t i = 0; i < faces.size(); i++) {
        result.faces[faces[i]] = std::move(rendered[i]);
    }
    return result;
}
