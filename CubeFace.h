#pragma once

#include <array>
#include <string>
#include <glm/glm.hpp>
#include "CubemapErrors.h"

// Values are the cubemap layer order
enum CubemapFace {
    POSITIVE_X = 0,
    NEGATIVE_X = 1,
    POSITIVE_Y = 2,
    NEGATIVE_Y = 3,
    POSITIVE_Z = 4,
    NEGATIVE_Z = 5
};

constexpr int CUBEMAP_FACE_COUNT = 6;

const std::array<CubemapFace, CUBEMAP_FACE_COUNT> allCubemapFaces = {
    POSITIVE_X, NEGATIVE_X, POSITIVE_Y, NEGATIVE_Y, POSITIVE_Z, NEGATIVE_Z
};

const char* cubemapFaceName(CubemapFace face) {
    switch (face) {
        case POSITIVE_X: return "px";
        case NEGATIVE_X: return "nx";
        case POSITIVE_Y: return "py";
        case NEGATIVE_Y: return "ny";
        case POSITIVE_Z: return "pz";
        case NEGATIVE_Z: return "nz";
    }
    throw InvalidFaceIdentifier(std::to_string(static_cast<int>(face)));
}

CubemapFace parseCubemapFace(std::string const& name) {
    for (CubemapFace face : allCubemapFaces) {
        if (name == cubemapFaceName(face)) return face;
    }
    throw InvalidFaceIdentifier(name);
}

// Point on the face of a cube of side 2 centered at the origin.
// x and y are face-local coordinates in [-1, 1], (-1, -1) is the top-left corner of the face image.
glm::dvec3 cubeFacePoint(CubemapFace face, double x, double y) {
    switch (face) {
        case POSITIVE_Z: return {-1.0, -x, -y};
        case NEGATIVE_Z: return {1.0, x, -y};
        case POSITIVE_X: return {x, -1.0, -y};
        case NEGATIVE_X: return {-x, 1.0, -y};
        case POSITIVE_Y: return {-y, -x, 1.0};
        case NEGATIVE_Y: return {y, -x, -1.0};
    }
    throw InvalidFaceIdentifier(std::to_string(static_cast<int>(face)));
}

// Face-local coordinate of the center of pixel i on a face that is faceSize pixels wide
double faceLocalCoordinate(int i, int faceSize) {
    return 2.0 * (i + 0.5) / faceSize - 1.0;
}
