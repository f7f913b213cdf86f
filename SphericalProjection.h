#pragma once

#include <cmath>
#include <glm/glm.hpp>

struct SphericalCoordinates {
    double longitude; // [0, 2pi)
    double latitude;  // [0, pi], 0 is the zenith
};

// Wraps any angle into [0, 2pi). fmod keeps the sign of the dividend, hence the second pass.
double normalizeAngle(double angle) {
    const double fullTurn = 2.0 * M_PI;
    double result = std::fmod(std::fmod(angle, fullTurn) + fullTurn, fullTurn);
    // tiny negative inputs round up to exactly 2pi after the addition
    return result >= fullTurn ? 0.0 : result;
}

SphericalCoordinates cubeToSpherical(glm::dvec3 const& cube, double rotation) {
    double radius = std::sqrt(cube.x * cube.x + cube.y * cube.y + cube.z * cube.z);
    return {
        normalizeAngle(std::atan2(cube.y, cube.x) + rotation),
        std::acos(cube.z / radius),
    };
}

// Continuous pixel coordinate in an equirectangular image, integers are pixel centers
glm::dvec2 sphericalToEquirectangularPixel(SphericalCoordinates const& spherical, int width, int height) {
    return {
        width * spherical.longitude / (2.0 * M_PI) - 0.5,
        height * spherical.latitude / M_PI - 0.5,
    };
}
