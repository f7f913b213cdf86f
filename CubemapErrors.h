#pragma once

#include <stdexcept>
#include <string>

struct InvalidFaceIdentifier : std::invalid_argument {
    explicit InvalidFaceIdentifier(const std::string& faceName)
        : std::invalid_argument("unknown cube face: '" + faceName + "'") {}
};

struct InvalidDimensions : std::invalid_argument {
    explicit InvalidDimensions(const std::string& what) : std::invalid_argument(what) {}
};
