#pragma once

#include <algorithm>
#include <climits>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <fkYAML.hpp>
#include <glm/glm.hpp>
#include "CubeFace.h"
#include "CubemapFunctions.h"
#include "ImageFileFormat.h"
#include "PixelSampler.h"

struct ConversionSettings {
    std::vector<CubemapFace> faces{allCubemapFaces.begin(), allCubemapFaces.end()};
    double rotation = 0; // radians
    Interpolation interpolation = Interpolation::Bilinear;
    int maxWidth = UNBOUNDED_WIDTH;
    ImageFileFormat format = ImageFileFormat::Png;
    int jpgQuality = 90;
};

std::vector<CubemapFace> parseCubemapFaces(std::vector<std::string> const& names) {
    std::vector<CubemapFace> faces;
    faces.reserve(names.size());
    for (auto const& name : names) {
        CubemapFace face = parseCubemapFace(name);
        if (std::find(faces.begin(), faces.end(), face) == faces.end()) {
            faces.push_back(face);
        }
    }
    return faces;
}

bool hasAllCubemapFaces(std::vector<CubemapFace> const& faces) {
    for (CubemapFace face : allCubemapFaces) {
        if (std::find(faces.begin(), faces.end(), face) == faces.end()) return false;
    }
    return true;
}

void validateConversionSettings(ConversionSettings const& settings) {
    if (settings.faces.empty()) {
        throw std::invalid_argument("no cube faces requested");
    }
    if (settings.maxWidth < 1) {
        throw std::invalid_argument("maxWidth must be positive, got " + std::to_string(settings.maxWidth));
    }
    if (settings.jpgQuality < 1 || settings.jpgQuality > 100) {
        throw std::invalid_argument("jpgQuality must be in 1..100, got " + std::to_string(settings.jpgQuality));
    }
    if (settings.format == ImageFileFormat::Ktx2 && !hasAllCubemapFaces(settings.faces)) {
        throw std::invalid_argument("ktx2 output needs all six cube faces");
    }
}

// YAML has no single number type, integers and floats are both accepted
double yamlNumber(fkyaml::node const& node) {
    if (node.is_integer()) return static_cast<double>(node.as_int());
    return node.as_float();
}

// Range is checked on the 64-bit value, before narrowing
int yamlIntInRange(fkyaml::node const& node, const char* key, int64_t min, int64_t max) {
    int64_t value = node.as_int();
    if (value < min || value > max) {
        throw std::invalid_argument(
            std::string(key) + " must be in " + std::to_string(min) + ".." + std::to_string(max)
            + ", got " + std::to_string(value));
    }
    return static_cast<int>(value);
}

ConversionSettings parseConversionSettings(fkyaml::node const& yaml) {
    ConversionSettings settings;

    if (yaml.contains("rotation")) {
        settings.rotation = glm::radians(yamlNumber(yaml["rotation"]));
    }
    if (yaml.contains("interpolation")) {
        settings.interpolation = parseInterpolation(yaml["interpolation"].as_str());
    }
    if (yaml.contains("maxWidth")) {
        fkyaml::node const& maxWidth = yaml["maxWidth"];
        if (maxWidth.is_string() && maxWidth.as_str() == "unbounded") {
            settings.maxWidth = UNBOUNDED_WIDTH;
        } else {
            settings.maxWidth = yamlIntInRange(maxWidth, "maxWidth", 1, INT_MAX);
        }
    }
    if (yaml.contains("faces")) {
        std::vector<std::string> names;
        for (auto const& face : yaml["faces"].as_seq()) {
            names.push_back(face.as_str());
        }
        settings.faces = parseCubemapFaces(names);
    }
    if (yaml.contains("format")) {
        settings.format = parseImageFileFormat(yaml["format"].as_str());
    }
    if (yaml.contains("jpgQuality")) {
        settings.jpgQuality = yamlIntInRange(yaml["jpgQuality"], "jpgQuality", 1, 100);
    }

    validateConversionSettings(settings);
    return settings;
}
