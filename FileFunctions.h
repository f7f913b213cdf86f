#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <fkYAML.hpp>

// Reads an asset descriptor. Parse errors from fkYAML propagate with the file name prepended.
fkyaml::node loadYaml(std::filesystem::path const& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot read asset descriptor " + filePath.string());
    }
    std::string contents{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

    try {
        return fkyaml::node::deserialize(contents);
    } catch (fkyaml::exception const& e) {
        throw std::runtime_error(filePath.string() + ": " + e.what());
    }
}

// Output directories are created on demand, an existing one is left as is
void ensureDirectory(std::filesystem::path const& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("cannot create output directory " + dir.string() + ": " + ec.message());
    }
    if (!std::filesystem::is_directory(dir)) {
        throw std::runtime_error(dir.string() + " exists and is not a directory");
    }
}
