#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <fkYAML.hpp>
#include "FileFunctions.h"
#include "PanoramaConversion.h"

const std::string assetSuffix = ".asset.yaml";

int processCubemap(const std::filesystem::path& assetPath, fkyaml::node const& yaml, const std::string& outDir) {
    ConversionSettings settings = parseConversionSettings(yaml);
    // sky.png.asset.yaml describes sky.png
    const std::filesystem::path inputFileName = assetPath.string().substr(0, assetPath.string().size() - assetSuffix.size());
    return convertPanorama(inputFileName, outDir, settings);
}

int processAsset(const std::filesystem::path& assetPath, const std::string& outDir) {
    auto assetYaml = loadYaml(assetPath);
    std::string assetType = assetYaml["type"].as_str();

    if (assetType == "cubemap") return processCubemap(assetPath, assetYaml, outDir);

    std::cout << "Unknown asset type: " << assetType << std::endl;
    return -1;
}

int main(int argc, char** argv) {
    std::string assetsDir = argc > 1 ? argv[1] : "assets";
    std::string outDir = argc > 2 ? argv[2] : "build";
    int failureCount = 0;

    if (!std::filesystem::is_directory(assetsDir)) {
        std::cerr << "Assets directory not found: " << assetsDir << std::endl;
        return 1;
    }

    for (auto const& dirEntry : std::filesystem::recursive_directory_iterator(assetsDir)) {
        std::filesystem::path filePath = dirEntry.path();
        if (filePath.string().ends_with(assetSuffix)) {
            std::cout << filePath.string() << std::endl;
            int result = -1;
            try {
                result = processAsset(filePath, outDir);
            } catch (std::exception const& e) {
                std::cerr << e.what() << std::endl;
            }
            if (result != 0) {
                failureCount++;
                std::cout << " FAILED" << std::endl;
            }
        }
    }
    if (failureCount) {
        std::cerr << "Failures: " << failureCount << std::endl;
    } else {
        std::cout << "No failures" << std::endl;
    }
    return failureCount == 0 ? 0 : 1;
}
