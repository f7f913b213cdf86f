#pragma once

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "ConversionConfig.h"
#include "CubemapExport.h"
#include "CubemapFunctions.h"
#include "FileFunctions.h"
#include "ImageFunctions.h"

// Loads a panorama, renders the requested faces and writes them to outDir.
// Returns 0 on success, like the other asset processors.
int convertPanorama(
    std::filesystem::path const& inputFileName,
    std::filesystem::path const& outDir,
    ConversionSettings const& settings,
    bool quiet = false
) {
    validateConversionSettings(settings);
    ImageBuffer panorama = loadImage(inputFileName.string());
    if (panorama.width != 2 * panorama.height) {
        std::cerr << "Warning: " << inputFileName.string() << " is " << panorama.width << "x" << panorama.height
                  << ", equirectangular panoramas are expected to be 2:1" << std::endl;
    }

    ensureDirectory(outDir);
    const std::string stem = inputFileName.stem().string();

    if (settings.format == ImageFileFormat::Ktx2) {
        Cubemap cubemap = renderCubemap(panorama, settings.rotation, settings.interpolation, settings.maxWidth);
        std::string outputFileName = (outDir / (stem + ".ktx2")).string();
        if (!quiet) {
            std::cout << "  " << outputFileName << " (" << cubemap.faceSize << "x" << cubemap.faceSize << ")" << std::endl;
        }
        return saveCubemapToKtx2(cubemap, outputFileName.c_str());
    }

    std::vector<ImageBuffer> images = renderFaces(
        panorama, settings.faces, settings.rotation, settings.interpolation, settings.maxWidth);
    saveCubemapFaces(settings.faces, images, outDir, stem, settings.format, settings.jpgQuality);
    if (!quiet) {
        for (CubemapFace face : settings.faces) {
            std::cout << "  " << cubemapFacePath(outDir, stem, face, settings.format).string() << std::endl;
        }
    }
    return 0;
}
