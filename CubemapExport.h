#pragma once

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <ktx.h>
#include <vulkan/vulkan.h>
#include "CubeFace.h"
#include "CubemapFunctions.h"
#include "ImageFunctions.h"

std::filesystem::path cubemapFacePath(
    std::filesystem::path const& outDir,
    std::string const& stem,
    CubemapFace face,
    ImageFileFormat format
) {
    return outDir / (stem + "_" + cubemapFaceName(face) + "." + imageFileExtension(format));
}

// Writes each rendered face to its own file, faces[i] pairs with images[i]
void saveCubemapFaces(
    std::vector<CubemapFace> const& faces,
    std::vector<ImageBuffer> const& images,
    std::filesystem::path const& outDir,
    std::string const& stem,
    ImageFileFormat format,
    int jpgQuality
) {
    if (faces.size() != images.size()) {
        throw std::invalid_argument("face list and rendered images differ in length");
    }
    for (size_t i = 0; i < faces.size(); i++) {
        saveImage(images[i], cubemapFacePath(outDir, stem, faces[i], format), format, jpgQuality);
    }
}

int saveCubemapToKtx2(Cubemap const& cubemap, const char* filename) {
    ktxTexture2* texture;
    KTX_error_code result;

    ktxTextureCreateInfo createInfo = {
        .vkFormat = VK_FORMAT_R8G8B8A8_SRGB,
        .baseWidth = static_cast<ktx_uint32_t>(cubemap.faceSize),
        .baseHeight = static_cast<ktx_uint32_t>(cubemap.faceSize),
        .baseDepth = 1,
        .numDimensions = 2,
        .numLevels = 1,
        .numLayers = 1,
        .numFaces = CUBEMAP_FACE_COUNT,
        .isArray = false,
        .generateMipmaps = false,
    };

    result = ktxTexture2_Create(
        &createInfo,
        KTX_TEXTURE_CREATE_ALLOC_STORAGE,
        &texture
    );
    if (result != KTX_SUCCESS) {
        std::cerr << "Failed to create KTX2 texture: " << ktxErrorString(result) << std::endl;
        return -1;
    }

    for (CubemapFace face : allCubemapFaces) {
        ImageBuffer const& image = cubemap.face(face);
        if (image.width != cubemap.faceSize || image.height != cubemap.faceSize) {
            std::cerr << "Face " << cubemapFaceName(face) << " is " << image.width << "x" << image.height
                      << ", expected " << cubemap.faceSize << "x" << cubemap.faceSize << std::endl;
            ktxTexture_Destroy(ktxTexture(texture));
            return -1;
        }

        result = ktxTexture_SetImageFromMemory(
            ktxTexture(texture),
            0, // level
            0, // layer
            static_cast<ktx_uint32_t>(face),
            image.data.data(),
            image.data.size()
        );
        if (result != KTX_SUCCESS) {
            std::cerr << "Failed to set image data for face " << cubemapFaceName(face)
                      << ": " << ktxErrorString(result) << std::endl;
            ktxTexture_Destroy(ktxTexture(texture));
            return -1;
        }
    }

    result = ktxTexture_WriteToNamedFile(ktxTexture(texture), filename);
    if (result != KTX_SUCCESS) {
        std::cerr << "Failed to write KTX2 file: " << ktxErrorString(result) << std::endl;
        ktxTexture_Destroy(ktxTexture(texture));
        return -1;
    }

    ktxTexture_Destroy(ktxTexture(texture));
    return 0;
}
