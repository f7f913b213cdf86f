#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include <CLI11.hpp>
#include <glm/glm.hpp>
#include "PanoramaConversion.h"

int main(int argc, char** argv) {
    CLI::App app{ "Create cubemap faces from a single 2:1 equirectangular panorama" };

    std::string inputFilename;
    app.add_option("input", inputFilename, "Input panorama (png, jpg, bmp, tga, ...)")->required()->check(CLI::ExistingFile);

    std::string outputDir;
    app.add_option("output", outputDir, "Output directory")->required();

    double rotationDegrees = 0;
    app.add_option("-r,--rotation", rotationDegrees, "Cube rotation around the vertical axis, in degrees")->default_val(0);

    std::string interpolation = "linear";
    app.add_option("-i,--interpolation", interpolation, "Sampling filter: linear or nearest")->default_val("linear");

    int maxWidth = UNBOUNDED_WIDTH;
    app.add_option("-w,--max-width", maxWidth, "Maximum face size, defaults to a quarter of the panorama width")
        ->check(CLI::PositiveNumber);

    std::vector<std::string> faceNames;
    app.add_option("-f,--faces", faceNames, "Faces to render (px nx py ny pz nz), all by default");

    std::string format = "png";
    app.add_option("--format", format, "Output format: png, jpg, bmp, tga or ktx2")->default_val("png");

    int jpgQuality = 90;
    app.add_option("--jpg-quality", jpgQuality, "JPEG quality")->default_val(90)->check(CLI::Range(1, 100));

    bool quiet = false;
    app.add_flag("-q,--quiet", quiet, "Do not list written files");

    CLI11_PARSE(app, argc, argv);

    Interpolation interpolationMode = parseInterpolation(interpolation);
    bool hasOwnFilter = interpolationMode == Interpolation::Nearest || interpolationMode == Interpolation::Bilinear;
    if (!hasOwnFilter || interpolation != interpolationName(interpolationMode)) {
        std::cerr << "Interpolation '" << interpolation << "' is not implemented, using "
                  << interpolationName(Interpolation::Nearest) << std::endl;
    }

    try {
        ConversionSettings settings;
        if (!faceNames.empty()) {
            settings.faces = parseCubemapFaces(faceNames);
        }
        settings.rotation = glm::radians(rotationDegrees);
        settings.interpolation = interpolationMode;
        settings.maxWidth = maxWidth;
        settings.format = parseImageFileFormat(format);
        settings.jpgQuality = jpgQuality;

        if (!quiet) {
            std::cout << inputFilename << std::endl;
        }
        return convertPanorama(inputFilename, outputDir, settings, quiet) == 0 ? 0 : 1;
    } catch (std::exception const& e) {
        std::cerr << "Failed to convert " << inputFilename << ": " << e.what() << std::endl;
        return 1;
    }
}
