#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <filesystem>

namespace cc::preview::image {

// Decoded source raster, always 8-bit RGBA.
struct Image {
    std::vector<uint8_t> pixels;
    int width = 0, height = 0;
    int channels = 0; // channels present in the encoded file (3 or 4)
};

/**
 * Destination raster, 8-bit RGBA, initialised opaque black.
 *
 * blend: resampled pixels are composited over the canvas (alpha is flattened).
 * saveAlpha: the encoder keeps the alpha channel (PNG only).
 */
struct Canvas {
    std::vector<uint8_t> pixels;
    int width = 0, height = 0;
    bool blend = true;
    bool saveAlpha = false;
};

/**
 * Raster decode/encode collaborator used by the thumbnail pipeline.
 */
class Engine {
public:
    virtual ~Engine() = default;

    virtual Image decode(const std::filesystem::path& path, const std::string& mime) = 0;

    virtual Canvas newCanvas(int width, int height) = 0;

    virtual void setAlphaMode(Canvas& canvas, bool blend, bool saveAlpha) = 0;

    // Resamples the (srcX, srcY, srcW, srcH) region of src into the
    // (dstX, dstY, dstW, dstH) region of dst.
    virtual void resample(Canvas& dst, const Image& src,
                          int dstX, int dstY, int srcX, int srcY,
                          int dstW, int dstH, int srcW, int srcH) = 0;

    // qualityOrCompression: 1-100 for image/jpeg, 1-9 for image/png
    virtual void encode(const Canvas& canvas, const std::filesystem::path& path,
                        const std::string& mime, int qualityOrCompression) = 0;
};

// stb_image decode, stb_image_resize resampling, TurboJPEG and stb_image_write encode.
class StbEngine : public Engine {
public:
    Image decode(const std::filesystem::path& path, const std::string& mime) override;
    Canvas newCanvas(int width, int height) override;
    void setAlphaMode(Canvas& canvas, bool blend, bool saveAlpha) override;
    void resample(Canvas& dst, const Image& src,
                  int dstX, int dstY, int srcX, int srcY,
                  int dstW, int dstH, int srcW, int srcH) override;
    void encode(const Canvas& canvas, const std::filesystem::path& path,
                const std::string& mime, int qualityOrCompression) override;
};

void compress_to_jpeg(const uint8_t* rgba_data, int width, int height, std::vector<uint8_t>& out_buf, int quality = 75);

std::vector<uint8_t> compress_to_png(const Canvas& canvas, int compression = 5);

}
