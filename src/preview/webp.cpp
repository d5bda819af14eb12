#include "preview/webp.hpp"
#include "util/files.hpp"

#include <stb/stb_image.h>
#include <webp/encode.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace cc::preview::webp {

void LibWebpTranscoder::convert(const std::filesystem::path& src, const std::filesystem::path& dst, const Options& options) {
    int width = 0, height = 0, channels = 0;
    if (!stbi_info(src.c_str(), &width, &height, &channels))
        throw TranscodeError("Not a readable raster: " + src.string());

    // grey and grey+alpha sources are widened to RGB/RGBA
    const bool alpha = channels == 2 || channels == 4;
    unsigned char* pixels = stbi_load(src.c_str(), &width, &height, &channels, alpha ? 4 : 3);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        throw TranscodeError("Failed to read " + src.string() + ": " + (reason ? reason : "unknown error"));
    }

    const auto quality = static_cast<float>(std::clamp(options.quality, 1, 100));

    uint8_t* output = nullptr;
    const size_t size = alpha
        ? WebPEncodeRGBA(pixels, width, height, width * 4, quality, &output)
        : WebPEncodeRGB(pixels, width, height, width * 3, quality, &output);
    stbi_image_free(pixels);

    if (size == 0 || !output) {
        if (output) WebPFree(output);
        throw TranscodeError("WebP encoding failed for " + src.string());
    }

    const std::vector<uint8_t> encoded(output, output + size);
    WebPFree(output);

    try {
        util::writeFile(dst, encoded);
    } catch (const std::runtime_error& e) {
        std::error_code ec;
        std::filesystem::remove(dst, ec);
        throw TranscodeError(e.what());
    }
}

}
