#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION

#include "preview/image.hpp"
#include "cache/Format.hpp"
#include "util/files.hpp"

#include <stb/stb_image.h>
#include <stb/stb_image_resize.h>
#include <stb/stb_image_write.h>
#include <turbojpeg.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace cc::preview::image {

namespace {

constexpr int RGBA = 4;

// stb_image_write reads its PNG compression level from a global
std::mutex pngWriteMutex;

void appendToVector(void* context, void* data, const int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    const auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

}

void compress_to_jpeg(const uint8_t* rgba_data, const int width, const int height, std::vector<uint8_t>& out_buf,
                      const int quality) {
    tjhandle tj = tjInitCompress();
    if (!tj) throw std::runtime_error("Failed to initialize TurboJPEG compressor");

    unsigned char* jpeg_buf = nullptr;
    unsigned long jpeg_size = 0;

    constexpr int flags = 0;

    if (tjCompress2(
            tj,
            rgba_data,
            width,
            0, // pitch (0 = auto)
            height,
            TJPF_RGBA, // alpha byte is ignored
            &jpeg_buf,
            &jpeg_size,
            TJSAMP_444,
            std::clamp(quality, 1, 100),
            flags) != 0) {
        const std::string err = tjGetErrorStr();
        tjDestroy(tj);
        throw std::runtime_error("JPEG compression failed: " + err);
    }

    out_buf.assign(jpeg_buf, jpeg_buf + jpeg_size);
    tjFree(jpeg_buf);
    tjDestroy(tj);
}

std::vector<uint8_t> compress_to_png(const Canvas& canvas, const int compression) {
    const int comp = canvas.saveAlpha ? RGBA : 3;

    std::vector<uint8_t> rgb;
    const uint8_t* data = canvas.pixels.data();
    if (!canvas.saveAlpha) {
        rgb.reserve(static_cast<size_t>(canvas.width) * canvas.height * 3);
        for (size_t i = 0; i < canvas.pixels.size(); i += RGBA)
            rgb.insert(rgb.end(), canvas.pixels.begin() + i, canvas.pixels.begin() + i + 3);
        data = rgb.data();
    }

    std::vector<uint8_t> out;
    std::scoped_lock lock(pngWriteMutex);
    stbi_write_png_compression_level = std::clamp(compression, 1, 9);
    if (!stbi_write_png_to_func(appendToVector, &out, canvas.width, canvas.height, comp, data, canvas.width * comp))
        throw std::runtime_error("PNG compression failed");

    return out;
}

Image StbEngine::decode(const std::filesystem::path& path, const std::string& mime) {
    if (!cache::formatForMime(mime)) throw std::invalid_argument("Unsupported MIME type for decoding: " + mime);

    int width = 0, height = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &width, &height, &channels, RGBA);
    if (!data) {
        const char* reason = stbi_failure_reason();
        throw std::runtime_error("Failed to load image " + path.string() + ": " + (reason ? reason : "unknown error"));
    }

    Image img;
    img.width = width;
    img.height = height;
    img.channels = channels;
    img.pixels.assign(data, data + static_cast<size_t>(width) * height * RGBA);
    stbi_image_free(data);

    return img;
}

Canvas StbEngine::newCanvas(const int width, const int height) {
    if (width <= 0 || height <= 0) throw std::invalid_argument("Canvas dimensions must be positive");

    Canvas canvas;
    canvas.width = width;
    canvas.height = height;
    canvas.pixels.assign(static_cast<size_t>(width) * height * RGBA, 0);
    for (size_t i = 3; i < canvas.pixels.size(); i += RGBA) canvas.pixels[i] = 255;

    return canvas;
}

void StbEngine::setAlphaMode(Canvas& canvas, const bool blend, const bool saveAlpha) {
    canvas.blend = blend;
    canvas.saveAlpha = saveAlpha;
}

void StbEngine::resample(Canvas& dst, const Image& src,
                         const int dstX, const int dstY, const int srcX, const int srcY,
                         const int dstW, const int dstH, const int srcW, const int srcH) {
    if (srcX < 0 || srcY < 0 || srcW <= 0 || srcH <= 0 || srcX + srcW > src.width || srcY + srcH > src.height)
        throw std::invalid_argument("Source region lies outside the image");
    if (dstX < 0 || dstY < 0 || dstW <= 0 || dstH <= 0 || dstX + dstW > dst.width || dstY + dstH > dst.height)
        throw std::invalid_argument("Destination region lies outside the canvas");

    const auto* in = src.pixels.data() + (static_cast<size_t>(srcY) * src.width + srcX) * RGBA;
    std::vector<uint8_t> resized(static_cast<size_t>(dstW) * dstH * RGBA);

    if (!stbir_resize_uint8_generic(in, srcW, srcH, src.width * RGBA,
                                    resized.data(), dstW, dstH, 0,
                                    RGBA, 3, 0,
                                    STBIR_EDGE_CLAMP, STBIR_FILTER_DEFAULT, STBIR_COLORSPACE_LINEAR,
                                    nullptr))
        throw std::runtime_error("Image resampling failed");

    for (int y = 0; y < dstH; ++y) {
        auto* row = dst.pixels.data() + (static_cast<size_t>(dstY + y) * dst.width + dstX) * RGBA;
        const auto* from = resized.data() + static_cast<size_t>(y) * dstW * RGBA;

        if (!dst.blend) {
            std::copy_n(from, static_cast<size_t>(dstW) * RGBA, row);
            continue;
        }

        for (int x = 0; x < dstW; ++x) {
            auto* px = row + x * RGBA;
            const auto* s = from + x * RGBA;
            const unsigned a = s[3];
            for (int c = 0; c < 3; ++c)
                px[c] = static_cast<uint8_t>((s[c] * a + px[c] * (255 - a) + 127) / 255);
            px[3] = 255;
        }
    }
}

void StbEngine::encode(const Canvas& canvas, const std::filesystem::path& path,
                       const std::string& mime, const int qualityOrCompression) {
    std::vector<uint8_t> encoded;

    if (mime == cache::MIME_JPEG) compress_to_jpeg(canvas.pixels.data(), canvas.width, canvas.height, encoded, qualityOrCompression);
    else if (mime == cache::MIME_PNG) encoded = compress_to_png(canvas, qualityOrCompression);
    else throw std::invalid_argument("Unsupported MIME type for encoding: " + mime);

    if (encoded.empty()) throw std::runtime_error("Encoded buffer is empty for " + path.string());

    util::writeFile(path, encoded);
}

}
