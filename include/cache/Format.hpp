#pragma once

#include <optional>
#include <string>

namespace cc::cache {

enum class Format { Jpeg, Png, Webp };

inline constexpr auto MIME_JPEG = "image/jpeg";
inline constexpr auto MIME_PNG = "image/png";

inline std::string extension(const Format format) {
    switch (format) {
        case Format::Jpeg: return "jpg";
        case Format::Png: return "png";
        case Format::Webp: return "webp";
    }
    return {};
}

// Only the two raster kinds we accept as sources map to a format.
inline std::optional<Format> formatForMime(const std::string& mime) {
    if (mime == MIME_JPEG) return Format::Jpeg;
    if (mime == MIME_PNG) return Format::Png;
    return std::nullopt;
}

}
