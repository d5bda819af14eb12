#include "preview/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cc::preview::geometry {

namespace {

int roundToInt(const double v) { return static_cast<int>(std::lround(v)); }

}

Crop computeCrop(const int srcW, const int srcH, const int dstW, const std::optional<int> dstH) {
    if (srcW <= 0 || srcH <= 0) throw std::invalid_argument("Source dimensions must be positive");
    if (dstW <= 0) throw std::invalid_argument("Target width must be positive");
    if (dstH && *dstH <= 0) throw std::invalid_argument("Target height must be positive");

    Crop crop{dstW, 0, {0, 0, srcW, srcH}};

    if (!dstH) {
        crop.height = std::max(1, roundToInt(static_cast<double>(dstW) * srcH / srcW));
        return crop;
    }

    crop.height = *dstH;

    const double cmpX = static_cast<double>(srcW) / dstW;
    const double cmpY = static_cast<double>(srcH) / *dstH;

    if (cmpX > cmpY) {
        const double newW = srcW / cmpX * cmpY;
        crop.source.width = std::clamp(roundToInt(newW), 1, srcW);
        crop.source.x = std::clamp(roundToInt((srcW - newW) / 2), 0, srcW - crop.source.width);
    } else if (cmpY > cmpX) {
        const double newH = srcH / cmpY * cmpX;
        crop.source.height = std::clamp(roundToInt(newH), 1, srcH);
        crop.source.y = std::clamp(roundToInt((srcH - newH) / 2), 0, srcH - crop.source.height);
    }

    return crop;
}

}
