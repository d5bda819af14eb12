#pragma once

#include <optional>

namespace cc::preview::geometry {

struct CropRect {
    int x = 0, y = 0;
    int width = 0, height = 0;

    bool operator==(const CropRect& other) const = default;
};

struct Crop {
    int width = 0;   // output canvas width
    int height = 0;  // output canvas height
    CropRect source; // region of the source to sample
};

/**
 * Center-crop-to-fill: returns the output size and the source rectangle that,
 * once resampled to that size, fills it without letterboxing or distortion.
 *
 * When dstH is omitted it is derived from the source aspect ratio and the whole
 * source is used. Otherwise the overflowing axis is cropped symmetrically.
 *
 * @throws std::invalid_argument on non-positive source or target dimensions
 */
Crop computeCrop(int srcW, int srcH, int dstW, std::optional<int> dstH = std::nullopt);

}
