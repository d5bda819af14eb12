#pragma once

#include "types/Error.hpp"

#include <filesystem>
#include <string>

namespace cc::preview::webp {

class TranscodeError : public types::ThumbnailError {
public:
    explicit TranscodeError(const std::string& what) : ThumbnailError(types::Error::TranscodeFailed, what) {}
};

struct Options {
    int quality = 75;
};

/**
 * Lossy transcode of an encoded raster file into WebP.
 */
class Transcoder {
public:
    virtual ~Transcoder() = default;

    /// @throws TranscodeError on any failure; dst is not left behind
    virtual void convert(const std::filesystem::path& src, const std::filesystem::path& dst, const Options& options) = 0;
};

class LibWebpTranscoder : public Transcoder {
public:
    void convert(const std::filesystem::path& src, const std::filesystem::path& dst, const Options& options) override;
};

}
