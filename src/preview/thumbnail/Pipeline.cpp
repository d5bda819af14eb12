#include "preview/thumbnail/Pipeline.hpp"
#include "preview/geometry.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"
#include "util/Magic.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

using namespace cc::types;
using namespace std::chrono;

namespace cc::preview::thumbnail {

PipelineOptions PipelineOptions::fromConfig(const config::CachingConfig& cnf) {
    return {
        cnf.path,
        static_cast<int>(cnf.thumbnails.jpeg_quality),
        static_cast<int>(cnf.thumbnails.png_compression),
        cnf.thumbnails.webp
    };
}

Pipeline::Pipeline(PipelineOptions options,
                   std::shared_ptr<image::Engine> engine,
                   std::shared_ptr<webp::Transcoder> transcoder,
                   MimeResolver mimeResolver)
    : options_(std::move(options)),
      store_(options_.cachePath),
      engine_(std::move(engine)),
      transcoder_(std::move(transcoder)),
      mimeResolver_(mimeResolver ? std::move(mimeResolver) : MimeResolver(util::Magic::get_mime_type)) {
    options_.jpegQuality = std::clamp(options_.jpegQuality, 1, 100);
    options_.pngCompression = std::clamp(options_.pngCompression, 1, 9);
}

Result Pipeline::make(const fs::path& source, const int width, const std::optional<int> height) {
    std::error_code ec;
    if (!fs::exists(source, ec)) {
        log::Registry::thumb()->debug("[Pipeline] Source not found: {}", source.string());
        return Result::failure(Error::SourceNotFound, "Image not found");
    }

    if (width <= 0 || (height && *height <= 0))
        return Result::failure(Error::InvalidDimensions, "Width and height must be positive");

    std::string mime;
    try {
        mime = mimeResolver_(source.string());
    } catch (const std::exception& e) {
        log::Registry::thumb()->warn("[Pipeline] MIME detection failed for {}: {}", source.string(), e.what());
        return Result::failure(Error::UnsupportedMediaType, "Not a valid JPG or PNG image");
    }

    const auto format = cache::formatForMime(mime);
    if (!format) return Result::failure(Error::UnsupportedMediaType, "Not a valid JPG or PNG image");

    const Request req{source, width, height, mime, *format, cache::Key::derive(source, width, height)};

    if (auto cached = store_.lookup(req.key, req.format, options_.webp)) return Result::hit(*cached);

    const auto lock = store_.lockFor(req.key);
    std::scoped_lock guard(*lock);

    // another caller may have generated it while we waited
    if (auto cached = store_.lookup(req.key, req.format, options_.webp)) return Result::hit(*cached);

    return generate(req);
}

Result Pipeline::generate(const Request& req) {
    const auto start = steady_clock::now();

    image::Image src;
    try {
        src = engine_->decode(req.source, req.mime);
    } catch (const std::exception& e) {
        log::Registry::thumb()->error("[Pipeline] Failed to decode {}: {}", req.source.string(), e.what());
        throw ThumbnailError(Error::DecodeFailed, "Failed to decode " + req.source.string() + ": " + e.what());
    }

    // Nothing is visible in the cache until the final file is committed, so a
    // concurrent lookup never returns an entry that is about to be replaced.
    const auto nativeTmp = util::tempSiblingPath(store_.pathFor(req.key, req.format));
    encodeEntry(req, src, nativeTmp);

    Result result;
    if (!options_.webp) {
        result = Result::generated(commitEntry(req, nativeTmp, req.format));
    } else {
        const auto webpTmp = util::tempSiblingPath(store_.pathFor(req.key, cache::Format::Webp));
        if (auto err = transcode(nativeTmp, webpTmp)) {
            result = Result::generated(commitEntry(req, nativeTmp, req.format));
            result.transcodeError = std::move(err);
        } else {
            store_.remove(nativeTmp);
            result = Result::generated(commitEntry(req, webpTmp, cache::Format::Webp));
        }
    }

    log::Registry::thumb()->debug("[Pipeline] Generated {} in {}us", result.path->string(),
                                  duration_cast<microseconds>(steady_clock::now() - start).count());
    return result;
}

void Pipeline::encodeEntry(const Request& req, const image::Image& src, const fs::path& tmp) {
    const auto crop = geometry::computeCrop(src.width, src.height, req.width, req.height);
    const bool png = req.format == cache::Format::Png;

    try {
        auto canvas = engine_->newCanvas(crop.width, crop.height);

        // must precede resample, or transparency is flattened into the canvas
        if (png) engine_->setAlphaMode(canvas, false, true);

        engine_->resample(canvas, src, 0, 0, crop.source.x, crop.source.y,
                          crop.width, crop.height, crop.source.width, crop.source.height);
        engine_->encode(canvas, tmp, req.mime, png ? options_.pngCompression : options_.jpegQuality);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        log::Registry::thumb()->error("[Pipeline] Failed to write thumbnail for {}: {}", req.source.string(), e.what());
        throw ThumbnailError(Error::EncodeOrWriteFailed,
                             "Failed to write thumbnail for " + req.source.string() + ": " + e.what());
    }
}

fs::path Pipeline::commitEntry(const Request& req, const fs::path& tmp, const cache::Format format) {
    try {
        return store_.commit(tmp, req.key, format);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        log::Registry::thumb()->error("[Pipeline] Failed to commit thumbnail for {}: {}", req.source.string(), e.what());
        throw ThumbnailError(Error::EncodeOrWriteFailed,
                             "Failed to write thumbnail for " + req.source.string() + ": " + e.what());
    }
}

size_t Pipeline::flush(const std::optional<fs::path>& source) {
    if (!source) return store_.flush();
    return store_.flush(cache::Key::hashOf(*source));
}

fs::path Pipeline::toWebP(const fs::path& path, const bool deleteOriginal) {
    const auto target = path.parent_path() / (path.stem().string() + ".webp");
    const auto tmp = util::tempSiblingPath(target);

    if (transcode(path, tmp)) return path;

    try {
        util::atomicReplace(tmp, target);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        recordTranscodeError(path, e.what());
        return path;
    }

    if (deleteOriginal && path != target) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) log::Registry::transcode()->warn("[Pipeline] Could not remove {}: {}", path.string(), ec.message());
    }

    return target;
}

std::optional<std::string> Pipeline::transcode(const fs::path& src, const fs::path& dst) {
    try {
        transcoder_->convert(src, dst, {options_.jpegQuality});
        return std::nullopt;
    } catch (const webp::TranscodeError& e) {
        std::error_code ec;
        fs::remove(dst, ec);
        recordTranscodeError(src, e.what());
        return e.what();
    }
}

void Pipeline::recordTranscodeError(const fs::path& src, const std::string& reason) {
    log::Registry::transcode()->warn("[Pipeline] WebP conversion of {} failed, keeping original: {}",
                                     src.string(), reason);
    std::scoped_lock lock(errorMutex_);
    lastTranscodeError_ = reason;
}

std::optional<std::string> Pipeline::lastTranscodeError() const {
    std::scoped_lock lock(errorMutex_);
    return lastTranscodeError_;
}

}
