#pragma once

#include "cache/Store.hpp"
#include "config/Config.hpp"
#include "preview/image.hpp"
#include "preview/thumbnail/Request.hpp"
#include "preview/webp.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cc::preview::thumbnail {

struct PipelineOptions {
    std::filesystem::path cachePath;
    int jpegQuality = 75;   // 1-100
    int pngCompression = 5; // 1-9
    bool webp = false;

    static PipelineOptions fromConfig(const config::CachingConfig& cnf);
};

/**
 * @brief Center-cropped thumbnails served from a disk cache
 *
 * make() validates the source, derives its cache key and returns the cached
 * entry when present. On a miss it decodes the source, crops it to fill the
 * requested box, encodes the result into the cache and, when WebP output is
 * enabled, transcodes it.
 *
 * Validation failures come back as a failed Result. Decode and encode/write
 * failures throw types::ThumbnailError. A failed WebP transcode keeps the native
 * file, which is returned; the error is kept in lastTranscodeError().
 *
 * Concurrent make() calls for the same key generate once per process; entries
 * are committed by rename so readers in other processes never see a partial
 * file. With WebP output the native file is transcoded while still a temporary
 * file, so only the entry that is kept ever appears in the cache.
 */
class Pipeline {
public:
    using MimeResolver = std::function<std::string(const std::string& path)>;

    /// @throws types::ThumbnailError (CacheDirCreationFailed)
    explicit Pipeline(PipelineOptions options,
                      std::shared_ptr<image::Engine> engine = std::make_shared<image::StbEngine>(),
                      std::shared_ptr<webp::Transcoder> transcoder = std::make_shared<webp::LibWebpTranscoder>(),
                      MimeResolver mimeResolver = {});

    Result make(const std::filesystem::path& source, int width, std::optional<int> height = std::nullopt);

    /**
     * @param source when set, removes every cached size of that source only
     * @return number of entries removed
     */
    size_t flush(const std::optional<std::filesystem::path>& source = std::nullopt);

    /**
     * Converts path to `{dir}/{stem}.webp`.
     *
     * @return the WebP path, or path itself if the conversion failed
     */
    std::filesystem::path toWebP(const std::filesystem::path& path, bool deleteOriginal = true);

    [[nodiscard]] std::optional<std::string> lastTranscodeError() const;

    [[nodiscard]] const cache::Store& store() const { return store_; }
    [[nodiscard]] const PipelineOptions& options() const { return options_; }

private:
    PipelineOptions options_;
    cache::Store store_;
    std::shared_ptr<image::Engine> engine_;
    std::shared_ptr<webp::Transcoder> transcoder_;
    MimeResolver mimeResolver_;

    mutable std::mutex errorMutex_;
    std::optional<std::string> lastTranscodeError_;

    Result generate(const Request& req);
    void encodeEntry(const Request& req, const image::Image& src, const std::filesystem::path& tmp);
    std::filesystem::path commitEntry(const Request& req, const std::filesystem::path& tmp, cache::Format format);

    // The error message on failure; also kept as lastTranscodeError().
    std::optional<std::string> transcode(const std::filesystem::path& src, const std::filesystem::path& dst);
    void recordTranscodeError(const std::filesystem::path& src, const std::string& reason);
};

}
