#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <magic.h>

namespace cc::util {

/**
 * libmagic content sniffing. Source images are classified by their bytes,
 * so a PNG named photo.jpg is still image/png and text renamed to .jpg is
 * rejected.
 */
class Magic {
public:
    explicit Magic(int flags = MAGIC_MIME_TYPE | MAGIC_SYMLINK);

    // "image/jpeg", "image/png", "text/plain", ...
    std::string mime_type(const std::filesystem::path& path) const;

    // Per-thread instance; a magic_t cookie must not be shared across threads.
    static std::string get_mime_type(const std::string& path);

private:
    std::unique_ptr<magic_set, decltype(&magic_close)> cookie_;

    std::string lastError(const std::string& fallback) const;
};

}
