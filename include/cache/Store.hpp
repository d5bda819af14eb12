#pragma once

#include "cache/Format.hpp"
#include "cache/Key.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cc::cache {

/**
 * On-disk cache of generated thumbnails: `{root}/{key}.{ext}`.
 *
 * A regular file at the expected path is the only existence check; there is no
 * index. New entries are encoded to a hidden temporary file in the same
 * directory and renamed into place, so a concurrent lookup never observes a
 * partial file. The cache is unbounded and only shrinks through flush().
 */
class Store {
public:
    // Encodes an entry into the given temporary path.
    using Writer = std::function<void(const std::filesystem::path& tmpPath)>;

    /// @throws types::ThumbnailError (CacheDirCreationFailed) if root cannot be created
    explicit Store(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    [[nodiscard]] std::filesystem::path pathFor(const Key& key, Format format) const;

    // WebP entry first when preferWebp, then the native format.
    [[nodiscard]] std::optional<std::filesystem::path> lookup(const Key& key, Format native, bool preferWebp) const;

    /**
     * Runs writer against a fresh temporary path and commits the result.
     * If writer throws, the temporary file is removed and the exception propagates.
     */
    std::filesystem::path write(const Key& key, Format format, const Writer& writer) const;

    // Renames a finished temporary file into the entry slot for (key, format).
    std::filesystem::path commit(const std::filesystem::path& tmpPath, const Key& key, Format format) const;

    // Best-effort; false if nothing was removed.
    bool remove(const std::filesystem::path& path) const;

    /**
     * Removes cache entries.
     *
     * @param matchHash when set, only entries whose key hash component equals it
     *        (every size variant of one source); otherwise every entry
     * @return number of files removed
     */
    size_t flush(const std::optional<std::string>& matchHash = std::nullopt) const;

    [[nodiscard]] std::vector<std::filesystem::path> entries() const;

    // In-process generation lock for one key; held while a miss is generated.
    std::shared_ptr<std::mutex> lockFor(const Key& key);

private:
    std::filesystem::path root_;

    std::mutex locksMutex_;
    std::unordered_map<std::string, std::weak_ptr<std::mutex>> locks_;

    static bool isEntry(const std::filesystem::directory_entry& entry);
};

}
