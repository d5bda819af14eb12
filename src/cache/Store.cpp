#include "cache/Store.hpp"
#include "log/Registry.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"

#include <system_error>

namespace fs = std::filesystem;

using namespace cc::types;

namespace cc::cache {

Store::Store(fs::path root) : root_(std::move(root)) {
    std::error_code ec;

    if (fs::exists(root_, ec)) {
        if (!fs::is_directory(root_, ec))
            throw ThumbnailError(Error::CacheDirCreationFailed,
                                 "Cache path exists but is not a directory: " + root_.string());
        return;
    }

    fs::create_directories(root_, ec);
    if (ec || !fs::is_directory(root_))
        throw ThumbnailError(Error::CacheDirCreationFailed,
                             "Could not create cache folder " + root_.string() + ": " + ec.message());

    fs::permissions(root_,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    ec);
    if (ec) log::Registry::cache()->warn("[Store] Could not set permissions on {}: {}", root_.string(), ec.message());

    log::Registry::cache()->info("[Store] Created cache folder {}", root_.string());
}

fs::path Store::pathFor(const Key& key, const Format format) const {
    return root_ / (key.str() + "." + extension(format));
}

std::optional<fs::path> Store::lookup(const Key& key, const Format native, const bool preferWebp) const {
    std::error_code ec;

    if (preferWebp) {
        if (auto webp = pathFor(key, Format::Webp); fs::is_regular_file(webp, ec)) return webp;
    }

    if (auto path = pathFor(key, native); fs::is_regular_file(path, ec)) return path;

    return std::nullopt;
}

fs::path Store::write(const Key& key, const Format format, const Writer& writer) const {
    const auto tmp = util::tempSiblingPath(pathFor(key, format));

    try {
        writer(tmp);
        return commit(tmp, key, format);
    } catch (...) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
}

fs::path Store::commit(const fs::path& tmpPath, const Key& key, const Format format) const {
    const auto dest = pathFor(key, format);
    util::atomicReplace(tmpPath, dest);
    log::Registry::cache()->debug("[Store] Committed {}", dest.string());
    return dest;
}

bool Store::isEntry(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_regular_file(ec) && !util::isTempFile(entry.path());
}

bool Store::remove(const fs::path& path) const {
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) log::Registry::cache()->warn("[Store] Failed to remove {}: {}", path.string(), ec.message());
    return removed;
}

size_t Store::flush(const std::optional<std::string>& matchHash) const {
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        log::Registry::cache()->warn("[Store] Cannot scan {}: {}", root_.string(), ec.message());
        return 0;
    }

    size_t removed = 0;
    for (const auto& entry : it) {
        if (!isEntry(entry)) continue;

        if (matchHash) {
            const auto hash = Key::hashFromEntryName(entry.path().filename().string());
            if (!hash || *hash != *matchHash) continue;
        }

        if (remove(entry.path())) ++removed;
    }

    log::Registry::cache()->info("[Store] Flushed {} entries from {}{}", removed, root_.string(),
                                 matchHash ? " matching " + *matchHash : std::string{});
    return removed;
}

std::vector<fs::path> Store::entries() const {
    std::vector<fs::path> out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(root_, ec))
        if (isEntry(entry)) out.push_back(entry.path());
    return out;
}

std::shared_ptr<std::mutex> Store::lockFor(const Key& key) {
    std::scoped_lock guard(locksMutex_);

    std::erase_if(locks_, [](const auto& kv) { return kv.second.expired(); });

    auto& slot = locks_[key.str()];
    auto lock = slot.lock();
    if (!lock) {
        lock = std::make_shared<std::mutex>();
        slot = lock;
    }
    return lock;
}

}
