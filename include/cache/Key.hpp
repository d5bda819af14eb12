#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace cc::cache {

/**
 * Deterministic identifier for one (source, width, height) combination.
 *
 * Rendered as `{slug}-{width}[x{height}]-{hash}` where the hash is a CRC32 of
 * the source basename. The hash only tells apart sources by name: overwriting
 * a file in place keeps its key, and two files sharing a basename in different
 * directories share the hash component. Collisions are accepted.
 */
class Key {
public:
    static constexpr std::size_t HASH_LENGTH = 8;

    static Key derive(const std::filesystem::path& source, int width, std::optional<int> height = std::nullopt);

    // CRC32 of filename + extension, 8 lowercase hex chars
    static std::string hashOf(const std::filesystem::path& source);

    static std::string slugify(const std::string& name);

    // Extracts the hash component from a cache entry filename ("a-200-1f2e3d4c.jpg").
    static std::optional<std::string> hashFromEntryName(const std::string& filename);

    [[nodiscard]] std::string str() const;

    [[nodiscard]] const std::string& slug() const { return slug_; }
    [[nodiscard]] int width() const { return width_; }
    [[nodiscard]] std::optional<int> height() const { return height_; }
    [[nodiscard]] const std::string& hash() const { return hash_; }

    bool operator==(const Key& other) const = default;

private:
    Key(std::string slug, int width, std::optional<int> height, std::string hash);

    std::string slug_;
    int width_;
    std::optional<int> height_;
    std::string hash_;
};

}
