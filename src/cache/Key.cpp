#include "cache/Key.hpp"

#include <zlib.h>

#include <cstdio>
#include <stdexcept>
#include <vector>

namespace cc::cache {

namespace {

// Latin-1 supplement, U+00C0..U+00FF folded to ASCII. '\0' marks the
// multiplication and division signs, which become separators.
constexpr char LATIN1_FOLD[] =
    "aaaaaaaceeeeiiii"
    "dnooooo\0ouuuuybs"
    "aaaaaaaceeeeiiii"
    "dnooooo\0ouuuuyby";

// Anything without a letter equivalent separates words.
char foldNonAscii(const char32_t cp) {
    if (cp >= 0xC0 && cp <= 0xFF && LATIN1_FOLD[cp - 0xC0] != '\0') return LATIN1_FOLD[cp - 0xC0];
    return ' ';
}

char fold(const char32_t cp) {
    if (cp < 0x80) {
        const auto c = static_cast<char>(cp);
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) return c;
        if (c >= 'A' && c <= 'Z') return static_cast<char>(c - 'A' + 'a');
        switch (c) {
            case ' ': case '\t': case '\n': case '\r': case '\v': case '\f':
            case '"': case '!': case '@': case '#': case '$': case '%': case '&': case '*':
            case '(': case ')': case '_': case '-': case '+': case '=': case '{': case '[':
            case '}': case ']': case '/': case '?': case ';': case ':': case '.': case ',':
            case '\\': case '\'': case '<': case '>':
                return ' ';
            default:
                return '\0';
        }
    }
    return foldNonAscii(cp);
}

char32_t toLower(const char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') return cp + 0x20;
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
    return cp;
}

// Invalid sequences are skipped byte by byte.
std::vector<char32_t> decodeUtf8(const std::string& in) {
    std::vector<char32_t> out;
    out.reserve(in.size());

    for (std::size_t i = 0; i < in.size();) {
        const auto b = static_cast<unsigned char>(in[i]);
        std::size_t len = 0;
        char32_t cp = 0;

        if (b < 0x80) { len = 1; cp = b; }
        else if ((b & 0xE0) == 0xC0) { len = 2; cp = b & 0x1F; }
        else if ((b & 0xF0) == 0xE0) { len = 3; cp = b & 0x0F; }
        else if ((b & 0xF8) == 0xF0) { len = 4; cp = b & 0x07; }
        else { ++i; continue; }

        if (i + len > in.size()) break;

        bool valid = true;
        for (std::size_t k = 1; k < len; ++k) {
            const auto cont = static_cast<unsigned char>(in[i + k]);
            if ((cont & 0xC0) != 0x80) { valid = false; break; }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (!valid) { ++i; continue; }
        out.push_back(cp);
        i += len;
    }

    return out;
}

void appendEscaped(std::u32string& out, const char32_t cp) {
    switch (cp) {
        case U'&': out += U"&amp;"; break;
        case U'"': out += U"&quot;"; break;
        case U'\'': out += U"&#039;"; break;
        case U'<': out += U"&lt;"; break;
        case U'>': out += U"&gt;"; break;
        default: out.push_back(cp);
    }
}

}

Key::Key(std::string slug, const int width, const std::optional<int> height, std::string hash)
    : slug_(std::move(slug)), width_(width), height_(height), hash_(std::move(hash)) {}

Key Key::derive(const std::filesystem::path& source, const int width, const std::optional<int> height) {
    if (width <= 0) throw std::invalid_argument("Cache key width must be positive");
    if (height && *height <= 0) throw std::invalid_argument("Cache key height must be positive");
    return {slugify(source.stem().string()), width, height, hashOf(source)};
}

std::string Key::hashOf(const std::filesystem::path& source) {
    const auto basename = source.filename().string();

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(basename.data()), static_cast<uInt>(basename.size()));

    char buf[HASH_LENGTH + 1];
    std::snprintf(buf, sizeof(buf), "%08lx", crc & 0xFFFFFFFFUL);
    return {buf, HASH_LENGTH};
}

std::string Key::slugify(const std::string& name) {
    std::u32string escaped;
    for (const auto cp : decodeUtf8(name)) appendEscaped(escaped, toLower(cp));

    std::string folded;
    folded.reserve(escaped.size());
    for (const auto cp : escaped)
        if (const char c = fold(cp); c != '\0') folded.push_back(c);

    std::string slug;
    slug.reserve(folded.size());
    for (const char c : folded) {
        const char out = c == ' ' ? '-' : c;
        if (out == '-' && (slug.empty() || slug.back() == '-')) continue;
        slug.push_back(out);
    }
    while (!slug.empty() && slug.back() == '-') slug.pop_back();

    return slug;
}

std::optional<std::string> Key::hashFromEntryName(const std::string& filename) {
    const auto dot = filename.rfind('.');
    const auto stem = dot == std::string::npos ? filename : filename.substr(0, dot);

    const auto dash = stem.rfind('-');
    if (dash == std::string::npos) return std::nullopt;

    auto hash = stem.substr(dash + 1);
    if (hash.size() != HASH_LENGTH) return std::nullopt;
    for (const char c : hash)
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return std::nullopt;

    return hash;
}

std::string Key::str() const {
    std::string out = slug_;
    if (!out.empty()) out += '-';
    out += std::to_string(width_);
    if (height_) out += "x" + std::to_string(*height_);
    out += "-" + hash_;
    return out;
}

}
