#include "util/files.hpp"

#include <fstream>
#include <random>
#include <stdexcept>

namespace fs = std::filesystem;

void cc::util::writeFile(const fs::path& absPath, const std::vector<uint8_t>& buffer) {
    std::ofstream out(absPath, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot open " + absPath.string() + " for writing");

    out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    out.flush();
    if (!out) throw std::runtime_error("Short write to " + absPath.string());
}

// lowercase hex, so temp names stay shell-friendly
std::string cc::util::generate_random_suffix(const size_t length) {
    static constexpr char hex[] = "0123456789abcdef";
    thread_local std::mt19937_64 rng{std::random_device{}()};

    std::string out(length, '0');
    for (auto& c : out) c = hex[rng() & 0xF];
    return out;
}

fs::path cc::util::tempSiblingPath(const fs::path& dest) {
    return dest.parent_path() / ("." + dest.filename().string() + "." + generate_random_suffix() + TEMP_SUFFIX);
}

bool cc::util::isTempFile(const fs::path& path) {
    const auto name = path.filename().string();
    return name.starts_with(".") && name.ends_with(TEMP_SUFFIX);
}

void cc::util::atomicReplace(const fs::path& tmp, const fs::path& dest) {
    fs::rename(tmp, dest);
}
