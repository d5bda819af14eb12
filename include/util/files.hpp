#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cc::util {

inline constexpr auto TEMP_SUFFIX = ".tmp";

void writeFile(const std::filesystem::path& absPath, const std::vector<uint8_t>& buffer);

std::string generate_random_suffix(size_t length = 8);

// Hidden sibling of dest ("{dir}/.{name}.{random}.tmp") so a rename() into place
// stays on the same filesystem.
std::filesystem::path tempSiblingPath(const std::filesystem::path& dest);

[[nodiscard]] bool isTempFile(const std::filesystem::path& path);

// Atomically moves tmp over dest. Readers see either the old file, no file, or
// the complete new one.
void atomicReplace(const std::filesystem::path& tmp, const std::filesystem::path& dest);

}
