#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace cc::config {

inline constexpr auto DEFAULT_CONFIG_PATH = "/etc/cropcache/config.yaml";

struct ThumbnailsConfig {
    unsigned int jpeg_quality = 75;   // 1-100
    unsigned int png_compression = 5; // 1-9
    bool webp = false;
};

struct CachingConfig {
    std::filesystem::path path = "/var/cache/cropcache";
    ThumbnailsConfig thumbnails;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum cropcache = spdlog::level::info;  // startup, config
    spdlog::level::level_enum cache     = spdlog::level::warn;  // flushes, removal failures
    spdlog::level::level_enum thumb     = spdlog::level::warn;  // failed renders only
    spdlog::level::level_enum transcode = spdlog::level::warn;  // WebP fallbacks
    spdlog::level::level_enum shell     = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::optional<std::filesystem::path> log_dir; // console only when unset
    LogLevelsConfig levels;
};

struct Config {
    CachingConfig caching;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

// Effective configuration rendered back to YAML.
std::string dump(const Config& cfg);

} // namespace cc::config
