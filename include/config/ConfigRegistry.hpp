#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>
#include <optional>

namespace cc::config {

/**
 * Process-wide configuration, set once at startup.
 *
 * Only the first successful init() takes effect; later calls are ignored.
 * A failed load leaves the registry uninitialized.
 */
class ConfigRegistry {
public:
    /**
     * Loads path. When the file is missing the built-in defaults are used,
     * unless required is set.
     *
     * @throws std::runtime_error if a required file is missing
     * @throws YAML::Exception on malformed YAML
     */
    static void init(const std::filesystem::path& path, bool required = false);

    static void init(const Config& config);

    static const Config& get();

    // File the active config was read from; empty when running on defaults.
    static const std::optional<std::filesystem::path>& source();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline std::optional<std::filesystem::path> source_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace cc::config
