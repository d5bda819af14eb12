#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace fs = std::filesystem;

namespace cc::config {

void ConfigRegistry::init(const fs::path& path, const bool required) {
    std::call_once(init_flag_, [&]() {
        if (fs::exists(path)) {
            config_ = loadConfig(path);
            source_ = path;
        } else if (required) {
            throw std::runtime_error("Config file not found: " + path.string());
        }
        initialized_ = true;
    });
}

void ConfigRegistry::init(const Config& config) {
    std::call_once(init_flag_, [&]() {
        config_ = config;
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

const std::optional<fs::path>& ConfigRegistry::source() {
    ensureInitialized();
    return source_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_) throw std::runtime_error("Configuration used before ConfigRegistry::init()");
}

} // namespace cc::config
