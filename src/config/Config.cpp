#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

namespace cc::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["caching"]) YAML::convert<CachingConfig>::decode(node, cfg.caching);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::string dump(const Config& cfg) {
    YAML::Node root;
    root["caching"] = cfg.caching;
    root["logging"] = cfg.logging;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

} // namespace cc::config
