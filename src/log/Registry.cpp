#include "log/Registry.hpp"

#include <stdexcept>
#include <vector>

namespace cc::log {

void Registry::init(const config::LoggingConfig& cnf) {
    std::scoped_lock lock(mutex_);
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }
    initLocked(cnf);
}

void Registry::initLocked(const config::LoggingConfig& cnf) {
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (cnf.log_dir) {
        namespace fs = std::filesystem;
        if (!fs::exists(*cnf.log_dir)) fs::create_directories(*cnf.log_dir);

        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (*cnf.log_dir / "cropcache.log").string(), max_bytes_, max_files_);
        file_sink_->set_level(cnf.levels.file_log_level);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("cropcache", sub_levels.cropcache);
    makeLogger("cache",     sub_levels.cache);
    makeLogger("thumb",     sub_levels.thumb);
    makeLogger("transcode", sub_levels.transcode);
    makeLogger("shell",     sub_levels.shell);

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    {
        std::scoped_lock lock(mutex_);
        if (!initialized_) initLocked({});
    }

    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[Registry] Logger not found: " + name);
    return logger;
}

bool Registry::isInitialized() {
    std::scoped_lock lock(mutex_);
    return initialized_;
}

}
