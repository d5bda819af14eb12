#pragma once

#include "config/Config.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace cc::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf = {});

    // Generic access by name; falls back to a console-only init() on first use.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> cropcache() { return get("cropcache"); }
    static std::shared_ptr<spdlog::logger> cache()     { return get("cache"); }
    static std::shared_ptr<spdlog::logger> thumb()     { return get("thumb"); }
    static std::shared_ptr<spdlog::logger> transcode() { return get("transcode"); }
    static std::shared_ptr<spdlog::logger> shell()     { return get("shell"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline std::mutex mutex_;
    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;

    static inline size_t max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t max_files_ = 5;

    static void initLocked(const config::LoggingConfig& cnf);
};

}
