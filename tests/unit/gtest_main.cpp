#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

using namespace cc;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        config::Config cfg;
        cfg.logging.levels.console_log_level = spdlog::level::warn;

        config::ConfigRegistry::init(cfg);
        log::Registry::init(cfg.logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize cropcache test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
