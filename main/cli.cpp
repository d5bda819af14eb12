#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "preview/thumbnail/Pipeline.hpp"
#include "shell/Router.hpp"
#include "shell/commands.hpp"

#include <fmt/core.h>

#include <optional>
#include <string>
#include <vector>

using namespace cc;
using namespace cc::config;

namespace {

struct Invocation {
    std::optional<std::string> configPath; // explicit --config
    std::vector<std::string> args;
    std::optional<std::string> error;
};

// Pulls "--config FILE" / "--config=FILE" out of argv; everything else goes to the router.
Invocation splitArgs(const int argc, char** argv) {
    Invocation inv;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (a == "--config") {
            if (i + 1 >= argc) {
                inv.error = "--config requires a file argument";
                return inv;
            }
            inv.configPath = argv[++i];
            continue;
        }

        if (a.starts_with("--config=")) {
            inv.configPath = a.substr(9);
            continue;
        }

        inv.args.push_back(a);
    }
    return inv;
}

}

int main(const int argc, char** argv) {
    const auto inv = splitArgs(argc, argv);
    if (inv.error) {
        fmt::print(stderr, "{}\n", *inv.error);
        return 2;
    }

    try {
        ConfigRegistry::init(inv.configPath.value_or(DEFAULT_CONFIG_PATH), inv.configPath.has_value());
        log::Registry::init(ConfigRegistry::get().logging);

        if (const auto& src = ConfigRegistry::source())
            log::Registry::cropcache()->debug("[cli] Loaded configuration from {}", src->string());
        else
            log::Registry::cropcache()->debug("[cli] No config at {}, using defaults", DEFAULT_CONFIG_PATH);

        const auto pipeline = std::make_shared<preview::thumbnail::Pipeline>(
            preview::thumbnail::PipelineOptions::fromConfig(ConfigRegistry::get().caching));

        shell::Router router;
        shell::registerCommands(router, pipeline);

        const auto res = router.execute(inv.args);
        if (!res.stdout_text.empty()) fmt::print("{}", res.stdout_text);
        if (!res.stderr_text.empty()) fmt::print(stderr, "{}", res.stderr_text);
        return res.exit_code;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::cropcache()->error("[cli] {}", e.what());
        fmt::print(stderr, "cropcache: {}\n", e.what());
        return 1;
    }
}
