#include "shell/Router.hpp"
#include "shell/Parser.hpp"
#include "shell/argsHelpers.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <cctype>

using namespace cc::shell;
using namespace cc;

void Router::registerCommand(const std::string& name, CommandInfo info) {
    const std::string key = normalize(name);
    if (info.description.empty()) info.description = "No description provided.";

    std::unordered_set<std::string> accepted;
    for (const std::string& alias : info.aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            log::Registry::shell()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                         a, aliasMap_.at(a), key);
            continue;
        }
        accepted.insert(a);
        aliasMap_[a] = key;
    }
    info.aliases = std::move(accepted);

    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

CommandResult Router::execute(const std::vector<std::string>& args) const {
    const auto call = parseArgs(args);

    if (call.name.empty() || call.name == "help") return ok(usage());

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return invalid(fmt::format("Unknown command or alias: {}\n\n{}", call.name, usage()));

    log::Registry::shell()->debug("[Router] Executing command: '{}'", canonical);
    return commands_.at(canonical).handler(call);
}

std::string Router::usage() const {
    std::vector<std::string> names;
    names.reserve(commands_.size());
    for (const auto& [name, _] : commands_) names.push_back(name);
    std::ranges::sort(names);

    std::string out = "usage: cropcache [--config FILE] <command> [args]\n\ncommands:\n";
    for (const auto& name : names) {
        const auto& info = commands_.at(name);
        out += fmt::format("  {:<36} {}\n", info.synopsis.empty() ? name : info.synopsis, info.description);
    }
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
