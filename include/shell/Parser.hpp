#pragma once

#include "shell/types.hpp"

#include <string>
#include <vector>
#include <optional>

namespace cc::shell {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

inline bool isFlag(const std::string& s) {
    return s.size() > 1 && s[0] == '-' && !(s[1] >= '0' && s[1] <= '9');
}

/**
 * argv-style parsing: the first word is the command name, "--key=value" sets an
 * option, a bare "--key" sets a flag and "--" ends flag parsing. Negative numbers
 * are positionals.
 */
inline CommandCall parseArgs(const std::vector<std::string>& args) {
    CommandCall call;
    bool stop_flags = false;

    for (const auto& a : args) {
        if (!stop_flags && a == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && isFlag(a)) {
            auto key = a.substr(a.find_first_not_of('-'));
            if (const auto eq = key.find('='); eq != std::string::npos) setOpt(call, key.substr(0, eq), key.substr(eq + 1));
            else setOpt(call, key, std::nullopt);
            continue;
        }

        if (call.name.empty()) call.name = a;
        else call.positionals.push_back(a);
    }

    return call;
}

}
