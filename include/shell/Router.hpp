#pragma once

#include "shell/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace cc::shell {

class Router {
public:
    void registerCommand(const std::string& name, CommandInfo info);

    CommandResult execute(const std::vector<std::string>& args) const;

    [[nodiscard]] std::string usage() const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical

    std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

} // namespace cc::shell
