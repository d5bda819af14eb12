#pragma once

#include "shell/types.hpp"

#include <optional>
#include <string>

namespace cc::shell {

// Exit codes: 0 success, 1 the operation failed, 2 bad invocation.
CommandResult ok(std::string out);
CommandResult failure(std::string msg);
CommandResult invalid(std::string msg);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
bool hasFlag(const CommandCall& c, const std::string& key);

// Strictly positive pixel count, digits only.
std::optional<int> parseDimension(const std::string& s);

}
