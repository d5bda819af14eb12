#include "shell/argsHelpers.hpp"

#include <algorithm>
#include <charconv>

namespace cc::shell {

namespace {

std::string terminated(std::string msg) {
    if (!msg.empty() && msg.back() != '\n') msg.push_back('\n');
    return msg;
}

const FlagKV* findOpt(const CommandCall& c, const std::string& key) {
    const auto it = std::ranges::find(c.options, key, &FlagKV::key);
    return it == c.options.end() ? nullptr : &*it;
}

}

CommandResult ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult failure(std::string msg) { return {1, "", terminated(std::move(msg))}; }
CommandResult invalid(std::string msg) { return {2, "", terminated(std::move(msg))}; }

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    const auto* kv = findOpt(c, key);
    if (!kv) return std::nullopt;
    return kv->value.value_or(std::string{});
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    const auto* kv = findOpt(c, key);
    return kv && !kv->value;
}

std::optional<int> parseDimension(const std::string& s) {
    if (s.empty() || !std::ranges::all_of(s, [](const char c) { return c >= '0' && c <= '9'; }))
        return std::nullopt;

    int v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || v <= 0) return std::nullopt;
    return v;
}

}
