#pragma once

#include "cache/Format.hpp"
#include "cache/Key.hpp"
#include "types/Error.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace cc::preview::thumbnail {

// Validated request, passed by value through every pipeline stage.
struct Request {
    std::filesystem::path source;
    int width;
    std::optional<int> height; // only when explicitly requested
    std::string mime;
    cache::Format format;
    cache::Key key;
};

struct Result {
    std::optional<std::filesystem::path> path;
    std::optional<types::Error> error;
    std::string message;
    bool cacheHit = false;
    std::optional<std::string> transcodeError; // set when WebP output fell back to the native file

    [[nodiscard]] bool ok() const { return path.has_value(); }

    static Result hit(std::filesystem::path p) { return {std::move(p), std::nullopt, {}, true, std::nullopt}; }
    static Result generated(std::filesystem::path p) { return {std::move(p), std::nullopt, {}, false, std::nullopt}; }
    static Result failure(const types::Error err, std::string msg) { return {std::nullopt, err, std::move(msg), false, std::nullopt}; }
};

}
