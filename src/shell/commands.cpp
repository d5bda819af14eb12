#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"
#include "preview/thumbnail/Pipeline.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

using namespace cc::preview::thumbnail;
using namespace cc::types;

namespace cc::shell {

namespace {

CommandResult make(const std::shared_ptr<Pipeline>& pipeline, const CommandCall& call) {
    if (call.positionals.size() < 2 || call.positionals.size() > 3)
        return invalid("usage: cropcache make <source> <width> [height]");

    const auto width = parseDimension(call.positionals[1]);
    if (!width) return invalid("Invalid width: " + call.positionals[1]);

    std::optional<int> height;
    if (call.positionals.size() == 3) {
        height = parseDimension(call.positionals[2]);
        if (!height) return invalid("Invalid height: " + call.positionals[2]);
    }

    try {
        const auto res = pipeline->make(call.positionals[0], *width, height);
        if (!res.ok()) return failure(res.message);

        std::string out = res.path->string() + "\n";
        if (res.transcodeError)
            return {0, out, fmt::format("WebP conversion failed, kept original: {}\n", *res.transcodeError)};
        return ok(out);
    } catch (const ThumbnailError& e) {
        log::Registry::shell()->error("[make] {} ({})", e.what(), to_string(e.kind()));
        return failure(e.what());
    }
}

CommandResult flush(const std::shared_ptr<Pipeline>& pipeline, const CommandCall& call) {
    if (call.positionals.size() > 1) return invalid("usage: cropcache flush [source]");

    const auto removed = call.positionals.empty()
        ? pipeline->flush()
        : pipeline->flush(std::filesystem::path(call.positionals[0]));

    return ok(fmt::format("Removed {} cached {}\n", removed, removed == 1 ? "entry" : "entries"));
}

CommandResult webp(const std::shared_ptr<Pipeline>& pipeline, const CommandCall& call) {
    if (call.positionals.size() != 1) return invalid("usage: cropcache webp <path> [--keep]");

    const std::filesystem::path path = call.positionals[0];
    const auto out = pipeline->toWebP(path, !hasFlag(call, "keep"));
    if (out == path) {
        const auto err = pipeline->lastTranscodeError();
        return failure(fmt::format("WebP conversion failed: {}", err.value_or("unknown error")));
    }
    return ok(out.string() + "\n");
}

}

void registerCommands(Router& router, const std::shared_ptr<Pipeline>& pipeline) {
    router.registerCommand("make", {
        "make <source> <width> [height]",
        "Print the cached thumbnail path, generating it on a miss",
        [pipeline](const CommandCall& call) { return make(pipeline, call); },
        {"thumb", "m"}
    });

    router.registerCommand("flush", {
        "flush [source]",
        "Remove every cached size of source, or the whole cache",
        [pipeline](const CommandCall& call) { return flush(pipeline, call); },
        {"clear"}
    });

    router.registerCommand("webp", {
        "webp <path> [--keep]",
        "Convert an image to WebP next to it",
        [pipeline](const CommandCall& call) { return webp(pipeline, call); },
        {"to-webp"}
    });
}

}
