#pragma once

#include <memory>

namespace cc::preview::thumbnail { class Pipeline; }

namespace cc::shell {

class Router;

// make, flush and webp, all bound to one pipeline.
void registerCommands(Router& router, const std::shared_ptr<preview::thumbnail::Pipeline>& pipeline);

}
