#pragma once
// yEd-flavoured GraphML export: one nested graph per container, one ellipse
// per connection point, and edges from each point's rendered outputs.

#include <string>

#include "lazy/elab/container.hpp"
#include "lazy/elab/context.hpp"

namespace lazy::vis {

// `top` and everything below it must be instantiated.
std::string buildGraphML(const elab::ElabContext& ctx,
                         const elab::Container& top);

std::string xmlEscape(const std::string& s);

} // namespace lazy::vis
