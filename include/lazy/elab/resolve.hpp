#pragma once
// Dangle resolution: pair ends that share a source key, forward the rest.

#include <string>
#include <vector>

#include "lazy/elab/dangle.hpp"

namespace lazy::elab {

// A matched pair, connected inside the resolving container.
struct InternalLink {
    HalfEdge mKey;
    Dangle mSink;   // flipped end, receives
    Dangle mSource; // non-flipped end, supplies
};

// Groups `all` by source key in ascending key order. Pairs are connected
// (sink <= source) and appended to `links` when given. Unpaired ends are
// returned in ascending key order. `where` names the resolving container in
// error messages.
std::vector<Dangle> resolveDangles(std::vector<Dangle> all,
                                   const std::string& where,
                                   std::vector<InternalLink>* links = nullptr);

} // namespace lazy::elab
