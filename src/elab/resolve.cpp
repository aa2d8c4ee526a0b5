#include "lazy/elab/resolve.hpp"

#include <map>

#include "lazy/errors.hpp"

namespace lazy::elab {

static std::string describeDangle(const Dangle& d) {
    return "'" + d.mName + "' source=" + d.mSource.toString() +
           " sink=" + d.mSink.toString() +
           (d.mFlipped ? " flipped" : " unflipped");
}

std::vector<Dangle> resolveDangles(std::vector<Dangle> all,
                                   const std::string& where,
                                   std::vector<InternalLink>* links) {
    std::map<HalfEdge, std::vector<Dangle>> pairing;
    for (auto& d : all) {
        pairing[d.mSource].push_back(std::move(d));
    }

    std::vector<Dangle> forward;
    for (auto& [key, group] : pairing) {
        if (group.size() == 1) {
            forward.push_back(std::move(group.front()));
            continue;
        }
        if (group.size() > 2) {
            std::string msg = "in " + where + ": " +
                              std::to_string(group.size()) +
                              " dangles share source key " + key.toString();
            for (const auto& d : group)
                msg += "\n  " + describeDangle(d);
            throw PairingInvariantError(msg);
        }
        const Dangle& a = group[0];
        const Dangle& b = group[1];
        if (a.mFlipped == b.mFlipped) {
            throw ConnectionDirectionError(
              "in " + where + ": paired dangles have the same direction: " +
              describeDangle(a) + " and " + describeDangle(b));
        }
        const Dangle& sink = a.mFlipped ? a : b;
        const Dangle& source = a.mFlipped ? b : a;
        connect(sink.mData, source.mData);
        if (links) links->push_back(InternalLink{key, sink, source});
    }
    return forward;
}

} // namespace lazy::elab
