#include "lazy/vis/json.hpp"

namespace lazy {
namespace vis {

using nlohmann::json;

static std::string nodeKey(const elab::ConnectionPoint& n) {
    return std::to_string(n.owner()) + "::" + std::to_string(n.index());
}

static json portJson(const elab::BundlePort& p) {
    return {{"name", p.mName.str()},
            {"dir", std::string(to_string(p.direction()))},
            {"width", p.mSignal.width()},
            {"signal", p.mSignal.id()}};
}

static json containerJson(const elab::Container& c) {
    json jc = {{"id", c.id()},
               {"name", c.name()},
               {"class", c.className()},
               {"module", c.moduleName()},
               {"path", c.pathName()},
               {"children", json::array()},
               {"nodes", json::array()},
               {"ports", json::array()}};
    jc["parent"] = c.parent() ? json(*c.parent()) : json(nullptr);
    if (c.info().known()) jc["line"] = c.line();
    for (auto cid : c.children())
        jc["children"].push_back(cid);
    for (const auto& n : c.nodes()) {
        if (n->omitGraph()) continue;
        jc["nodes"].push_back({{"id", nodeKey(*n)},
                               {"serial", n->serial()},
                               {"description", n->describe()},
                               {"debug", n->debugString()}});
    }
    for (const auto& p : c.boundary())
        jc["ports"].push_back(portJson(p));
    return jc;
}

static void buildEdges(const elab::ElabContext& ctx, const elab::Container& c,
                       json& outEdges) {
    const auto& nl = ctx.netlist();
    int count = 0;
    for (const auto& l : c.module().mLinks) {
        const auto src = l.mSource.mData;
        const auto dst = l.mSink.mData;
        std::string eid = "e_" + std::to_string(c.id()) + "_" +
                          std::to_string(count++);
        outEdges.push_back({{"id", eid},
                            {"container", c.id()},
                            {"key", l.mKey.toString()},
                            {"from", nl.renderSignal(src.id())},
                            {"to", nl.renderSignal(dst.id())},
                            {"width", src.width()},
                            {"label", l.mSource.mName + " -> " + l.mSink.mName}});
    }
}

nlohmann::json buildViewJson(const elab::ElabContext& ctx,
                             const elab::Container& top) {
    json view;
    view["key"] = top.name();
    view["title"] = top.moduleName();
    view["description"] = "Container tree exported after elaboration "
                          "(containers, nodes, boundary ports, links).";
    view["containers"] = json::array();
    view["edges"] = json::array();

    top.forEach([&](const elab::Container& c) {
        view["containers"].push_back(containerJson(c));
        buildEdges(ctx, c, view["edges"]);
    });
    return view;
}

} // namespace vis
} // namespace lazy
