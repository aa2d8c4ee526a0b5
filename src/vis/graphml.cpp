#include "lazy/vis/graphml.hpp"

#include <sstream>

namespace lazy::vis {

std::string xmlEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        switch (ch) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default: out.push_back(ch);
        }
    }
    return out;
}

static void nodesGraphML(const elab::ElabContext& ctx,
                         const elab::Container& c, std::ostream& os,
                         const std::string& pad) {
    const auto id = c.id();
    os << pad << "<node id=\"" << id << "\">\n";
    os << pad
       << "  <data key=\"n\"><y:ShapeNode><y:NodeLabel modelName=\"sides\" "
          "modelPosition=\"w\" rotationAngle=\"270.0\">"
       << xmlEscape(c.instanceName()) << "</y:NodeLabel></y:ShapeNode></data>\n";
    os << pad << "  <data key=\"d\">" << xmlEscape(c.moduleName()) << " ("
       << xmlEscape(c.pathName()) << ")</data>\n";
    os << pad << "  <graph id=\"" << id << "::\" edgedefault=\"directed\">\n";
    for (const auto& n : c.nodes()) {
        if (n->omitGraph()) continue;
        os << pad << "    <node id=\"" << id << "::" << n->index() << "\">\n";
        os << pad
           << "      <data key=\"e\"><y:ShapeNode><y:Shape "
              "type=\"Ellipse\"/></y:ShapeNode></data>\n";
        os << pad << "      <data key=\"d\">" << xmlEscape(n->describe())
           << ", \n" << xmlEscape(n->debugString()) << "</data>\n";
        os << pad << "    </node>\n";
    }
    for (auto cid : c.children()) {
        const auto& child = ctx.container(cid);
        if (!child.omitGraph()) nodesGraphML(ctx, child, os, pad + "    ");
    }
    os << pad << "  </graph>\n";
    os << pad << "</node>\n";
}

static void edgesGraphML(const elab::ElabContext& ctx,
                         const elab::Container& c, std::ostream& os,
                         const std::string& pad) {
    for (const auto& n : c.nodes()) {
        if (n->omitGraph()) continue;
        for (const auto& [o, edge] : n->outputs()) {
            if (o->omitGraph()) continue;
            std::string self =
              std::to_string(c.id()) + "::" + std::to_string(n->index());
            std::string other =
              std::to_string(o->owner()) + "::" + std::to_string(o->index());
            os << pad << "<edge";
            if (edge.mFlipped) {
                os << " target=\"" << self << "\" source=\"" << other << "\">";
            } else {
                os << " source=\"" << self << "\" target=\"" << other << "\">";
            }
            os << "<data key=\"e\"><y:PolyLineEdge>";
            if (edge.mFlipped) {
                os << "<y:Arrows source=\"standard\" target=\"none\"/>";
            } else {
                os << "<y:Arrows source=\"none\" target=\"standard\"/>";
            }
            os << "<y:LineStyle color=\"" << xmlEscape(edge.mColour)
               << "\" type=\"line\" width=\"1.0\"/>";
            os << "<y:EdgeLabel modelName=\"centered\" "
                  "rotationAngle=\"270.0\">"
               << xmlEscape(edge.mLabel) << "</y:EdgeLabel>";
            os << "</y:PolyLineEdge></data></edge>\n";
        }
    }
    for (auto cid : c.children()) {
        const auto& child = ctx.container(cid);
        if (!child.omitGraph()) edgesGraphML(ctx, child, os, pad);
    }
}

std::string buildGraphML(const elab::ElabContext& ctx,
                         const elab::Container& top) {
    std::ostringstream os;
    os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    os << "<graphml xmlns=\"http://graphml.graphdrawing.org/xmlns\" "
          "xmlns:y=\"http://www.yworks.com/xml/graphml\">\n";
    os << "  <key for=\"node\" id=\"n\" yfiles.type=\"nodegraphics\"/>\n";
    os << "  <key for=\"edge\" id=\"e\" yfiles.type=\"edgegraphics\"/>\n";
    os << "  <key for=\"node\" id=\"d\" attr.name=\"Description\" "
          "attr.type=\"string\"/>\n";
    os << "  <graph id=\"G\" edgedefault=\"directed\">\n";
    nodesGraphML(ctx, top, os, "    ");
    edgesGraphML(ctx, top, os, "    ");
    os << "  </graph>\n";
    os << "</graphml>\n";
    return os.str();
}

} // namespace lazy::vis
