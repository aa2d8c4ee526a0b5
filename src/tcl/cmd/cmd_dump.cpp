#include <sstream>

#include "lazy/tcl/console.hpp"

using lazy::tcl::Console;
using lazy::tcl::Session;

static Session* requireSession(Console& c, Tcl_Interp* ip) {
    Session* s = c.session();
    if (!s) lazy::tcl::setResult(ip, "no design elaborated (try: elab <design>)");
    return s;
}

static int cmd_hierarchy(Console& c, Tcl_Interp* ip, const Console::Args&) {
    Session* s = requireSession(c, ip);
    if (!s) return TCL_ERROR;
    std::ostringstream oss;
    lazy::elab::dumpHierarchy(*s->mCtx, *s->mTop, oss);
    lazy::tcl::setResult(ip, oss.str());
    return TCL_OK;
}

static int cmd_boundary(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    Session* s = requireSession(c, ip);
    if (!s) return TCL_ERROR;
    const std::string path = a.empty() ? "" : a[0];
    auto* target = lazy::elab::findByPath(*s->mCtx, *s->mTop, path);
    if (!target) {
        lazy::tcl::setResult(ip, "no container at path '" + path + "'");
        return TCL_ERROR;
    }
    std::ostringstream oss;
    lazy::elab::dumpBoundary(*target, oss);
    lazy::tcl::setResult(ip, oss.str());
    return TCL_OK;
}

static std::vector<std::string> compl_boundary(Console& c,
                                               const Console::Args& toks) {
    if (toks.size() != 2) return {};
    return c.completePaths(toks[1]);
}

static int cmd_netlist(Console& c, Tcl_Interp* ip, const Console::Args&) {
    Session* s = requireSession(c, ip);
    if (!s) return TCL_ERROR;
    std::ostringstream oss;
    s->mCtx->netlist().dump(oss);
    lazy::tcl::setResult(ip, oss.str());
    return TCL_OK;
}

namespace lazy::tcl {
void register_cmd_dump(Console& c) {
    c.registerCommand("hierarchy",
                      "Print the container tree with nodes, boundaries and "
                      "links: hierarchy",
                      &cmd_hierarchy);
    c.registerCommand("boundary",
                      "Print the boundary ports of one container: "
                      "boundary [path]",
                      &cmd_boundary,
                      &compl_boundary);
    c.registerCommand("netlist",
                      "Print signals, connections and nets: netlist",
                      &cmd_netlist);
}
} // namespace lazy::tcl
