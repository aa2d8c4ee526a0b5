#include "lazy/tcl/console.hpp"
#include "lazy/vis/graphml.hpp"
#include "lazy/vis/json.hpp"

using lazy::tcl::Console;

static int cmd_export_json(Console& c, Tcl_Interp* ip,
                           const Console::Args& a) {
    if (a.size() != 1) {
        lazy::tcl::setResult(ip, "usage: export-json <file>");
        return TCL_ERROR;
    }
    auto* s = c.session();
    if (!s) {
        lazy::tcl::setResult(ip, "no design elaborated");
        return TCL_ERROR;
    }
    lazy::vis::writeJsonFile(a[0], lazy::vis::buildViewJson(*s->mCtx, *s->mTop));
    lazy::tcl::setResult(ip, "wrote " + a[0]);
    return TCL_OK;
}

static int cmd_export_graphml(Console& c, Tcl_Interp* ip,
                              const Console::Args& a) {
    if (a.size() != 1) {
        lazy::tcl::setResult(ip, "usage: export-graphml <file>");
        return TCL_ERROR;
    }
    auto* s = c.session();
    if (!s) {
        lazy::tcl::setResult(ip, "no design elaborated");
        return TCL_ERROR;
    }
    lazy::vis::writeTextFile(a[0], lazy::vis::buildGraphML(*s->mCtx, *s->mTop));
    lazy::tcl::setResult(ip, "wrote " + a[0]);
    return TCL_OK;
}

namespace lazy::tcl {
void register_cmd_export(Console& c) {
    c.registerCommand("export-json",
                      "Write the elaborated tree as JSON: export-json <file>",
                      &cmd_export_json);
    c.registerCommand("export-graphml",
                      "Write the elaborated tree as yEd GraphML: "
                      "export-graphml <file>",
                      &cmd_export_graphml);
}
} // namespace lazy::tcl
