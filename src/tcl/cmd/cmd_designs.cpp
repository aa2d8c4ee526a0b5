#include "lazy/tcl/console.hpp"

#include <sstream>

using lazy::tcl::Console;

static int cmd_designs(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    const std::string pref = a.empty() ? "" : a[0];
    std::ostringstream oss;
    bool first = true;
    for (auto& name : c.completeDesigns(pref)) {
        if (!first) oss << "\n";
        oss << name;
        if (c.session() && c.session()->mDesign == name) oss << " (current)";
        first = false;
    }
    lazy::tcl::setResult(ip, oss.str());
    return TCL_OK;
}

static std::vector<std::string> compl_designs(Console& c,
                                              const Console::Args& toks) {
    std::string pref = (toks.size() >= 2) ? toks.back() : "";
    return c.completeDesigns(pref);
}

namespace lazy::tcl {
void register_cmd_designs(Console& c) {
    c.registerCommand("designs",
                      "List designs available to elab: designs [prefix]",
                      &cmd_designs,
                      &compl_designs);
    c.registerCommand(
      "list-designs", "Alias: designs", &cmd_designs, &compl_designs);
}
} // namespace lazy::tcl
