#include "lazy/tcl/console.hpp"

#include <sstream>

using lazy::tcl::Console;

static int cmd_elab(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.size() != 1) {
        lazy::tcl::setResult(ip, "usage: elab <design>");
        return TCL_ERROR;
    }
    c.elaborateDesign(a[0]);
    const auto& res = c.session()->mResult;
    std::ostringstream oss;
    oss << "elaborated " << res.mTop->name() << ": " << res.mContainers
        << " containers, " << res.mLinks << " internal links, "
        << res.mImp->mAuto.size() << " top ports";
    lazy::tcl::setResult(ip, oss.str());
    return TCL_OK;
}

static std::vector<std::string> compl_elab(Console& c,
                                           const Console::Args& toks) {
    if (toks.size() != 2) return {};
    return c.completeDesigns(toks[1]);
}

static int cmd_policy(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    auto& opts = c.options();
    if (a.empty()) {
        lazy::tcl::setResult(ip, lazy::elab::to_string(opts.mUnresolvedRoot));
        return TCL_OK;
    }
    lazy::elab::UnresolvedPolicy p;
    if (a.size() != 1 || !lazy::elab::parsePolicy(a[0], p)) {
        lazy::tcl::setResult(ip, "usage: policy [keep|warn|error]");
        return TCL_ERROR;
    }
    opts.mUnresolvedRoot = p;
    lazy::tcl::setResult(ip, std::string("unresolved root policy: ") +
                               lazy::elab::to_string(p));
    return TCL_OK;
}

static std::vector<std::string> compl_policy(Console&,
                                             const Console::Args& toks) {
    if (toks.size() != 2) return {};
    std::vector<std::string> out;
    for (const char* p : {"keep", "warn", "error"}) {
        std::string s(p);
        if (s.rfind(toks[1], 0) == 0) out.push_back(s);
    }
    return out;
}

static int cmd_verbose(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    auto& opts = c.options();
    if (!a.empty()) {
        if (a[0] == "on" || a[0] == "1") {
            opts.mVerbose = true;
        } else if (a[0] == "off" || a[0] == "0") {
            opts.mVerbose = false;
        } else {
            lazy::tcl::setResult(ip, "usage: verbose [on|off]");
            return TCL_ERROR;
        }
    }
    lazy::tcl::setResult(ip, opts.mVerbose ? "verbose on" : "verbose off");
    return TCL_OK;
}

namespace lazy::tcl {
void register_cmd_elab(Console& c) {
    c.registerCommand("elab",
                      "Declare and elaborate a design, replacing the current "
                      "one: elab <design>",
                      &cmd_elab,
                      &compl_elab);
    c.registerCommand("policy",
                      "Show or set what happens to unresolved root dangles: "
                      "policy [keep|warn|error]",
                      &cmd_policy,
                      &compl_policy);
    c.registerCommand("verbose",
                      "Log every container's boundary during elab: "
                      "verbose [on|off]",
                      &cmd_verbose);
}
} // namespace lazy::tcl
