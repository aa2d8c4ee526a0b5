#include "lazy/tcl/console.hpp"

#include <algorithm>
#include <sstream>

using lazy::tcl::Console;

// Edit distance used for "did you mean" suggestions
static size_t editDistance(const std::string& a, const std::string& b) {
    const size_t n = a.size(), m = b.size();
    std::vector<size_t> prev(m + 1), cur(m + 1);
    for (size_t j = 0; j <= m; ++j)
        prev[j] = j;
    for (size_t i = 1; i <= n; ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= m; ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] =
              std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[m];
}

static std::string renderCommandTable(const Console& c) {
    auto list = c.listCommands();
    size_t w = 0;
    for (auto& p : list)
        w = std::max(w, p.first.size());
    std::ostringstream oss;
    oss << "commands:";
    for (auto& p : list) {
        oss << "\n  " << p.first << std::string(w - p.first.size(), ' ')
            << " - " << p.second;
    }
    return oss.str();
}

static int cmd_help(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.empty()) {
        lazy::tcl::setResult(ip, renderCommandTable(c));
        return TCL_OK;
    }
    const std::string& what = a[0];
    std::string help;
    if (c.getCommandHelp(what, help)) {
        lazy::tcl::setResult(ip, what + " - " + help);
        return TCL_OK;
    }

    std::vector<std::pair<size_t, std::string>> near;
    for (auto& p : c.listCommands()) {
        size_t d = editDistance(what, p.first);
        if (d <= 3 || p.first.rfind(what, 0) == 0) near.emplace_back(d, p.first);
    }
    std::stable_sort(near.begin(), near.end(), [](auto& x, auto& y) {
        return x.first < y.first;
    });
    std::ostringstream oss;
    oss << "unknown command: " << what;
    if (near.empty()) {
        oss << " (no close matches)";
    } else {
        oss << "\ndid you mean:";
        for (size_t i = 0; i < near.size() && i < 5; ++i)
            oss << "\n  " << near[i].second;
    }
    lazy::tcl::setResult(ip, oss.str());
    return TCL_ERROR;
}

static std::vector<std::string> compl_help(Console& c,
                                           const Console::Args& toks) {
    // tokens: ["help", "<partial>"]
    if (toks.size() != 2) return {};
    std::vector<std::string> out;
    for (auto& p : c.listCommands())
        if (toks[1].empty() || p.first.rfind(toks[1], 0) == 0)
            out.push_back(p.first);
    return out;
}

static int cmd_commands(Console& c, Tcl_Interp* ip, const Console::Args&) {
    lazy::tcl::setResult(ip, renderCommandTable(c));
    return TCL_OK;
}

namespace lazy::tcl {
void register_cmd_help(Console& c) {
    c.registerCommand("help",
                      "Show all commands or one command: help [name]",
                      &cmd_help,
                      &compl_help);
    c.registerCommand(
      "commands", "List commands with one-line help", &cmd_commands);
}
} // namespace lazy::tcl
